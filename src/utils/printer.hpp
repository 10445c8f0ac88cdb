#pragma once
#include "scanresult.hpp"
#include <string>
#include <vector>

bool dumpJson(const std::vector<RecoveredArtifact>& artifacts, const std::string& filename);
void printRecovered(const std::vector<RecoveredArtifact>& artifacts, const std::string& inputFile);
void printSummary(const ScanResult& result, const std::string& assessment);
