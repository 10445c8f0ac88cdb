#pragma once
#include <cstdint>
#include <string>

// Rough population estimate from recovered files per MiB scanned
std::string analyzeDataDistribution(uint64_t found, uint64_t blocks, uint64_t blockSize);
