#include "printer.hpp"
#include "helpers.hpp"
#include "cJSON.h"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static cJSON* build_json_result(const RecoveredArtifact& a) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "file", a.fileName.c_str());
    cJSON_AddStringToObject(item, "format", a.format.c_str());
    cJSON_AddNumberToObject(item, "size", static_cast<double>(a.size));
    cJSON_AddStringToObject(item, "offset", ("0x" + to_hex(a.streamOffset)).c_str());
    cJSON_AddNumberToObject(item, "block", static_cast<double>(a.startBlock));
    return item;
}

bool dumpJson(const std::vector<RecoveredArtifact>& artifacts, const std::string& filename) {
    fs::path outputPath = fs::path(filename);
    std::ofstream outFile(outputPath, std::ios::binary);
    if (!outFile.is_open())
        return false;

    cJSON* root = cJSON_CreateArray();
    for (const auto& a : artifacts) {
        cJSON_AddItemToArray(root, build_json_result(a));
    }

    char* jsonStr = cJSON_Print(root);
    bool ok = jsonStr != nullptr;
    if (ok) {
        outFile.write(jsonStr, static_cast<std::streamsize>(strlen(jsonStr)));
        ok = static_cast<bool>(outFile);
    }
    outFile.close();
    cJSON_Delete(root);
    free(jsonStr);
    return ok;
}

// ANSI color codes
namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string bold    = "\033[1m";
    const std::string cyan    = "\033[36m";
    const std::string yellow  = "\033[33m";
    const std::string green   = "\033[32m";
    const std::string magenta = "\033[35m";
    const std::string gray    = "\033[90m";
}

static void printArtifact(const RecoveredArtifact& a, bool last) {
    // Offset in cyan, format in bold yellow, size in green
    std::ostringstream oss;
    oss << ansi::cyan << "[0x" << std::hex << std::setw(8) << std::setfill('0') << a.streamOffset << "]" << ansi::reset
        << " " << ansi::bold << ansi::yellow << a.format << ansi::reset
        << " (size=" << ansi::green << std::dec << a.size << ansi::reset << ")";

    std::cout << (last ? "└── " : "├── ") << oss.str() << "\n";
    std::cout << (last ? "    " : "│   ") << ansi::magenta << "File: " << a.fileName << ansi::reset << "\n";
}

void printRecovered(const std::vector<RecoveredArtifact>& artifacts, const std::string& inputFile) {
    std::cout << "* " << inputFile << std::endl;
    for (size_t i = 0; i < artifacts.size(); ++i) {
        printArtifact(artifacts[i], i == artifacts.size() - 1);
    }
}

void printSummary(const ScanResult& result, const std::string& assessment) {
    std::cout << std::string(60, '=') << "\n";
    switch (result.status) {
        case ScanStatus::Completed:  std::cout << ansi::green << "Scan completed" << ansi::reset << "\n"; break;
        case ScanStatus::Cancelled:  std::cout << ansi::yellow << "Scan cancelled" << ansi::reset << "\n"; break;
        case ScanStatus::ReadFailed: std::cout << ansi::yellow << "Scan stopped on a read error" << ansi::reset << "\n"; break;
    }
    std::cout << "Blocks scanned:            " << result.blocksRead << "\n"
              << "Bytes read:                " << result.bytesRead << "\n"
              << "Files recovered and saved: " << result.artifactsFound << "\n"
              << "Candidates rejected:       " << result.artifactsRejected << "\n";
    if (result.sinkFailures > 0)
        std::cout << "Files that failed to save: " << result.sinkFailures << "\n";
    std::cout << "Device state: " << ansi::gray << assessment << ansi::reset << "\n";
}
