#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

enum class ScanStatus {
    Completed,
    Cancelled,
    ReadFailed
};

struct ScanResult {
    uint64_t artifactsFound = 0;
    uint64_t blocksRead = 0;
    uint64_t bytesRead = 0;
    uint64_t artifactsRejected = 0;  // dropped by validation
    uint64_t sinkFailures = 0;       // valid, but could not be written
    ScanStatus status = ScanStatus::Completed;
};

struct RecoveredArtifact {
    std::string fileName;
    std::filesystem::path path;
    std::string format;
    uint64_t size = 0;
    uint64_t streamOffset = 0;  // offset of the first byte in the scanned stream
    uint64_t startBlock = 0;
};
