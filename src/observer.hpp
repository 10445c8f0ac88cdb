#pragma once
#include "scanresult.hpp"
#include <cstdint>
#include <string>

class ScanObserver {
public:
    virtual ~ScanObserver() = default;
    virtual void onProgress(uint64_t found, uint64_t blocksScanned) {}
    virtual void onLog(const std::string& message) {}
    virtual void onArtifact(const RecoveredArtifact& artifact) {}
};

// Headless default: the engine never assumes a console exists.
class NullObserver : public ScanObserver {};
