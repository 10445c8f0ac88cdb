#pragma once
#include "observer.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// A validated, complete artifact. The sink takes ownership of the bytes.
struct Artifact {
    std::string format;
    std::string extension;
    std::vector<std::uint8_t> bytes;
    uint64_t streamOffset = 0;
    uint64_t startBlock = 0;
};

struct SinkOutcome {
    bool stored = false;
    fs::path path;
    uint64_t size = 0;
    std::string error;
};

struct SinkConfig {
    fs::path destination = "rescued_files";
    std::string prefix = "rescued";
};

class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;
    virtual std::string name() const = 0;
    // Reports stored artifacts to the observer; failures come back in the outcome.
    virtual SinkOutcome store(Artifact&& artifact, ScanObserver& observer) = 0;
};
