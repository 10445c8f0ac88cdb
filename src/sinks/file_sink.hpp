#pragma once
#include "base_sink.hpp"
#include <random>

// Writes each artifact to <destination>/<prefix>_<YYYYmmdd_HHMMSS>_<8 hex>.<ext>.
// Data goes to a ".part" file first and is renamed into place, so a reader
// never sees a partially written artifact.
class FileSink : public ArtifactSink {
public:
    explicit FileSink(SinkConfig config);

    std::string name() const override { return "FILE"; }
    SinkOutcome store(Artifact&& artifact, ScanObserver& observer) override;

private:
    fs::path uniquePath(const std::string& extension);
    std::string randomSuffix();

    SinkConfig cfg;
    std::mt19937_64 rng;
};
