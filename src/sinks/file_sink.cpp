#include "file_sink.hpp"
#include "helpers.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

FileSink::FileSink(SinkConfig config)
    : cfg(std::move(config)), rng(std::random_device{}()) {}

std::string FileSink::randomSuffix() {
    std::uniform_int_distribution<uint32_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return oss.str();
}

fs::path FileSink::uniquePath(const std::string& extension) {
    std::string stamp = compact_timestamp(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    std::error_code ec;
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = cfg.destination / (cfg.prefix + "_" + stamp + "_" + randomSuffix() + "." + extension);
        fs::path part = candidate;
        part += ".part";
        if (!fs::exists(candidate, ec) && !fs::exists(part, ec))
            return candidate;
    }
    return {};
}

SinkOutcome FileSink::store(Artifact&& artifact, ScanObserver& observer) {
    SinkOutcome outcome;
    Artifact owned = std::move(artifact);
    outcome.size = owned.bytes.size();

    std::error_code ec;
    fs::create_directories(cfg.destination, ec);
    if (ec) {
        outcome.error = "Cannot create " + cfg.destination.string() + ": " + ec.message();
        return outcome;
    }

    fs::path target = uniquePath(owned.extension);
    if (target.empty()) {
        outcome.error = "Cannot allocate a unique name in " + cfg.destination.string();
        return outcome;
    }
    fs::path part = target;
    part += ".part";

    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out) {
            outcome.error = "Cannot open " + part.string() + " for writing";
            return outcome;
        }
        out.write(reinterpret_cast<const char*>(owned.bytes.data()),
                  static_cast<std::streamsize>(owned.bytes.size()));
        out.close();
        if (!out) {
            fs::remove(part, ec);
            outcome.error = "Short write to " + part.string();
            return outcome;
        }
    }

    fs::rename(part, target, ec);
    if (ec) {
        outcome.error = "Cannot rename " + part.string() + ": " + ec.message();
        fs::remove(part, ec);
        return outcome;
    }

    outcome.stored = true;
    outcome.path = target;

    RecoveredArtifact recovered;
    recovered.fileName = target.filename().string();
    recovered.path = target;
    recovered.format = owned.format;
    recovered.size = outcome.size;
    recovered.streamOffset = owned.streamOffset;
    recovered.startBlock = owned.startBlock;

    observer.onLog("Saved file: " + recovered.fileName + " (" + std::to_string(recovered.size) + " bytes)");
    observer.onArtifact(recovered);
    return outcome;
}
