#include "scanner.hpp"
#include "byte_stream.hpp"
#include "device.hpp"
#include "distribution.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "printer.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

struct Config {
    bool videos = false;
    bool jsonOutput = false;
    std::string jsonFile;
    std::string outputPath;
    size_t blockSize = DEFAULT_BLOCK_SIZE;
    std::string inputFile;
};


class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical) {
        optionDefs[name] = {takesValue, canonical};
    }

    void parse(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            // Is this a known option?
            if (optionDefs.count(arg)) {
                const auto& info = optionDefs[arg];

                if (info.takesValue) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Missing value for option: " + arg);
                    }
                    parsedOptions[info.canonicalName] = argv[++i];
                } else {
                    parsedOptions[info.canonicalName] = "true";
                }
            }
            else if (arg.size() > 1 && arg[0] == '-') {
                throw std::runtime_error("Unknown option: " + arg);
            }
            else {
                // Not an option → positional argument
                positional.push_back(arg);
            }
        }
    }

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical);
    }

    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : def;
    }
};

static void printUsage() {
    std::cout << "Usage: rescuer [-V] [-C dir] [-O file] [-b MiB] [-d] <device_or_image>\n"
              << "  -V         Recover videos (MP4/MOV, MKV, AVI, FLV) instead of images\n"
              << "  -C [path]  Output directory (default rescued_files / rescued_videos)\n"
              << "  -O [file]  Write a JSON report of recovered files\n"
              << "  -b [MiB]   Block size in MiB (default 32)\n"
              << "  -d         Enable Debug mode\n"
              << "  -h         Show this help message\n"
              << "\nExamples:\n"
              << "  sudo rescuer /dev/sdb1\n"
              << "  rescuer -V -C ./videos disk.img\n";
}

Config parseArgs(int argc, char* argv[]) {

    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-V", false, "videos");
    args.addOption("--videos", false, "videos");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-C", true, "outputPath");
    args.addOption("--output", true, "outputPath");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.addOption("-b", true, "blockSize");
    args.addOption("--blockSize", true, "blockSize");

    args.parse(argc,argv);

    if(args.has("help") || args.positional.empty())
    {
        printUsage();
        std::exit(args.has("help") ? 0 : 1);
    }

    if(args.has("debug"))
    {
        Logger::setLevel(LogLevel::DEBUG);
        Logger::debug("Enabling Debug Mode");
    }

    if(args.has("videos"))
    {
        config.videos = true;
        Logger::debug("Recovering videos");
    }

    config.outputPath = args.get("outputPath", config.videos ? "rescued_videos" : "rescued_files");

    if(args.has("jsonPath"))
    {
        config.jsonFile = args.get("jsonPath");
        config.jsonOutput = true;
        Logger::debug("Setting json output path to "+ config.jsonFile);
    }

    if(args.has("blockSize"))
    {
        int mib = std::stoi(args.get("blockSize"));
        if (mib < 1 || mib > 1024)
            throw std::runtime_error("Block size must be between 1 and 1024 MiB");
        config.blockSize = static_cast<size_t>(mib) * MIB;
        Logger::debug("Setting block size to " + std::to_string(mib) + " MiB");
    }

    config.inputFile = args.positional.back();

    return config;
}

// Narrates to the console and collects what was saved for the report
class ConsoleObserver : public ScanObserver {
public:
    std::vector<RecoveredArtifact> recovered;

    void onProgress(uint64_t found, uint64_t blocksScanned) override {
        std::cerr << "\rScanning block " << blocksScanned << "... (" << found << " found)" << std::flush;
    }

    void onLog(const std::string& message) override {
        std::cerr << "\r";
        Logger::info(message);
    }

    void onArtifact(const RecoveredArtifact& artifact) override {
        recovered.push_back(artifact);
    }
};

static std::atomic<bool> cancelRequested{false};

static void onInterrupt(int) {
    cancelRequested.store(true);
}

static std::string remediation(const StreamOpenError& e) {
    switch (e.reason()) {
        case StreamOpenError::Reason::PermissionDenied:
            return "To recover deleted files you need to:\n"
                   "  1. Run with sudo\n"
                   "  2. Use the raw device path (e.g. /dev/sdb1)\n"
                   "  Example: sudo rescuer /dev/sdb1";
        case StreamOpenError::Reason::NotFound:
            return "Use the raw device path:\n"
                   "  - /dev/sdb1 (partition)\n"
                   "  - /dev/sdb (whole disk)";
        case StreamOpenError::Reason::Other:
            break;
    }
    return "";
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);
    Logger::info("Rescuer v0.1");

    Config config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        printUsage();
        return 1;
    }

    std::string rawPath = resolveRawDevicePath(config.inputFile);
    if (rawPath != config.inputFile)
        Logger::info("Converting path to raw device: " + config.inputFile + " -> " + rawPath);

    if (auto size = deviceSize(rawPath))
        Logger::info("Device size: " + human_size(*size) + " (" + std::to_string(*size) + " bytes)");
    else
        Logger::warn("Could not determine the size of " + rawPath);

    std::unique_ptr<FileByteStream> stream;
    try {
        stream = FileByteStream::open(rawPath);
    } catch (const StreamOpenError& e) {
        Logger::error(e.what());
        std::string help = remediation(e);
        if (!help.empty())
            std::cerr << help << "\n";
        return 1;
    }

    std::signal(SIGINT, onInterrupt);

    ScanConfig scanConfig;
    scanConfig.kind = config.videos ? MediaKind::Video : MediaKind::Image;
    scanConfig.blockSize = config.blockSize;

    SinkConfig sinkConfig;
    sinkConfig.destination = fs::path(config.outputPath);

    Scanner scanner(scanConfig);
    ConsoleObserver observer;

    auto start = std::chrono::high_resolution_clock::now();
    ScanResult result = scanner.scan(*stream, sinkConfig, observer, cancelRequested);
    std::cerr << "\n";

    printRecovered(observer.recovered, config.inputFile);
    printSummary(result, analyzeDataDistribution(result.artifactsFound, result.blocksRead, config.blockSize));

    if (config.jsonOutput && !dumpJson(observer.recovered, config.jsonFile))
        Logger::error("Cannot write JSON report to " + config.jsonFile);

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    Logger::info("Total elapsed time: " + std::to_string(elapsed) + "ms");

    if (result.status == ScanStatus::Cancelled)
        Logger::warn("Scan interrupted, the output holds only what was recovered so far");
    else if (result.status == ScanStatus::ReadFailed)
        Logger::warn("Scan stopped on a read error after " + std::to_string(result.blocksRead) + " blocks");

    if (result.artifactsFound == 0)
        Logger::info("No valid files were found.");
    else
        Logger::info(std::to_string(result.artifactsFound) + " file(s) recovered.");

    return result.status == ScanStatus::ReadFailed ? 2 : 0;
}
