#include "distribution.hpp"
#include "helpers.hpp"

std::string analyzeDataDistribution(uint64_t found, uint64_t blocks, uint64_t blockSize) {
    if (blocks == 0)
        return "Device empty or not accessible.";
    if (found == 0)
        return "Empty or freshly formatted.";

    double scannedMiB = static_cast<double>(blocks) * static_cast<double>(blockSize) / static_cast<double>(MIB);
    double filesPerMiB = static_cast<double>(found) / scannedMiB;

    if (filesPerMiB < 0.1)
        return "Partially populated.";
    if (filesPerMiB < 1.0)
        return "Well populated.";
    return "Heavily populated.";
}
