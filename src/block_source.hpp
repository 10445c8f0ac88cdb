#pragma once
#include "byte_stream.hpp"
#include "helpers.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

constexpr size_t DEFAULT_BLOCK_SIZE = 32 * MIB;
constexpr unsigned DEFAULT_MAX_EMPTY_READS = 100;

struct Block {
    uint64_t index = 0;
    std::vector<uint8_t> data;
};

enum class BlockStatus {
    Data,
    Empty,
    Exhausted,
    Error,
    Cancelled
};

struct BlockOutcome {
    BlockStatus status = BlockStatus::Exhausted;
    Block block;
    std::string message;
};

// Cuts a ByteStream into fixed-size blocks. Zero-byte reads that are not a
// confirmed end of stream come back as Empty until maxEmptyReads in a row,
// after which the source reports Exhausted.
class BlockSource {
public:
    BlockSource(ByteStream& stream,
                size_t blockSize = DEFAULT_BLOCK_SIZE,
                unsigned maxEmptyReads = DEFAULT_MAX_EMPTY_READS);

    BlockOutcome next(const std::atomic<bool>& cancel);

    uint64_t blocksProduced() const { return nextIndex; }
    const std::string& streamName() const { return name; }

private:
    ByteStream& stream;
    std::string name;
    size_t size;
    unsigned maxEmptyReads;
    unsigned emptyReads = 0;
    uint64_t nextIndex = 0;
    bool finished = false;
};
