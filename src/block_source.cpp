#include "block_source.hpp"
#include "logger.hpp"
#include <stdexcept>

BlockSource::BlockSource(ByteStream& stream, size_t blockSize, unsigned maxEmptyReads)
    : stream(stream), name(stream.name()), size(blockSize), maxEmptyReads(maxEmptyReads) {
    if (size == 0)
        throw std::invalid_argument("block size must be positive");
}

BlockOutcome BlockSource::next(const std::atomic<bool>& cancel) {
    BlockOutcome outcome;
    if (finished) {
        outcome.status = BlockStatus::Exhausted;
        return outcome;
    }
    if (cancel.load()) {
        outcome.status = BlockStatus::Cancelled;
        return outcome;
    }

    std::vector<uint8_t>& data = outcome.block.data;
    data.resize(size);
    size_t filled = 0;

    // Keep filling short reads until the block is full, the stream ends, or a
    // read comes back empty.
    while (filled < size) {
        size_t count = 0;
        ReadStatus status = stream.read(data.data() + filled, size - filled, count);
        filled += count;
        if (status == ReadStatus::Failed) {
            finished = true;
            outcome.status = BlockStatus::Error;
            outcome.message = stream.lastError();
            outcome.block.data.clear();
            return outcome;
        }
        if (status == ReadStatus::EndOfStream) {
            finished = true;
            break;
        }
        if (count == 0)
            break;
    }

    if (cancel.load()) {
        outcome.status = BlockStatus::Cancelled;
        outcome.block.data.clear();
        return outcome;
    }

    if (filled == 0) {
        outcome.block.data.clear();
        if (finished) {
            outcome.status = BlockStatus::Exhausted;
            return outcome;
        }
        if (++emptyReads >= maxEmptyReads) {
            Logger::debug(name + ": " + std::to_string(emptyReads) + " empty reads in a row, giving up");
            finished = true;
            outcome.status = BlockStatus::Exhausted;
            return outcome;
        }
        outcome.status = BlockStatus::Empty;
        return outcome;
    }

    emptyReads = 0;
    data.resize(filled);
    outcome.status = BlockStatus::Data;
    outcome.block.index = nextIndex++;
    return outcome;
}
