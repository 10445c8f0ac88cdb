#include "candidate.hpp"
#include <algorithm>

void CarryWindow::retain(const std::vector<uint8_t>& data, size_t from) {
    from = std::min(from, data.size());
    size_t keep = std::min(cap, data.size() - from);
    bytes.assign(data.end() - static_cast<std::ptrdiff_t>(keep), data.end());
}

std::vector<uint8_t> CarryWindow::merge(const std::vector<uint8_t>& block) const {
    std::vector<uint8_t> window;
    window.reserve(bytes.size() + block.size());
    window.insert(window.end(), bytes.begin(), bytes.end());
    window.insert(window.end(), block.begin(), block.end());
    return window;
}

void CandidateTracker::start(const BaseSignature& signature, uint64_t startBlock, uint64_t streamOffset,
                             uint64_t limit) {
    current = Candidate{};
    this->limit = limit;
    current.signature = &signature;
    current.startBlock = startBlock;
    current.streamOffset = streamOffset;
}

size_t CandidateTracker::rewind(size_t overlap) {
    size_t dropped = std::min(overlap, current.bytes.size());
    current.bytes.resize(current.bytes.size() - dropped);
    return dropped;
}

void CandidateTracker::append(const std::vector<uint8_t>& window, size_t from, size_t to) {
    to = std::min(to, window.size());
    if (from >= to)
        return;

    // Geometric growth, but never reserved past the limit
    uint64_t needed = current.bytes.size() + (to - from);
    uint64_t capacity = current.bytes.capacity();
    if (needed > capacity) {
        uint64_t grown = std::max(needed, 2 * capacity);
        current.bytes.reserve(static_cast<size_t>(std::min(grown, std::max(limit, needed))));
    }

    current.bytes.insert(current.bytes.end(),
                         window.begin() + static_cast<std::ptrdiff_t>(from),
                         window.begin() + static_cast<std::ptrdiff_t>(to));
}

Candidate CandidateTracker::take() {
    Candidate taken = std::move(current);
    current = Candidate{};
    limit = 0;
    return taken;
}

void CandidateTracker::discard() {
    current = Candidate{};
    limit = 0;
}
