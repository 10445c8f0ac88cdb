#pragma once
#include "base_signature.hpp"
#include <cstdint>
#include <vector>

// Trailing bytes of the previous window, kept so a signature that straddles a
// block boundary is still seen whole in the next window.
class CarryWindow {
public:
    explicit CarryWindow(size_t capacity = 0) : cap(capacity) {}

    void reset(size_t capacity) {
        cap = capacity;
        bytes.clear();
    }

    // Keeps the last `capacity` bytes of data[from..]
    void retain(const std::vector<uint8_t>& data, size_t from);
    void clear() { bytes.clear(); }

    // carry ++ block
    std::vector<uint8_t> merge(const std::vector<uint8_t>& block) const;

    size_t size() const { return bytes.size(); }

private:
    size_t cap;
    std::vector<uint8_t> bytes;
};

struct Candidate {
    const BaseSignature* signature = nullptr;
    std::vector<uint8_t> bytes;
    uint64_t startBlock = 0;
    uint64_t streamOffset = 0;
};

// The single in-flight artifact of a pass. Bytes only ever grow by appends,
// apart from rewind(), which drops the carry overlap before the next window
// is absorbed.
class CandidateTracker {
public:
    bool live() const { return current.signature != nullptr; }
    const Candidate& candidate() const { return current; }
    size_t size() const { return current.bytes.size(); }

    // `limit` is the most bytes the candidate may hold; buffer growth stops there
    void start(const BaseSignature& signature, uint64_t startBlock, uint64_t streamOffset, uint64_t limit);

    // Drops the last `overlap` bytes, which are about to be seen again at the
    // front of the next window. Returns the number actually dropped.
    size_t rewind(size_t overlap);

    void append(const std::vector<uint8_t>& window, size_t from, size_t to);

    // Hands the candidate over and returns to idle
    Candidate take();
    void discard();

private:
    Candidate current;
    uint64_t limit = 0;
};
