#pragma once
#include "base_signature.hpp"
#include "base_sink.hpp"
#include "block_source.hpp"
#include "candidate.hpp"
#include "observer.hpp"
#include "scanresult.hpp"
#include "validator.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <vector>

struct ScanConfig {
    MediaKind kind = MediaKind::Image;
    size_t blockSize = DEFAULT_BLOCK_SIZE;
    unsigned maxEmptyReads = DEFAULT_MAX_EMPTY_READS;
    // Lowers every format's candidate cap when non-zero
    uint64_t maxCandidateBytes = 0;
};

// State of one scan; lives from scan start to scan end.
struct ScanSession {
    ScanResult counters;
    ArtifactSink* sink = nullptr;
    ScanObserver* observer = nullptr;
};

// Streaming carver. Reads one block at a time, searches carry + block for
// headers of the enabled formats and tracks at most one candidate artifact
// until its terminator, its size cap, or the end of the stream.
class Scanner {
public:
    explicit Scanner(ScanConfig config = ScanConfig{});
    Scanner(ScanConfig config, std::shared_ptr<DeepValidator> deep);

    ScanResult scan(ByteStream& stream,
                    const SinkConfig& sinkConfig,
                    ScanObserver& observer,
                    const std::atomic<bool>& cancel);

    ScanResult scan(BlockSource& source,
                    ArtifactSink& sink,
                    ScanObserver& observer,
                    const std::atomic<bool>& cancel);

    // Longest header or terminator among the enabled formats
    size_t carryLength() const;
    const std::vector<std::unique_ptr<BaseSignature>>& signatures() const { return sigs; }

private:
    struct HeaderHit {
        const BaseSignature* signature = nullptr;
        size_t offset = 0;
    };

    void processBlock(const Block& block);
    std::optional<size_t> resolveCandidate(const std::vector<uint8_t>& window, size_t windowFrom);
    std::optional<HeaderHit> earliestHeader(const std::vector<uint8_t>& window, size_t from);
    void finishCandidate();
    void finishStream();
    uint64_t capFor(const BaseSignature& signature) const;

    ScanConfig cfg;
    std::vector<std::unique_ptr<BaseSignature>> sigs;
    Validator validator;

    CarryWindow carry;
    CandidateTracker tracker;
    ScanSession session;

    // Per-signature next header offset in the current window
    std::vector<size_t> hitCache;
    uint64_t windowBase = 0;
    uint64_t currentBlock = 0;
    size_t carriedBytes = 0;
};
