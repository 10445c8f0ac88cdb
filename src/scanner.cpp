#include "scanner.hpp"
#include "file_sink.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "signature_registry.hpp"
#include <algorithm>

namespace {
constexpr size_t NOT_SEARCHED = SIZE_MAX;
constexpr size_t NO_HIT = SIZE_MAX - 1;
}

Scanner::Scanner(ScanConfig config)
    : Scanner(config, std::make_shared<DecoderValidator>()) {}

Scanner::Scanner(ScanConfig config, std::shared_ptr<DeepValidator> deep)
    : cfg(config),
      sigs(SignatureRegistry::instance().createFor(config.kind)),
      validator(std::move(deep)) {
    carry.reset(carryLength());
}

size_t Scanner::carryLength() const {
    size_t longest = 0;
    for (const auto& sig : sigs)
        longest = std::max({longest, sig->headerLength(), sig->terminatorLength()});
    return longest;
}

uint64_t Scanner::capFor(const BaseSignature& signature) const {
    if (cfg.maxCandidateBytes != 0)
        return std::min(cfg.maxCandidateBytes, signature.maxSize());
    return signature.maxSize();
}

ScanResult Scanner::scan(ByteStream& stream,
                         const SinkConfig& sinkConfig,
                         ScanObserver& observer,
                         const std::atomic<bool>& cancel) {
    BlockSource source(stream, cfg.blockSize, cfg.maxEmptyReads);
    FileSink sink(sinkConfig);
    observer.onLog("Output directory: " + sinkConfig.destination.string());
    return scan(source, sink, observer, cancel);
}

ScanResult Scanner::scan(BlockSource& source,
                         ArtifactSink& sink,
                         ScanObserver& observer,
                         const std::atomic<bool>& cancel) {
    session = ScanSession{};
    session.sink = &sink;
    session.observer = &observer;
    tracker.discard();
    carry.reset(carryLength());

    std::string formats;
    for (const auto& sig : sigs)
        formats += (formats.empty() ? "" : ", ") + sig->name();
    observer.onLog("Scanning " + source.streamName() + " for " + to_string(cfg.kind) + " (" + formats + ")");

    ScanResult& counters = session.counters;
    bool running = true;
    while (running) {
        if (cancel.load()) {
            counters.status = ScanStatus::Cancelled;
            break;
        }

        BlockOutcome outcome = source.next(cancel);
        switch (outcome.status) {
        case BlockStatus::Empty:
            continue;
        case BlockStatus::Cancelled:
            counters.status = ScanStatus::Cancelled;
            running = false;
            break;
        case BlockStatus::Error:
            Logger::error("Read error after block " + std::to_string(counters.blocksRead) + ": " + outcome.message);
            observer.onLog("Read error after block " + std::to_string(counters.blocksRead) + ", stopping scan");
            counters.status = ScanStatus::ReadFailed;
            running = false;
            break;
        case BlockStatus::Exhausted:
            finishStream();
            running = false;
            break;
        case BlockStatus::Data:
            ++counters.blocksRead;
            counters.bytesRead += outcome.block.data.size();
            processBlock(outcome.block);
            observer.onProgress(counters.artifactsFound, counters.blocksRead);
            break;
        }
    }

    // Partial data is never written
    if (tracker.live()) {
        const Candidate& open = tracker.candidate();
        Logger::debug("Discarding open " + open.signature->name() + " candidate of " +
                      std::to_string(open.bytes.size()) + " bytes");
        tracker.discard();
    }
    carry.clear();

    if (counters.status == ScanStatus::Cancelled)
        observer.onLog("Scan cancelled");
    observer.onLog("Blocks scanned: " + std::to_string(counters.blocksRead) +
                   ", files recovered: " + std::to_string(counters.artifactsFound));
    observer.onProgress(counters.artifactsFound, counters.blocksRead);

    ScanResult result = counters;
    session = ScanSession{};
    return result;
}

void Scanner::processBlock(const Block& block) {
    carriedBytes = carry.size();
    std::vector<uint8_t> window = carry.merge(block.data);
    windowBase = session.counters.bytesRead - window.size();
    currentBlock = block.index;
    hitCache.assign(sigs.size(), NOT_SEARCHED);

    size_t pos = 0;
    if (tracker.live()) {
        // The carry is the candidate's own tail; take it back so the window
        // can be absorbed without duplicating those bytes.
        size_t windowFrom = carriedBytes - tracker.rewind(carriedBytes);
        auto resolved = resolveCandidate(window, windowFrom);
        if (!resolved) {
            carry.retain(tracker.candidate().bytes, 0);
            return;
        }
        pos = *resolved;
    }

    while (auto hit = earliestHeader(window, pos)) {
        uint64_t startBlock = (hit->offset < carriedBytes && currentBlock > 0) ? currentBlock - 1 : currentBlock;
        tracker.start(*hit->signature, startBlock, windowBase + hit->offset, capFor(*hit->signature));
        if (Logger::enabled(LogLevel::DEBUG))
            Logger::debug(hit->signature->name() + " header at 0x" + to_hex(windowBase + hit->offset));

        auto resolved = resolveCandidate(window, hit->offset);
        if (!resolved) {
            // Headers further along this window wait until this one resolves
            carry.retain(tracker.candidate().bytes, 0);
            return;
        }
        pos = *resolved;
    }

    carry.retain(window, pos);
}

// Feeds window[windowFrom..] to the live candidate. Returns the window offset
// where header search resumes once the candidate resolved, or nullopt while it
// is still open.
std::optional<size_t> Scanner::resolveCandidate(const std::vector<uint8_t>& window, size_t windowFrom) {
    const BaseSignature& sig = *tracker.candidate().signature;
    uint64_t held = tracker.size();

    // Terminators are only searched past the candidate's own header
    int64_t ownStart = static_cast<int64_t>(windowFrom) - static_cast<int64_t>(held);
    int64_t afterHeader = ownStart + static_cast<int64_t>(sig.headerLength());
    size_t searchFrom = afterHeader > 0 ? static_cast<size_t>(afterHeader) : 0;

    // A terminator past the cap is not honoured; the cap flush below wins
    uint64_t cap = capFor(sig);
    TerminatorOutcome term = sig.findTerminator(window, searchFrom, held);
    if (term.found && held + (term.end - windowFrom) <= cap) {
        tracker.append(window, windowFrom, term.end);
        finishCandidate();
        return term.end;
    }

    uint64_t incoming = window.size() - windowFrom;
    if (held + incoming >= cap) {
        size_t cut = held < cap ? windowFrom + static_cast<size_t>(cap - held) : windowFrom;
        tracker.append(window, windowFrom, cut);
        session.observer->onLog(sig.name() + " candidate reached the " + std::to_string(cap) +
                                " byte cap, flushing without a terminator");
        finishCandidate();
        return cut;
    }

    tracker.append(window, windowFrom, window.size());
    return std::nullopt;
}

// Earliest header at or after `from`; equal offsets go to the signature that
// sorts first by priority.
std::optional<Scanner::HeaderHit> Scanner::earliestHeader(const std::vector<uint8_t>& window, size_t from) {
    std::optional<HeaderHit> best;
    for (size_t i = 0; i < sigs.size(); ++i) {
        size_t& cached = hitCache[i];
        if (cached == NOT_SEARCHED || (cached != NO_HIT && cached < from)) {
            auto hit = sigs[i]->matchHeader(window, from);
            cached = hit ? *hit : NO_HIT;
        }
        if (cached == NO_HIT)
            continue;
        if (!best || cached < best->offset)
            best = HeaderHit{sigs[i].get(), cached};
    }
    return best;
}

void Scanner::finishCandidate() {
    Candidate done = tracker.take();
    const BaseSignature& sig = *done.signature;
    ScanResult& counters = session.counters;

    if (!validator.validate(sig, done.bytes)) {
        ++counters.artifactsRejected;
        Logger::debug("Dropped " + sig.name() + " candidate at 0x" + to_hex(done.streamOffset) +
                      " (" + std::to_string(done.bytes.size()) + " bytes): failed validation");
        return;
    }

    Artifact artifact;
    artifact.format = sig.name();
    artifact.extension = sig.extensionFor(done.bytes);
    artifact.streamOffset = done.streamOffset;
    artifact.startBlock = done.startBlock;
    artifact.bytes = std::move(done.bytes);

    SinkOutcome outcome = session.sink->store(std::move(artifact), *session.observer);
    if (!outcome.stored) {
        ++counters.sinkFailures;
        Logger::error(session.sink->name() + " sink: " + outcome.error);
        session.observer->onLog("Could not save " + sig.name() + " artifact (" + session.sink->name() +
                                " sink): " + outcome.error);
        return;
    }

    ++counters.artifactsFound;
    session.observer->onProgress(counters.artifactsFound, counters.blocksRead);
}

// Images get one last validation of what was accumulated; a container that
// never saw a closing header is ambiguous and is dropped.
void Scanner::finishStream() {
    if (!tracker.live())
        return;

    const Candidate& open = tracker.candidate();
    if (open.signature->kind() == MediaKind::Image) {
        Logger::debug("End of stream with an open " + open.signature->name() + " candidate, validating it as-is");
        finishCandidate();
        return;
    }

    session.observer->onLog("Discarding truncated " + open.signature->name() + " candidate of " +
                            std::to_string(open.bytes.size()) + " bytes at end of stream");
    tracker.discard();
}
