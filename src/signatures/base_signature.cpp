#include "base_signature.hpp"
#include "helpers.hpp"

std::string to_string(MediaKind kind) {
    return kind == MediaKind::Image ? "images" : "videos";
}

bool BaseSignature::headerAt(const std::vector<uint8_t>& data, size_t offset) const {
    return bytes_at(data, offset + anchorOffset(), anchor()) &&
           data.size() - offset >= headerLength();
}

std::optional<size_t> BaseSignature::matchHeader(const std::vector<uint8_t>& window, size_t from) const {
    size_t cursor = from + anchorOffset();
    while (auto hit = find_bytes(window, anchor(), cursor)) {
        size_t start = *hit - anchorOffset();
        if (headerAt(window, start))
            return start;
        cursor = *hit + 1;
    }
    return std::nullopt;
}

bool BaseSignature::checkStructure(const std::vector<uint8_t>& data) const {
    if (data.size() < minSize() || data.size() > maxSize())
        return false;
    return headerAt(data, 0);
}

TerminatorOutcome FooterSignature::findTerminator(const std::vector<uint8_t>& window,
                                                  size_t from,
                                                  uint64_t /*candidateLen*/) const {
    TerminatorOutcome outcome;
    if (auto pos = find_bytes(window, footer(), from)) {
        outcome.found = true;
        outcome.end = *pos + footer().size();
    }
    return outcome;
}

bool FooterSignature::checkStructure(const std::vector<uint8_t>& data) const {
    return BaseSignature::checkStructure(data) && ends_with(data, footer());
}

uint64_t ContainerSignature::maxSize() const {
    return 2 * GIB;
}

TerminatorOutcome ContainerSignature::findTerminator(const std::vector<uint8_t>& window,
                                                     size_t from,
                                                     uint64_t /*candidateLen*/) const {
    TerminatorOutcome outcome;
    if (auto next = matchHeader(window, from)) {
        outcome.found = true;
        outcome.end = *next;
        outcome.atNextHeader = true;
    }
    return outcome;
}
