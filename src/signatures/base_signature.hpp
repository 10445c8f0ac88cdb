#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class MediaKind {
    Image,
    Video
};

std::string to_string(MediaKind kind);

struct TerminatorOutcome {
    bool found = false;
    size_t end = 0;             // exclusive end of the artifact inside the window
    bool atNextHeader = false;  // `end` is where the next artifact of the same format begins
};

// A carvable format: how its start is recognised and where it stops.
//
// Header matching searches the window for the format's anchor (a literal that
// every header contains at a fixed position) and then confirms the full
// header with headerAt(). Offsets returned are artifact start offsets.
class BaseSignature {
public:
    virtual ~BaseSignature() = default;
    virtual std::string name() const = 0;
    virtual std::string extension() const = 0;
    virtual MediaKind kind() const = 0;
    // Lower wins when two headers start at the same offset
    virtual int priority() const = 0;

    virtual size_t headerLength() const = 0;
    virtual size_t terminatorLength() const = 0;
    virtual uint64_t minSize() const = 0;
    virtual uint64_t maxSize() const = 0;

    virtual TerminatorOutcome findTerminator(const std::vector<uint8_t>& window,
                                             size_t from,
                                             uint64_t candidateLen) const = 0;

    virtual bool headerAt(const std::vector<uint8_t>& data, size_t offset) const;
    std::optional<size_t> matchHeader(const std::vector<uint8_t>& window, size_t from) const;

    // Cheap checks run before any decoding: header at offset 0 and size bounds.
    virtual bool checkStructure(const std::vector<uint8_t>& data) const;

    virtual std::string extensionFor(const std::vector<uint8_t>& data) const { return extension(); }

protected:
    virtual const std::vector<uint8_t>& anchor() const = 0;
    virtual size_t anchorOffset() const { return 0; }
};

// Image formats close with a fixed footer somewhere after the header.
class FooterSignature : public BaseSignature {
public:
    MediaKind kind() const override { return MediaKind::Image; }
    size_t headerLength() const override { return header().size(); }
    size_t terminatorLength() const override { return footer().size(); }

    TerminatorOutcome findTerminator(const std::vector<uint8_t>& window,
                                     size_t from,
                                     uint64_t candidateLen) const override;
    bool checkStructure(const std::vector<uint8_t>& data) const override;

protected:
    virtual const std::vector<uint8_t>& header() const = 0;
    virtual const std::vector<uint8_t>& footer() const = 0;
    const std::vector<uint8_t>& anchor() const override { return header(); }
};

// Containers have no reliable trailer; an artifact runs until the next header
// of the same format or until maxSize() forces a flush.
class ContainerSignature : public BaseSignature {
public:
    MediaKind kind() const override { return MediaKind::Video; }
    size_t terminatorLength() const override { return headerLength(); }
    uint64_t maxSize() const override;

    TerminatorOutcome findTerminator(const std::vector<uint8_t>& window,
                                     size_t from,
                                     uint64_t candidateLen) const override;
};
