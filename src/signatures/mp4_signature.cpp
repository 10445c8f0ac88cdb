#include "signature_registration.hpp"
#include "helpers.hpp"
#include <string>
#include <vector>

// ISO BMFF (MP4, MOV, 3GP): a leading `ftyp` box. The literal alone is too
// common, so the box size in front of it has to be plausible.
class MP4Signature : public ContainerSignature {
public:
    std::string name() const override { return "MP4"; }
    std::string extension() const override { return "mp4"; }
    int priority() const override { return 2; }
    size_t headerLength() const override { return 8; }
    uint64_t minSize() const override { return 32; }

    bool headerAt(const std::vector<uint8_t>& data, size_t offset) const override {
        if (!BaseSignature::headerAt(data, offset))
            return false;
        uint32_t boxSize = read_be32(data, offset);
        return boxSize >= MIN_FTYP_SIZE && boxSize <= MAX_FTYP_SIZE;
    }

    std::string extensionFor(const std::vector<uint8_t>& data) const override {
        static const std::vector<uint8_t> quicktime = {'q', 't', ' ', ' '};
        return bytes_at(data, 8, quicktime) ? "mov" : extension();
    }

protected:
    const std::vector<uint8_t>& anchor() const override {
        static const std::vector<uint8_t> sig = {'f', 't', 'y', 'p'};
        return sig;
    }
    size_t anchorOffset() const override { return 4; }

private:
    static constexpr uint32_t MIN_FTYP_SIZE = 8;
    static constexpr uint32_t MAX_FTYP_SIZE = 1024 * 1024;
};

REGISTER_SIGNATURE(MP4Signature)
