#include "signature_registration.hpp"
#include "helpers.hpp"
#include <string>
#include <vector>

// RIFF container with the "AVI " form type. WAV and WebP share the RIFF
// literal, so the form type and size field must both check out.
class AVISignature : public ContainerSignature {
public:
    std::string name() const override { return "AVI"; }
    std::string extension() const override { return "avi"; }
    int priority() const override { return 4; }
    size_t headerLength() const override { return 12; }
    uint64_t minSize() const override { return 64; }

    bool headerAt(const std::vector<uint8_t>& data, size_t offset) const override {
        static const std::vector<uint8_t> formType = {'A', 'V', 'I', ' '};
        if (!BaseSignature::headerAt(data, offset))
            return false;
        uint64_t riffSize = read_le32(data, offset + 4);
        return riffSize >= MIN_RIFF_SIZE && riffSize <= MAX_RIFF_SIZE &&
               bytes_at(data, offset + 8, formType);
    }

protected:
    const std::vector<uint8_t>& anchor() const override {
        static const std::vector<uint8_t> sig = {'R', 'I', 'F', 'F'};
        return sig;
    }

private:
    static constexpr uint64_t MIN_RIFF_SIZE = 12;
    static constexpr uint64_t MAX_RIFF_SIZE = 10 * GIB;
};

REGISTER_SIGNATURE(AVISignature)
