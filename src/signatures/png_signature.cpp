#include "signature_registration.hpp"
#include "helpers.hpp"
#include <string>
#include <vector>

class PNGSignature : public FooterSignature {
public:
    std::string name() const override { return "PNG"; }
    std::string extension() const override { return "png"; }
    int priority() const override { return 1; }
    // signature + IHDR + minimal IDAT + IEND
    uint64_t minSize() const override { return 67; }
    uint64_t maxSize() const override { return 256 * MIB; }

    // IEND bytes can occur inside compressed pixel data, so the footer is only
    // trusted near the end of the candidate.
    bool checkStructure(const std::vector<uint8_t>& data) const override {
        if (!BaseSignature::checkStructure(data))
            return false;
        size_t tail = data.size() > TAIL_WINDOW ? data.size() - TAIL_WINDOW : 0;
        return find_bytes(data, footer(), tail).has_value();
    }

protected:
    const std::vector<uint8_t>& header() const override {
        static const std::vector<uint8_t> sig = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
        return sig;
    }
    // IEND chunk type + its fixed CRC
    const std::vector<uint8_t>& footer() const override {
        static const std::vector<uint8_t> sig = {'I', 'E', 'N', 'D', 0xAE, 0x42, 0x60, 0x82};
        return sig;
    }

private:
    static constexpr size_t TAIL_WINDOW = 100;
};

REGISTER_SIGNATURE(PNGSignature)
