#include "signature_registration.hpp"
#include "helpers.hpp"
#include <string>
#include <vector>

class JPEGSignature : public FooterSignature {
public:
    std::string name() const override { return "JPEG"; }
    std::string extension() const override { return "jpg"; }
    int priority() const override { return 0; }
    uint64_t minSize() const override { return 128; }
    uint64_t maxSize() const override { return 256 * MIB; }

protected:
    // SOI followed by the first marker's FF
    const std::vector<uint8_t>& header() const override {
        static const std::vector<uint8_t> sig = {0xFF, 0xD8, 0xFF};
        return sig;
    }
    // EOI
    const std::vector<uint8_t>& footer() const override {
        static const std::vector<uint8_t> sig = {0xFF, 0xD9};
        return sig;
    }
};

REGISTER_SIGNATURE(JPEGSignature)
