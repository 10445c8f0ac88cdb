#include "signature_registration.hpp"
#include <string>
#include <vector>

// Matroska / WebM: EBML header element ID
class MKVSignature : public ContainerSignature {
public:
    std::string name() const override { return "MKV"; }
    std::string extension() const override { return "mkv"; }
    int priority() const override { return 3; }
    size_t headerLength() const override { return 4; }
    uint64_t minSize() const override { return 64; }

protected:
    const std::vector<uint8_t>& anchor() const override {
        static const std::vector<uint8_t> sig = {0x1A, 0x45, 0xDF, 0xA3};
        return sig;
    }
};

REGISTER_SIGNATURE(MKVSignature)
