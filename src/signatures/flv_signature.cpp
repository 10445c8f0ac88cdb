#include "signature_registration.hpp"
#include <string>
#include <vector>

// "FLV" + version 1
class FLVSignature : public ContainerSignature {
public:
    std::string name() const override { return "FLV"; }
    std::string extension() const override { return "flv"; }
    int priority() const override { return 5; }
    size_t headerLength() const override { return 4; }
    uint64_t minSize() const override { return 32; }

protected:
    const std::vector<uint8_t>& anchor() const override {
        static const std::vector<uint8_t> sig = {'F', 'L', 'V', 0x01};
        return sig;
    }
};

REGISTER_SIGNATURE(FLVSignature)
