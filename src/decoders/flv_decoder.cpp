#include "decoder_registration.hpp"
#include "helpers.hpp"
#include <string>
#include <vector>

class FLVDecoder : public BaseDecoder {
public:
    std::string name() const override { return "FLV"; }

    // Header, then the tag chain: every tag is followed by a PreviousTagSize
    // that must equal 11 + its payload size.
    DecodeReport decode(const std::vector<uint8_t>& blob) override {
        DecodeReport r;
        if (blob.size() < 13 || blob[0] != 'F' || blob[1] != 'L' || blob[2] != 'V' || blob[3] != 0x01) {
            r.info = "Invalid FLV: bad header";
            return r;
        }
        uint8_t flags = blob[4];
        if ((flags & 0xFA) != 0 || read_be32(blob, 5) != 9 || read_be32(blob, 9) != 0) {
            r.info = "Invalid FLV: bad header fields";
            return r;
        }

        size_t pos = 13;
        size_t tags = 0;
        while (pos + 11 <= blob.size()) {
            uint8_t type = blob[pos] & 0x1F;
            if (type != 8 && type != 9 && type != 18)
                break;
            uint32_t dataSize = read_be24(blob, pos + 1);
            size_t end = pos + 11 + dataSize;
            if (end + 4 > blob.size() || read_be32(blob, end) != 11 + dataSize)
                break;
            ++tags;
            pos = end + 4;
        }

        if (tags == 0) {
            r.info = "Invalid FLV: no complete tags";
            return r;
        }
        r.info = "Tags: " + std::to_string(tags) +
                 ((flags & 0x04) ? ", audio" : "") + ((flags & 0x01) ? ", video" : "");
        r.valid = true;
        return r;
    }
};

REGISTER_DECODER(FLVDecoder)
