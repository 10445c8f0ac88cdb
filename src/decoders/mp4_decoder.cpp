#include "decoder_registration.hpp"
#include "helpers.hpp"
#include <sstream>
#include <string>
#include <vector>

class MP4Decoder : public BaseDecoder {
public:
    std::string name() const override { return "MP4"; }
    DecodeReport decode(const std::vector<uint8_t>& blob) override;

private:
    static bool printableType(const std::vector<uint8_t>& blob, size_t offset);
};

bool MP4Decoder::printableType(const std::vector<uint8_t>& blob, size_t offset) {
    for (size_t k = 0; k < 4; ++k) {
        if (blob[offset + k] < 0x20 || blob[offset + k] > 0x7E)
            return false;
    }
    return true;
}

// Top-level box walk. Carved containers end at the next header or at the size
// cap, so trailing bytes that no longer parse as boxes are tolerated once the
// movie header has been seen.
DecodeReport MP4Decoder::decode(const std::vector<uint8_t>& blob) {
    DecodeReport r;
    size_t pos = 0;
    size_t boxes = 0;
    bool foundMoov = false;
    bool foundMdat = false;
    bool truncated = false;
    std::string brand;

    while (pos + 8 <= blob.size()) {
        uint64_t boxSize = read_be32(blob, pos);
        std::string type(blob.begin() + pos + 4, blob.begin() + pos + 8);
        uint64_t headerSize = 8;

        if (boxSize == 1) {
            if (pos + 16 > blob.size()) break;
            boxSize = read_be64(blob, pos + 8);
            headerSize = 16;
        } else if (boxSize == 0) {
            // box extends to end of file
            boxSize = blob.size() - pos;
        }

        if (boxSize < headerSize || !printableType(blob, pos + 4))
            break;

        if (boxes == 0) {
            if (type != "ftyp" || boxSize < 16) {
                r.info = "Invalid MP4: first box is not ftyp";
                return r;
            }
            brand.assign(blob.begin() + pos + 8, blob.begin() + pos + 12);
        }
        if (type == "moov") foundMoov = true;
        if (type == "mdat") foundMdat = true;
        ++boxes;

        if (boxSize > blob.size() - pos) {
            truncated = true;
            break;
        }
        pos += boxSize;
    }

    if (boxes == 0) {
        r.info = "Invalid MP4: no boxes";
        return r;
    }
    if (!foundMoov) {
        r.info = "Invalid MP4: missing moov";
        return r;
    }

    std::ostringstream info;
    info << "Brand: " << brand << ", boxes: " << boxes
         << (foundMdat ? ", media data present" : "")
         << (truncated ? ", truncated" : "");
    r.info = info.str();
    r.valid = true;
    return r;
}

REGISTER_DECODER(MP4Decoder)
