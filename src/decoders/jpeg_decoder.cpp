#include "decoder_registration.hpp"
#include "helpers.hpp"
#include <sstream>
#include <string>
#include <vector>

class JPEGDecoder : public BaseDecoder {
public:
    std::string name() const override { return "JPEG"; }
    DecodeReport decode(const std::vector<uint8_t>& blob) override;

private:
    size_t skipEntropyData(const std::vector<uint8_t>& blob, size_t i);
};

// Walks the marker segments from SOI to EOI. A carved JPEG must carry a frame
// header and at least one scan, and EOI must be the last two bytes.
DecodeReport JPEGDecoder::decode(const std::vector<uint8_t>& blob) {
    DecodeReport r;
    if (blob.size() < 4 || blob[0] != 0xFF || blob[1] != 0xD8) {
        r.info = "Invalid JPEG: missing SOI";
        return r;
    }

    size_t width = 0, height = 0;
    bool foundSOF = false;
    bool foundSOS = false;
    size_t i = 2;

    while (i + 1 < blob.size()) {
        if (blob[i] != 0xFF) {
            r.info = "Invalid JPEG: expected marker at 0x" + to_hex(i);
            return r;
        }

        uint8_t marker = blob[i + 1];

        // Skip padding FFs
        if (marker == 0xFF) {
            ++i;
            continue;
        }

        if (marker == 0xD9) {
            if (!foundSOF || !foundSOS) {
                r.info = "Invalid JPEG: EOI before frame data";
                return r;
            }
            if (i + 2 != blob.size()) {
                r.info = "Invalid JPEG: data after EOI";
                return r;
            }
            std::ostringstream info;
            info << "Resolution: " << width << "x" << height;
            r.info = info.str();
            r.valid = true;
            return r;
        }

        // Restart markers (0xD0-0xD7) and TEM have no length
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) {
            i += 2;
            continue;
        }

        // Check segment length
        if (i + 4 > blob.size()) break;
        uint16_t segment_length = read_be16(blob, i + 2);
        if (segment_length < 2 || i + 2 + segment_length > blob.size()) {
            r.info = "Invalid JPEG: segment exceeds data at 0x" + to_hex(i);
            return r;
        }

        // SOF0-SOF15 except DHT, JPG and DAC
        bool isSOF = marker >= 0xC0 && marker <= 0xCF &&
                     marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (isSOF) {
            if (segment_length < 8) {
                r.info = "Invalid JPEG: short frame header";
                return r;
            }
            height = read_be16(blob, i + 5);
            width  = read_be16(blob, i + 7);
            uint8_t components = blob[i + 9];
            if (width == 0 || components == 0 || components > 4) {
                r.info = "Invalid JPEG: bad frame header";
                return r;
            }
            foundSOF = true;
        }

        i += 2 + segment_length;

        if (marker == 0xDA) {
            if (!foundSOF) {
                r.info = "Invalid JPEG: scan before frame header";
                return r;
            }
            foundSOS = true;
            i = skipEntropyData(blob, i);
        }
    }

    r.info = "Invalid JPEG: missing EOI";
    return r;
}

// Entropy-coded data ends at the first marker that is neither a stuffed
// 0xFF00 nor a restart marker.
size_t JPEGDecoder::skipEntropyData(const std::vector<uint8_t>& blob, size_t i) {
    while (i + 1 < blob.size()) {
        if (blob[i] != 0xFF) {
            ++i;
            continue;
        }
        uint8_t next = blob[i + 1];
        if (next == 0x00 || (next >= 0xD0 && next <= 0xD7)) {
            i += 2;
        } else if (next == 0xFF) {
            ++i;
        } else {
            break;
        }
    }
    return i;
}

REGISTER_DECODER(JPEGDecoder)
