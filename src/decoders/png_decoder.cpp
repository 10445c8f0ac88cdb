#include "decoder_registration.hpp"
#include "helpers.hpp"
#include <cstring>
#include <sstream>
#include <string>
#include <vector>
#include <zlib.h>

class PNGDecoder : public BaseDecoder {
public:
    std::string name() const override { return "PNG"; }
    DecodeReport decode(const std::vector<uint8_t>& blob) override;

private:
    struct Header {
        uint32_t width = 0;
        uint32_t height = 0;
        uint8_t bitDepth = 0;
        uint8_t colorType = 0;
        uint8_t interlace = 0;
    };

    static bool expectedImageSize(const Header& ihdr, uint64_t& size);
    static bool inflateImage(const std::vector<uint8_t>& idat, uint64_t& produced);
};

DecodeReport PNGDecoder::decode(const std::vector<uint8_t>& blob) {
    static const uint8_t sig[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    DecodeReport r;

    if (blob.size() < sizeof(sig) || std::memcmp(blob.data(), sig, sizeof(sig)) != 0) {
        r.info = "Invalid PNG: bad signature";
        return r;
    }

    size_t pos = sizeof(sig);
    Header ihdr;
    bool seenHeader = false;
    bool seenEnd = false;
    std::vector<uint8_t> idat;

    // --- Walk chunks ---
    while (pos + 12 <= blob.size()) {
        uint32_t len = read_be32(blob, pos);
        const uint8_t* type = &blob[pos + 4];
        size_t data = pos + 8;

        if (len > blob.size() || data + len + 4 > blob.size()) {
            r.info = "Invalid PNG: chunk exceeds file bounds";
            return r;
        }

        uint32_t stored = read_be32(blob, data + len);
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type, static_cast<uInt>(4 + len));
        if (crc != stored) {
            r.info = "Invalid PNG: chunk CRC mismatch at 0x" + to_hex(pos);
            return r;
        }

        if (!seenHeader) {
            if (std::memcmp(type, "IHDR", 4) != 0 || len != 13) {
                r.info = "Invalid PNG: missing IHDR";
                return r;
            }
            ihdr.width = read_be32(blob, data);
            ihdr.height = read_be32(blob, data + 4);
            ihdr.bitDepth = blob[data + 8];
            ihdr.colorType = blob[data + 9];
            ihdr.interlace = blob[data + 12];
            if (ihdr.width == 0 || ihdr.height == 0) {
                r.info = "Invalid PNG: zero dimension";
                return r;
            }
            seenHeader = true;
        } else if (std::memcmp(type, "IDAT", 4) == 0) {
            idat.insert(idat.end(), blob.begin() + data, blob.begin() + data + len);
        } else if (std::memcmp(type, "IEND", 4) == 0) {
            seenEnd = true;
            break;
        }

        pos = data + len + 4;
    }

    if (!seenEnd) {
        r.info = "Invalid PNG: missing IEND";
        return r;
    }
    if (idat.empty()) {
        r.info = "Invalid PNG: no image data";
        return r;
    }

    uint64_t produced = 0;
    if (!inflateImage(idat, produced)) {
        r.info = "Invalid PNG: image data does not inflate";
        return r;
    }

    uint64_t expected = 0;
    if (ihdr.interlace == 0 && expectedImageSize(ihdr, expected) && produced != expected) {
        r.info = "Invalid PNG: inflated " + std::to_string(produced) +
                 " bytes, expected " + std::to_string(expected);
        return r;
    }

    std::ostringstream info;
    info << "Resolution: " << ihdr.width << "x" << ihdr.height;
    r.info = info.str();
    r.valid = true;
    return r;
}

bool PNGDecoder::expectedImageSize(const Header& ihdr, uint64_t& size) {
    uint64_t channels = 0;
    switch (ihdr.colorType) {
        case 0: channels = 1; break;  // greyscale
        case 2: channels = 3; break;  // truecolour
        case 3: channels = 1; break;  // indexed
        case 4: channels = 2; break;  // greyscale + alpha
        case 6: channels = 4; break;  // truecolour + alpha
        default: return false;
    }
    uint64_t rowBits = static_cast<uint64_t>(ihdr.width) * channels * ihdr.bitDepth;
    uint64_t rowBytes = (rowBits + 7) / 8;
    // one filter byte per scanline
    size = static_cast<uint64_t>(ihdr.height) * (rowBytes + 1);
    return true;
}

bool PNGDecoder::inflateImage(const std::vector<uint8_t>& idat, uint64_t& produced) {
    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(idat.data());
    strm.avail_in = static_cast<uInt>(idat.size());

    if (inflateInit(&strm) != Z_OK)
        return false;

    const size_t CHUNK = 16384;
    std::vector<uint8_t> buffer(CHUNK);
    int ret = Z_OK;
    do {
        strm.next_out = buffer.data();
        strm.avail_out = static_cast<uInt>(buffer.size());

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return false;
        }
        produced += buffer.size() - strm.avail_out;
        // no progress and no input left: truncated stream
        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            return false;
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

REGISTER_DECODER(PNGDecoder)
