#include "decoder_registration.hpp"
#include "helpers.hpp"
#include <string>
#include <vector>

class AVIDecoder : public BaseDecoder {
public:
    std::string name() const override { return "AVI"; }

    DecodeReport decode(const std::vector<uint8_t>& blob) override {
        static const std::vector<uint8_t> riff = {'R', 'I', 'F', 'F'};
        static const std::vector<uint8_t> form = {'A', 'V', 'I', ' '};
        static const std::vector<uint8_t> list = {'L', 'I', 'S', 'T'};
        static const std::vector<uint8_t> hdrl = {'h', 'd', 'r', 'l'};
        DecodeReport r;

        if (blob.size() < 24 || !bytes_at(blob, 0, riff) || !bytes_at(blob, 8, form)) {
            r.info = "Invalid AVI: bad RIFF header";
            return r;
        }

        uint64_t fileSize = static_cast<uint64_t>(read_le32(blob, 4)) + 8;
        if (fileSize > blob.size()) {
            r.info = "Invalid AVI: RIFF size " + std::to_string(fileSize) +
                     " exceeds carved data " + std::to_string(blob.size());
            return r;
        }

        // The header list comes first in every AVI writer we know of
        if (!bytes_at(blob, 12, list) || !bytes_at(blob, 20, hdrl)) {
            r.info = "Invalid AVI: missing hdrl list";
            return r;
        }

        // Walk the top-level chunks inside the RIFF form
        size_t pos = 12;
        size_t chunks = 0;
        while (pos + 8 <= fileSize) {
            uint64_t chunkSize = read_le32(blob, pos + 4);
            uint64_t next = pos + 8 + chunkSize + (chunkSize & 1);
            if (next > fileSize + 1) {
                r.info = "Invalid AVI: chunk at 0x" + to_hex(pos) + " overruns RIFF form";
                return r;
            }
            ++chunks;
            pos = static_cast<size_t>(next);
        }

        r.info = "RIFF size: " + std::to_string(fileSize) + ", chunks: " + std::to_string(chunks);
        r.valid = true;
        return r;
    }
};

REGISTER_DECODER(AVIDecoder)
