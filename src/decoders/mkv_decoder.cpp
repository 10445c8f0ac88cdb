#include "decoder_registration.hpp"
#include <optional>
#include <string>
#include <vector>

class MKVDecoder : public BaseDecoder {
public:
    std::string name() const override { return "MKV"; }
    DecodeReport decode(const std::vector<uint8_t>& blob) override;

private:
    static constexpr uint32_t EBML_ID = 0x1A45DFA3;
    static constexpr uint32_t DOCTYPE_ID = 0x4282;
    static constexpr uint32_t SEGMENT_ID = 0x18538067;

    struct Element {
        uint32_t id = 0;
        uint64_t size = 0;
        size_t dataOffset = 0;
        bool unknownSize = false;
    };

    static std::optional<Element> readElement(const std::vector<uint8_t>& blob, size_t pos);
};

// EBML variable-length integers: the count of leading zero bits in the first
// byte gives the number of extra bytes. IDs keep the marker bit, sizes drop it.
std::optional<MKVDecoder::Element> MKVDecoder::readElement(const std::vector<uint8_t>& blob, size_t pos) {
    if (pos >= blob.size()) return std::nullopt;

    size_t idLen = 1;
    for (uint8_t mask = 0x80; idLen <= 4 && !(blob[pos] & mask); mask >>= 1) ++idLen;
    if (idLen > 4 || pos + idLen > blob.size()) return std::nullopt;

    Element e;
    for (size_t k = 0; k < idLen; ++k)
        e.id = (e.id << 8) | blob[pos + k];
    pos += idLen;

    if (pos >= blob.size()) return std::nullopt;
    size_t sizeLen = 1;
    for (uint8_t mask = 0x80; sizeLen <= 8 && !(blob[pos] & mask); mask >>= 1) ++sizeLen;
    if (sizeLen > 8 || pos + sizeLen > blob.size()) return std::nullopt;

    uint64_t value = blob[pos] & (0xFF >> sizeLen);
    bool allOnes = value == static_cast<uint64_t>(0xFF >> sizeLen);
    for (size_t k = 1; k < sizeLen; ++k) {
        value = (value << 8) | blob[pos + k];
        allOnes = allOnes && blob[pos + k] == 0xFF;
    }
    e.size = value;
    e.unknownSize = allOnes;
    e.dataOffset = pos + sizeLen;
    return e;
}

DecodeReport MKVDecoder::decode(const std::vector<uint8_t>& blob) {
    DecodeReport r;

    auto header = readElement(blob, 0);
    if (!header || header->id != EBML_ID || header->unknownSize ||
        header->dataOffset + header->size > blob.size()) {
        r.info = "Invalid MKV: bad EBML header";
        return r;
    }

    std::string docType;
    size_t pos = header->dataOffset;
    size_t headerEnd = header->dataOffset + static_cast<size_t>(header->size);
    while (pos < headerEnd) {
        auto child = readElement(blob, pos);
        if (!child || child->unknownSize || child->dataOffset + child->size > headerEnd) {
            r.info = "Invalid MKV: malformed EBML header child";
            return r;
        }
        if (child->id == DOCTYPE_ID) {
            docType.assign(blob.begin() + child->dataOffset,
                           blob.begin() + child->dataOffset + child->size);
            docType = docType.c_str();  // strip zero padding
        }
        pos = child->dataOffset + static_cast<size_t>(child->size);
    }

    if (docType != "matroska" && docType != "webm") {
        r.info = "Invalid MKV: unsupported DocType '" + docType + "'";
        return r;
    }

    auto segment = readElement(blob, headerEnd);
    if (!segment || segment->id != SEGMENT_ID) {
        r.info = "Invalid MKV: missing Segment";
        return r;
    }

    r.info = "DocType: " + docType;
    r.valid = true;
    return r;
}

REGISTER_DECODER(MKVDecoder)
