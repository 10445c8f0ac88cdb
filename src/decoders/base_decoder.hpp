#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct DecodeReport {
    bool valid = false;
    std::string info;
};

// Full structural decode of one carved artifact, used to corroborate that the
// carved bytes really are a complete file of the claimed format.
class BaseDecoder {
public:
    virtual ~BaseDecoder() = default;
    virtual std::string name() const = 0;
    virtual DecodeReport decode(const std::vector<std::uint8_t>& data) = 0;
};
