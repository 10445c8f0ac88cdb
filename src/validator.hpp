#pragma once
#include "base_decoder.hpp"
#include "base_signature.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Deep-decode collaborator: answers whether a carved buffer really decodes as
// the given format.
class DeepValidator {
public:
    virtual ~DeepValidator() = default;
    virtual bool check(const std::vector<std::uint8_t>& data, const std::string& format) = 0;
};

// Default collaborator backed by the registered decoders. Formats without a
// decoder pass.
class DecoderValidator : public DeepValidator {
public:
    DecoderValidator();
    bool check(const std::vector<std::uint8_t>& data, const std::string& format) override;

private:
    std::vector<std::unique_ptr<BaseDecoder>> decoders;
};

class Validator {
public:
    explicit Validator(std::shared_ptr<DeepValidator> deep);

    // Structural check first, then the deep check. Any exception thrown by the
    // deep collaborator counts as a failed validation.
    bool validate(const BaseSignature& signature, const std::vector<std::uint8_t>& data) const;

private:
    std::shared_ptr<DeepValidator> deep;
};
