#include "validator.hpp"
#include "decoder_registry.hpp"
#include "logger.hpp"
#include <exception>

DecoderValidator::DecoderValidator()
    : decoders(DecoderRegistry::instance().createAll()) {}

bool DecoderValidator::check(const std::vector<std::uint8_t>& data, const std::string& format) {
    for (auto& decoder : decoders) {
        if (decoder->name() != format)
            continue;
        DecodeReport report = decoder->decode(data);
        Logger::debug(format + " decode: " + (report.valid ? "ok" : "failed") +
                      (report.info.empty() ? "" : " (" + report.info + ")"));
        return report.valid;
    }
    return true;
}

Validator::Validator(std::shared_ptr<DeepValidator> deep)
    : deep(std::move(deep)) {}

bool Validator::validate(const BaseSignature& signature, const std::vector<std::uint8_t>& data) const {
    if (!signature.checkStructure(data)) {
        Logger::debug(signature.name() + " candidate of " + std::to_string(data.size()) +
                      " bytes failed the structural check");
        return false;
    }
    if (!deep)
        return true;

    try {
        return deep->check(data, signature.name());
    } catch (const std::exception& e) {
        Logger::debug(signature.name() + " deep validation threw: " + e.what());
        return false;
    } catch (...) {
        Logger::debug(signature.name() + " deep validation threw a non-standard exception");
        return false;
    }
}
