// decoder_registry.hpp
#pragma once
#include "base_decoder.hpp"
#include <functional>
#include <vector>
#include <memory>

class DecoderRegistry {
public:
    using Creator = std::function<std::unique_ptr<BaseDecoder>()>;

    static DecoderRegistry& instance() {
        static DecoderRegistry registry;
        return registry;
    }

    void registerDecoder(Creator creator) {
        creators.push_back(std::move(creator));
    }

    std::vector<std::unique_ptr<BaseDecoder>> createAll() const {
        std::vector<std::unique_ptr<BaseDecoder>> result;
        for (const auto& creator : creators) {
            result.push_back(creator());
        }
        return result;
    }

private:
    std::vector<Creator> creators;
};
