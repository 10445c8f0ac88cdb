// signature_registry.hpp
#pragma once
#include "base_signature.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class SignatureRegistry {
public:
    using Creator = std::function<std::unique_ptr<BaseSignature>()>;

    static SignatureRegistry& instance() {
        static SignatureRegistry registry;
        return registry;
    }

    void registerSignature(Creator creator) {
        creators.push_back(std::move(creator));
    }

    // Registration order depends on static initialisation, so results are
    // sorted by priority to keep tie-breaks deterministic.
    std::vector<std::unique_ptr<BaseSignature>> createAll() const {
        std::vector<std::unique_ptr<BaseSignature>> result;
        for (const auto& creator : creators) {
            result.push_back(creator());
        }
        std::stable_sort(result.begin(), result.end(),
                         [](const auto& a, const auto& b) { return a->priority() < b->priority(); });
        return result;
    }

    std::vector<std::unique_ptr<BaseSignature>> createFor(MediaKind kind) const {
        std::vector<std::unique_ptr<BaseSignature>> result = createAll();
        result.erase(std::remove_if(result.begin(), result.end(),
                                    [kind](const auto& sig) { return sig->kind() != kind; }),
                     result.end());
        return result;
    }

    std::unique_ptr<BaseSignature> create(const std::string& name) const {
        for (const auto& creator : creators) {
            auto sig = creator();
            if (sig->name() == name)
                return sig;
        }
        return nullptr;
    }

private:
    std::vector<Creator> creators;
};
