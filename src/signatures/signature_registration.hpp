// signature_registration.hpp
#pragma once
#include "signature_registry.hpp"

#define REGISTER_SIGNATURE(CLASSNAME) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                SignatureRegistry::instance().registerSignature([]() { \
                    return std::make_unique<CLASSNAME>(); \
                }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
