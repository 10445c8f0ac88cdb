// decoder_registration.hpp
#pragma once
#include "decoder_registry.hpp"

#define REGISTER_DECODER(CLASSNAME) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                DecoderRegistry::instance().registerDecoder([]() { \
                    return std::make_unique<CLASSNAME>(); \
                }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
