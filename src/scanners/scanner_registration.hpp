// scanner_registration.hpp
#pragma once
#include "scanner_registry.hpp"

#define REGISTER_SCANNER(CLASSNAME, ORDER) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                ScannerRegistry::instance().registerScanner(ORDER, \
                    [](const AccessValidator& access, const FormatIdentifier& identifier) { \
                        return std::make_unique<CLASSNAME>(access, identifier); \
                    }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
