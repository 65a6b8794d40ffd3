#pragma once
#ifndef  __I8042__DRIVERS__MOUSE__MOUSE_TYPE_H
#define  __I8042__DRIVERS__MOUSE__MOUSE_TYPE_H

#include <common/types.hpp>

using namespace i8042::common;

namespace i8042{
    namespace drivers{
        namespace mouse{

            // Device class from the single GET_DEVICE_ID byte. Unlisted IDs keep the raw byte.
            struct MouseType
            {
                enum Kind : uint8_t {
                    STANDARD,
                    INTELLIMOUSE,
                    INTELLIMOUSE_EXPLORER,
                    TYPHOON,
                    UNKNOWN,
                };

                Kind kind;
                uint8_t id;

                MouseType() : kind(UNKNOWN), id(0) {}
                MouseType(Kind k, uint8_t raw) : kind(k), id(raw) {}

                static MouseType FromId(uint8_t id);
                const char* Name() const;
            };
        }
    }
}
#endif
