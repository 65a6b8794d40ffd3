#pragma once

#ifndef __I8042__DRIVERS__KEYBOARD__KEYBOARD_TYPE_H
#define __I8042__DRIVERS__KEYBOARD__KEYBOARD_TYPE_H

#include <common/types.hpp>

using namespace i8042::common;

namespace i8042
{
    namespace drivers
    {
        namespace keyboard
        {
            /*
            * @brief Device class reported by the identify command.
            * XT keyboards refuse the command, AT keyboards behind translation answer
            * with nothing, everything else sends two bytes. Pairs outside the known
            * table come back as UNKNOWN with both bytes kept.
            */
            struct KeyboardType
            {
                enum Kind : uint8_t {
                    XT,
                    AT_WITH_TRANSLATION,
                    MF2,
                    MF2_WITH_TRANSLATION,
                    THINKPAD,
                    THINKPAD_WITH_TRANSLATION,
                    KEY_122,
                    IBM_1390876,
                    NCD_N97,
                    NCD_SUN_LAYOUT,
                    OLD_JAPANESE_G,
                    OLD_JAPANESE_P,
                    OLD_JAPANESE_A,
                    UNKNOWN,
                };

                Kind kind;
                // Raw identification bytes, zero when the device sent fewer
                uint8_t first;
                uint8_t second;

                KeyboardType() : kind(UNKNOWN), first(0), second(0) {}
                KeyboardType(Kind k, uint8_t a, uint8_t b) : kind(k), first(a), second(b) {}

                static KeyboardType FromIdentification(uint8_t first, uint8_t second);

                const char* Name() const;
            };
        }
    }
}

#endif
