#pragma once

#include <common/types.hpp>

namespace i8042::drivers::keyboard {

// Keyboard device commands, written through the data register
enum KeyboardCommand : i8042::common::uint8_t {
    KBD_CMD_SET_LEDS                        = 0xED,
    KBD_CMD_ECHO                            = 0xEE,
    KBD_CMD_GET_SET_SCANCODE                = 0xF0,
    KBD_CMD_IDENTIFY                        = 0xF2,
    KBD_CMD_SET_TYPEMATIC                   = 0xF3,
    KBD_CMD_ENABLE_SCANNING                 = 0xF4,
    KBD_CMD_DISABLE_SCANNING                = 0xF5,
    KBD_CMD_SET_DEFAULTS                    = 0xF6,
    KBD_CMD_SET_ALL_TYPEMATIC               = 0xF7,
    KBD_CMD_SET_ALL_MAKE_BREAK              = 0xF8,
    KBD_CMD_SET_ALL_MAKE_ONLY               = 0xF9,
    KBD_CMD_SET_ALL_TYPEMATIC_MAKE_BREAK    = 0xFA,
    KBD_CMD_SET_KEY_TYPEMATIC               = 0xFB,
    KBD_CMD_SET_KEY_MAKE_BREAK              = 0xFC,
    KBD_CMD_SET_KEY_MAKE_ONLY               = 0xFD,
    KBD_CMD_RESEND                          = 0xFE,
    KBD_CMD_RESET                           = 0xFF,
};

} // namespace i8042::drivers::keyboard

// Sub-command of KBD_CMD_GET_SET_SCANCODE that queries instead of sets
#define KBD_SCANCODE_SET_QUERY       0x00
#define KBD_SCANCODE_SET_MIN         1
#define KBD_SCANCODE_SET_MAX         3

// Typematic byte: bits 0-4 rate, bits 5-6 delay, bit 7 unused
#define KBD_TYPEMATIC_RATE_MIN       2.0f
#define KBD_TYPEMATIC_RATE_MAX       30.0f
#define KBD_TYPEMATIC_RATE_STEPS     31.0f
#define KBD_TYPEMATIC_RATE_MASK      0x1F
#define KBD_TYPEMATIC_DELAY_SHIFT    5
#define KBD_TYPEMATIC_DELAY_COUNT    4

// First identification byte of every MF2-family keyboard
#define KBD_ID_MF2_PREFIX            0xAB
