#pragma once

#include <common/types.hpp>
using namespace i8042::common;

namespace i8042::drivers::mouse {

    // Mouse device commands, routed through PS2_CMD_WRITE_TO_MOUSE
    enum MouseCommand : uint8_t {
        MOUSE_CMD_SET_SCALING_1_1        = 0xE6,
        MOUSE_CMD_SET_SCALING_2_1        = 0xE7,
        MOUSE_CMD_SET_RESOLUTION         = 0xE8,
        MOUSE_CMD_STATUS_REQUEST         = 0xE9,
        MOUSE_CMD_SET_STREAM_MODE        = 0xEA,
        MOUSE_CMD_READ_DATA              = 0xEB,
        MOUSE_CMD_RESET_WRAP_MODE        = 0xEC,
        MOUSE_CMD_SET_WRAP_MODE          = 0xEE,
        MOUSE_CMD_SET_REMOTE_MODE        = 0xF0,
        MOUSE_CMD_GET_DEVICE_ID          = 0xF2,
        MOUSE_CMD_SET_SAMPLE_RATE        = 0xF3,
        MOUSE_CMD_ENABLE_DATA_REPORTING  = 0xF4,
        MOUSE_CMD_DISABLE_DATA_REPORTING = 0xF5,
        MOUSE_CMD_SET_DEFAULTS           = 0xF6,
        MOUSE_CMD_RESEND                 = 0xFE,
        MOUSE_CMD_RESET                  = 0xFF,
    };

    // Packet and data
    constexpr uint8_t MOUSE_PACKET_SIZE              = 3;
    constexpr uint8_t MOUSE_STATUS_PACKET_SIZE       = 3;
    constexpr uint16_t MOUSE_SIGN_EXTEND             = 0xFF00;

    // Device ID bytes
    constexpr uint8_t MOUSE_ID_STANDARD              = 0x00;
    constexpr uint8_t MOUSE_ID_INTELLIMOUSE          = 0x03;
    constexpr uint8_t MOUSE_ID_INTELLIMOUSE_EXPLORER = 0x04;
    constexpr uint8_t MOUSE_ID_TYPHOON               = 0x08;

    // Resolution is sent as the index into this table (counts per mm)
    constexpr uint8_t MOUSE_RESOLUTION_COUNT         = 4;
    constexpr uint8_t MOUSE_RESOLUTIONS[MOUSE_RESOLUTION_COUNT] = { 1, 2, 4, 8 };

    // Sample rates in samples per second
    constexpr uint8_t MOUSE_SAMPLE_RATE_COUNT        = 7;
    constexpr uint8_t MOUSE_SAMPLE_RATES[MOUSE_SAMPLE_RATE_COUNT] = { 10, 20, 40, 60, 80, 100, 200 };

} // namespace i8042::drivers::mouse
