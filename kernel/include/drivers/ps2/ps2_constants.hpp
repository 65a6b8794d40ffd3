#pragma once

#include <common/types.hpp>
using namespace i8042::common;

namespace i8042::drivers::ps2 {

    // Poll iterations before a wait gives up
    constexpr uint32_t PS2_DEFAULT_TIMEOUT         = 10000;

    // Internal RAM is 32 bytes; the address is OR'd into the opcode
    constexpr uint8_t PS2_RAM_SIZE                 = 32;
    constexpr uint8_t PS2_RAM_ADDRESS_MASK         = 0x1F;
    constexpr uint8_t PS2_RAM_CONFIG_BYTE          = 0;

    // Controller self-test replies
    constexpr uint8_t PS2_CONTROLLER_TEST_PASSED   = 0x55;
    constexpr uint8_t PS2_PORT_TEST_PASSED         = 0x00;

    // Reserved device response bytes. Their meaning depends on the command
    // that is outstanding; any other byte is device payload.
    constexpr uint8_t PS2_RESPONSE_BUFFER_OVERRUN  = 0x00;
    constexpr uint8_t PS2_RESPONSE_SELF_TEST_PASSED= 0xAA;
    constexpr uint8_t PS2_RESPONSE_ECHO            = 0xEE;
    constexpr uint8_t PS2_RESPONSE_ACK             = 0xFA;
    constexpr uint8_t PS2_RESPONSE_SELF_TEST_FAILED= 0xFC;
    constexpr uint8_t PS2_RESPONSE_RESEND          = 0xFE;
    constexpr uint8_t PS2_RESPONSE_KEY_DETECTION_ERROR = 0xFF;

} // namespace i8042::drivers::ps2
