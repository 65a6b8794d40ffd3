#pragma once

#ifndef __I8042__DRIVERS__PS2__PS2_ERROR_H
#define __I8042__DRIVERS__PS2__PS2_ERROR_H

#include <common/types.hpp>
#include <drivers/ps2/ps2_constants.hpp>

using namespace i8042::common;

namespace i8042 {
namespace drivers {
namespace ps2 {

/*
 * @brief Register-level failure reported by PS2Controller.
 * A default-constructed value means success.
 */
struct ControllerError {
    enum Kind : uint8_t {
        NONE = 0,
        TIMEOUT,        // bounded poll exhausted
        WOULD_BLOCK,    // non-blocking read found no data
        TEST_FAILED,    // self-test replied with `response`
        BUSY,           // another device handle holds the controller
    };

    Kind kind;
    uint8_t response;

    constexpr ControllerError() : kind(NONE), response(0) {}
    constexpr ControllerError(Kind k, uint8_t r) : kind(k), response(r) {}

    static constexpr ControllerError Ok() { return ControllerError(); }
    static constexpr ControllerError Timeout() { return ControllerError(TIMEOUT, 0); }
    static constexpr ControllerError WouldBlock() { return ControllerError(WOULD_BLOCK, 0); }
    static constexpr ControllerError TestFailed(uint8_t r) { return ControllerError(TEST_FAILED, r); }
    static constexpr ControllerError Busy() { return ControllerError(BUSY, 0); }

    constexpr bool IsOk() const { return kind == NONE; }
    const char* Name() const;
};

/*
 * @brief Protocol-level failure reported by Keyboard.
 * When kind is CONTROLLER, `controller` holds the register failure untouched.
 */
struct KeyboardError {
    enum Kind : uint8_t {
        NONE = 0,
        RESEND,
        SELF_TEST_FAILED,
        KEY_DETECTION_ERROR,    // 0x00 (buffer overrun) or 0xFF, kept in `response`
        INVALID_RESPONSE,
        INVALID_TYPEMATIC_RATE,
        INVALID_TYPEMATIC_DELAY,
        INVALID_SCANCODE_SET,
        CONTROLLER,
    };

    Kind kind;
    uint8_t response;           // offending byte or scancode set
    float rate;                 // INVALID_TYPEMATIC_RATE
    uint16_t delay;             // INVALID_TYPEMATIC_DELAY
    ControllerError controller;

    constexpr KeyboardError() : kind(NONE), response(0), rate(0.0f), delay(0), controller() {}

    static constexpr KeyboardError Ok() { return KeyboardError(); }
    static KeyboardError Of(Kind k, uint8_t response = 0);
    static KeyboardError InvalidRate(float rate);
    static KeyboardError InvalidDelay(uint16_t delay);
    static KeyboardError FromController(ControllerError err);

    constexpr bool IsOk() const { return kind == NONE; }
    // The 0x00 form of a key detection failure
    constexpr bool IsBufferOverrun() const {
        return kind == KEY_DETECTION_ERROR && response == PS2_RESPONSE_BUFFER_OVERRUN;
    }
    const char* Name() const;
};

/*
 * @brief Protocol-level failure reported by Mouse.
 */
struct MouseError {
    enum Kind : uint8_t {
        NONE = 0,
        RESEND,
        SELF_TEST_FAILED,
        INVALID_RESPONSE,
        INVALID_RESOLUTION,     // `response` holds the rejected value
        INVALID_SAMPLE_RATE,    // `response` holds the rejected value
        CONTROLLER,
    };

    Kind kind;
    uint8_t response;
    ControllerError controller;

    constexpr MouseError() : kind(NONE), response(0), controller() {}

    static constexpr MouseError Ok() { return MouseError(); }
    static MouseError Of(Kind k, uint8_t response = 0);
    static MouseError FromController(ControllerError err);

    constexpr bool IsOk() const { return kind == NONE; }
    const char* Name() const;
};

} // namespace ps2
} // namespace drivers
} // namespace i8042

#endif
