#pragma once

#ifndef __I8042__DRIVERS__PS2__PS2_FLAGS_H
#define __I8042__DRIVERS__PS2__PS2_FLAGS_H

#include <common/types.hpp>

using namespace i8042::common;

namespace i8042 {
namespace drivers {
namespace ps2 {

/*
 * @brief Fixed 8-bit register layout with named bits.
 * Bits outside DefinedBits are dropped on the way in, so a value can never
 * carry a bit the layout does not name. Nothing is ever rejected.
 */
template <typename Tag, uint8_t DefinedBits>
class BitRegister {
public:
    static constexpr uint8_t DEFINED_BITS = DefinedBits;

    constexpr BitRegister() : m_bits(0) {}

    static constexpr BitRegister FromBitsTruncate(uint8_t raw) { return BitRegister(raw); }
    static constexpr BitRegister All() { return BitRegister(DefinedBits); }

    constexpr uint8_t Bits() const { return m_bits; }
    constexpr bool Contains(uint8_t flags) const { return (m_bits & flags) == flags; }
    constexpr bool IsEmpty() const { return m_bits == 0; }

    void Insert(uint8_t flags) { m_bits = (uint8_t)((m_bits | flags) & DefinedBits); }
    void Remove(uint8_t flags) { m_bits = (uint8_t)(m_bits & ~flags); }
    void Set(uint8_t flags, bool on) { if (on) Insert(flags); else Remove(flags); }

    constexpr bool operator==(const BitRegister& other) const { return m_bits == other.m_bits; }
    constexpr bool operator!=(const BitRegister& other) const { return m_bits != other.m_bits; }

private:
    explicit constexpr BitRegister(uint8_t raw) : m_bits((uint8_t)(raw & DefinedBits)) {}

    uint8_t m_bits;
};

// Status register (read from 0x64)
enum PS2StatusBits : uint8_t {
    PS2_STATUS_OUTPUT_FULL       = 0x01, // data waiting at 0x60
    PS2_STATUS_INPUT_FULL        = 0x02, // controller has not taken the last write yet
    PS2_STATUS_SYSTEM_FLAG       = 0x04,
    PS2_STATUS_INPUT_IS_COMMAND  = 0x08,
    PS2_STATUS_KEYBOARD_LOCK     = 0x10,
    PS2_STATUS_MOUSE_OUTPUT_FULL = 0x20,
    PS2_STATUS_TIMEOUT_ERR       = 0x40,
    PS2_STATUS_PARITY_ERR        = 0x80,
};
struct ControllerStatusTag {};
typedef BitRegister<ControllerStatusTag, 0xFF> ControllerStatus;

// Configuration byte, internal RAM byte 0
enum PS2ConfigBits : uint8_t {
    PS2_CONFIG_ENABLE_KEYBOARD_INTERRUPT = 0x01,
    PS2_CONFIG_ENABLE_MOUSE_INTERRUPT    = 0x02,
    PS2_CONFIG_SET_SYSTEM_FLAG           = 0x04,
    PS2_CONFIG_DISABLE_KEYBOARD          = 0x10,
    PS2_CONFIG_DISABLE_MOUSE             = 0x20,
    PS2_CONFIG_ENABLE_TRANSLATE          = 0x40,
};
struct ControllerConfigTag {};
typedef BitRegister<ControllerConfigTag, 0x77> ControllerConfig;

// Controller input port (0xC0)
enum PS2InputBits : uint8_t {
    PS2_INPUT_KEYBOARD_DATA           = 0x01,
    PS2_INPUT_MOUSE_DATA              = 0x02,
    PS2_INPUT_ENABLE_EXTRA_RAM        = 0x10,
    PS2_INPUT_NO_MANUFACTURING_JUMPER = 0x20,
    PS2_INPUT_MONOCHROME_DISPLAY      = 0x40,
    PS2_INPUT_KEYBOARD_ENABLED        = 0x80,
};
struct ControllerInputTag {};
typedef BitRegister<ControllerInputTag, 0xF3> ControllerInput;

// Controller output port (0xD0 / 0xD1)
enum PS2OutputBits : uint8_t {
    PS2_OUTPUT_SYSTEM_RESET       = 0x01,
    PS2_OUTPUT_A20_GATE           = 0x02,
    PS2_OUTPUT_MOUSE_DATA         = 0x04,
    PS2_OUTPUT_MOUSE_CLOCK        = 0x08,
    PS2_OUTPUT_KEYBOARD_INTERRUPT = 0x10,
    PS2_OUTPUT_MOUSE_INTERRUPT    = 0x20,
    PS2_OUTPUT_KEYBOARD_CLOCK     = 0x40,
    PS2_OUTPUT_KEYBOARD_DATA      = 0x80,
};
struct ControllerOutputTag {};
typedef BitRegister<ControllerOutputTag, 0xFF> ControllerOutput;

// Controller test inputs (0xE0)
enum PS2TestPortBits : uint8_t {
    PS2_TEST_KEYBOARD_CLOCK = 0x01,
    PS2_TEST_KEYBOARD_DATA  = 0x02,
};
struct ControllerTestPortTag {};
typedef BitRegister<ControllerTestPortTag, 0x03> ControllerTestPort;

// Keyboard LED byte (data for 0xED)
enum KeyboardLedBits : uint8_t {
    KBD_LED_SCROLL_LOCK = 0x01,
    KBD_LED_NUM_LOCK    = 0x02,
    KBD_LED_CAPS_LOCK   = 0x04,
};
struct KeyboardLedsTag {};
typedef BitRegister<KeyboardLedsTag, 0x07> KeyboardLeds;

// First byte of a mouse status packet (0xE9)
enum MouseStatusBits : uint8_t {
    MOUSE_STATUS_RIGHT_BUTTON   = 0x01,
    MOUSE_STATUS_MIDDLE_BUTTON  = 0x02,
    MOUSE_STATUS_LEFT_BUTTON    = 0x04,
    MOUSE_STATUS_SCALING_2_TO_1 = 0x10,
    MOUSE_STATUS_DATA_REPORTING = 0x20,
    MOUSE_STATUS_REMOTE_MODE    = 0x40,
};
struct MouseStatusTag {};
typedef BitRegister<MouseStatusTag, 0x77> MouseStatus;

// First byte of a movement packet. Bit 3 is always set by the device and is not a flag.
enum MouseMovementBits : uint8_t {
    MOUSE_MOVE_LEFT_BUTTON   = 0x01,
    MOUSE_MOVE_RIGHT_BUTTON  = 0x02,
    MOUSE_MOVE_MIDDLE_BUTTON = 0x04,
    MOUSE_MOVE_X_SIGN        = 0x10,
    MOUSE_MOVE_Y_SIGN        = 0x20,
    MOUSE_MOVE_X_OVERFLOW    = 0x40,
    MOUSE_MOVE_Y_OVERFLOW    = 0x80,
};
struct MouseMovementTag {};
typedef BitRegister<MouseMovementTag, 0xF7> MouseMovement;

} // namespace ps2
} // namespace drivers
} // namespace i8042

#endif
