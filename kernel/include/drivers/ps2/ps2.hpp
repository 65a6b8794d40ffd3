#pragma once

#ifndef __I8042__DRIVERS__PS2__PS2_H
#define __I8042__DRIVERS__PS2__PS2_H

// PS/2 controller abstraction for the 8042 (ports 0x60/0x64)
#include <common/types.hpp>
#include <arch/x86/hardware/port/port8bit.hpp>
#include <drivers/ps2/ps2_constants.hpp>
#include <drivers/ps2/ps2_error.hpp>
#include <drivers/ps2/ps2_flags.hpp>

namespace i8042 {
namespace drivers {
namespace ps2 {

using i8042::common::uint8_t;
using i8042::common::uint32_t;
using i8042::arch::x86::hardware::port::Port8Bit;

// Controller commands, written to 0x64
enum PS2Cmd : uint8_t {
    PS2_CMD_READ_RAM                = 0x20, // | address
    PS2_CMD_WRITE_RAM               = 0x60, // | address
    PS2_CMD_DISABLE_MOUSE           = 0xA7,
    PS2_CMD_ENABLE_MOUSE            = 0xA8,
    PS2_CMD_TEST_MOUSE              = 0xA9,
    PS2_CMD_TEST_CONTROLLER         = 0xAA,
    PS2_CMD_TEST_KEYBOARD           = 0xAB,
    PS2_CMD_DIAGNOSTIC_DUMP         = 0xAC,
    PS2_CMD_DISABLE_KEYBOARD        = 0xAD,
    PS2_CMD_ENABLE_KEYBOARD         = 0xAE,
    PS2_CMD_READ_INPUT_PORT         = 0xC0,
    PS2_CMD_INPUT_LOW_TO_STATUS     = 0xC1,
    PS2_CMD_INPUT_HIGH_TO_STATUS    = 0xC2,
    PS2_CMD_READ_OUTPUT_PORT        = 0xD0,
    PS2_CMD_WRITE_OUTPUT_PORT       = 0xD1,
    PS2_CMD_WRITE_KEYBOARD_BUFFER   = 0xD2,
    PS2_CMD_WRITE_MOUSE_BUFFER      = 0xD3,
    PS2_CMD_WRITE_TO_MOUSE          = 0xD4,
    PS2_CMD_READ_TEST_PORT          = 0xE0,
    PS2_CMD_PULSE_OUTPUT            = 0xF0, // | line mask, high nibble already all ones
};

/*
 * @brief Acknowledgment that the caller alone drives ports 0x60/0x64, and
 * that no interrupt handler drains the data register while a blocking read
 * is in progress. Neither is checked at runtime.
 */
struct SoleOwnership {};

class ControllerLease;

/*
 * @brief The 8042 controller.
 *
 * Every byte that reaches the data or command register goes through here,
 * behind a bounded poll of the status register. Nothing is retried beyond
 * the timeout; retrying is the caller's business.
 */
class PS2Controller {
public:
    // The controller on the real hardware ports. Created on first use.
    static PS2Controller& Instance();

    PS2Controller(SoleOwnership, Port8Bit* data, Port8Bit* command,
                  uint32_t timeout = PS2_DEFAULT_TIMEOUT);

    uint32_t Timeout() const { return m_timeout; }
    void     SetTimeout(uint32_t timeout) { m_timeout = timeout; }

    // In non-blocking mode a read with nothing pending fails with WOULD_BLOCK
    // after one status check instead of polling.
    void EnableBlockingRead()  { m_blockingRead = true; }
    void DisableBlockingRead() { m_blockingRead = false; }
    bool IsBlockingRead() const { return m_blockingRead; }

    // Single unconditional read of the status register.
    ControllerStatus ReadStatus();

    ControllerError WaitForRead();
    ControllerError WaitForWrite();

    ControllerError ReadData(uint8_t& data);
    ControllerError WriteData(uint8_t value);
    ControllerError WriteCommand(PS2Cmd command);

    // Internal RAM, addresses 0-31. Byte 0 is the configuration byte.
    ControllerError ReadInternalRam(uint8_t byteNumber, uint8_t& data);
    ControllerError WriteInternalRam(uint8_t byteNumber, uint8_t data);
    ControllerError ReadConfig(ControllerConfig& config);
    ControllerError WriteConfig(ControllerConfig config);

    ControllerError DisableKeyboard();
    ControllerError EnableKeyboard();
    ControllerError DisableMouse();
    ControllerError EnableMouse();

    ControllerError TestController();
    ControllerError TestKeyboard();
    ControllerError TestMouse();

    // Reads all 32 bytes of internal RAM in address order.
    ControllerError DiagnosticDump(uint8_t (&dump)[PS2_RAM_SIZE]);

    ControllerError ReadInputPort(ControllerInput& input);
    ControllerError WriteInputLowNibbleToStatus();
    ControllerError WriteInputHighNibbleToStatus();
    ControllerError ReadOutputPort(ControllerOutput& output);
    ControllerError WriteOutputPort(ControllerOutput output);
    ControllerError ReadTestPort(ControllerTestPort& test);

    // Place a byte in the output buffer as if the device had sent it. Raises
    // IRQ1/IRQ12 when that interrupt is enabled in the configuration byte.
    ControllerError WriteKeyboardBuffer(uint8_t value);
    ControllerError WriteMouseBuffer(uint8_t value);

    // Route the next data byte to the mouse instead of the keyboard.
    ControllerError WriteToMouse(uint8_t value);

    // Writes 0xF0 | mask straight to the command register. Lines whose bit is
    // clear in the low nibble are pulsed low (bit 0 is CPU reset).
    ControllerError PulseOutputLowNibble(uint8_t mask);

    // Discard whatever is pending in the output buffer. Returns the number of
    // bytes dropped; stops after Timeout() bytes.
    uint32_t FlushOutput();

private:
    PS2Controller(const PS2Controller&) = delete;
    PS2Controller& operator=(const PS2Controller&) = delete;

    ControllerError WriteComputedCommand(uint8_t command);
    ControllerError ExpectTestResult(PS2Cmd command, uint8_t passed, const char* what);

    friend class ControllerLease;

    Port8Bit* m_data;
    Port8Bit* m_cmd;
    uint32_t  m_timeout;
    bool      m_blockingRead;
    bool      m_leased;
};

/*
 * @brief Scoped exclusive use of the controller for one command sequence.
 * Keyboard and Mouse take one at the top of every operation so the bytes of
 * two handshakes can never interleave. Released on every return path.
 */
class ControllerLease {
public:
    explicit ControllerLease(PS2Controller& controller)
        : m_controller(controller), m_acquired(!controller.m_leased)
    {
        if (m_acquired) m_controller.m_leased = true;
    }

    ~ControllerLease()
    {
        if (m_acquired) m_controller.m_leased = false;
    }

    bool Acquired() const { return m_acquired; }

private:
    ControllerLease(const ControllerLease&) = delete;
    ControllerLease& operator=(const ControllerLease&) = delete;

    PS2Controller& m_controller;
    bool m_acquired;
};

} // namespace ps2
} // namespace drivers
} // namespace i8042

#endif
