#include <drivers/ps2/ps2.hpp>
#include <console/logger.hpp>

using namespace i8042::drivers::ps2;
using namespace i8042::arch::x86::hardware::port;
using i8042::console::Logger;

PS2Controller::PS2Controller(SoleOwnership, Port8Bit* data, Port8Bit* command, uint32_t timeout)
    : m_data(data), m_cmd(command), m_timeout(timeout), m_blockingRead(true), m_leased(false) {}

PS2Controller& PS2Controller::Instance() {
    static Port8Bit s_data(PORT_PS2_DATA);
    static Port8Bit s_cmd(PORT_PS2_COMMAND);
    static PS2Controller s_inst(SoleOwnership(), &s_data, &s_cmd);
    return s_inst;
}

ControllerStatus PS2Controller::ReadStatus() {
    return ControllerStatus::FromBitsTruncate(m_cmd->Read());
}

ControllerError PS2Controller::WaitForRead() {
    if (!m_blockingRead) {
        if (ReadStatus().Contains(PS2_STATUS_OUTPUT_FULL)) return ControllerError::Ok();
        return ControllerError::WouldBlock();
    }
    for (uint32_t i = 0; i < m_timeout; ++i) {
        if (ReadStatus().Contains(PS2_STATUS_OUTPUT_FULL)) return ControllerError::Ok();
    }
    Logger::Debug("[PS2] read timeout");
    return ControllerError::Timeout();
}

ControllerError PS2Controller::WaitForWrite() {
    for (uint32_t i = 0; i < m_timeout; ++i) {
        if (!ReadStatus().Contains(PS2_STATUS_INPUT_FULL)) return ControllerError::Ok();
    }
    Logger::Debug("[PS2] write timeout");
    return ControllerError::Timeout();
}

ControllerError PS2Controller::ReadData(uint8_t& data) {
    ControllerError err = WaitForRead();
    if (!err.IsOk()) return err;
    data = m_data->Read();
    return ControllerError::Ok();
}

ControllerError PS2Controller::WriteData(uint8_t value) {
    ControllerError err = WaitForWrite();
    if (!err.IsOk()) return err;
    m_data->Write(value);
    return ControllerError::Ok();
}

ControllerError PS2Controller::WriteCommand(PS2Cmd command) {
    return WriteComputedCommand(command);
}

// Opcodes built from caller data (RAM address, pulse mask) bypass the enum.
ControllerError PS2Controller::WriteComputedCommand(uint8_t command) {
    ControllerError err = WaitForWrite();
    if (!err.IsOk()) return err;
    m_cmd->Write(command);
    return ControllerError::Ok();
}

ControllerError PS2Controller::ReadInternalRam(uint8_t byteNumber, uint8_t& data) {
    uint8_t command = PS2_CMD_READ_RAM | (byteNumber & PS2_RAM_ADDRESS_MASK);
    ControllerError err = WriteComputedCommand(command);
    if (!err.IsOk()) return err;
    return ReadData(data);
}

ControllerError PS2Controller::WriteInternalRam(uint8_t byteNumber, uint8_t data) {
    uint8_t command = PS2_CMD_WRITE_RAM | (byteNumber & PS2_RAM_ADDRESS_MASK);
    ControllerError err = WriteComputedCommand(command);
    if (!err.IsOk()) return err;
    return WriteData(data);
}

ControllerError PS2Controller::ReadConfig(ControllerConfig& config) {
    uint8_t raw = 0;
    ControllerError err = ReadInternalRam(PS2_RAM_CONFIG_BYTE, raw);
    if (!err.IsOk()) return err;
    config = ControllerConfig::FromBitsTruncate(raw);
    return ControllerError::Ok();
}

ControllerError PS2Controller::WriteConfig(ControllerConfig config) {
    return WriteInternalRam(PS2_RAM_CONFIG_BYTE, config.Bits());
}

ControllerError PS2Controller::DisableKeyboard() { return WriteCommand(PS2_CMD_DISABLE_KEYBOARD); }
ControllerError PS2Controller::EnableKeyboard()  { return WriteCommand(PS2_CMD_ENABLE_KEYBOARD); }
ControllerError PS2Controller::DisableMouse()    { return WriteCommand(PS2_CMD_DISABLE_MOUSE); }
ControllerError PS2Controller::EnableMouse()     { return WriteCommand(PS2_CMD_ENABLE_MOUSE); }

ControllerError PS2Controller::ExpectTestResult(PS2Cmd command, uint8_t passed, const char* what) {
    ControllerError err = WriteCommand(command);
    if (!err.IsOk()) return err;
    uint8_t response = 0;
    err = ReadData(response);
    if (!err.IsOk()) return err;
    if (response != passed) {
        Logger::LogHex(what, response);
        return ControllerError::TestFailed(response);
    }
    return ControllerError::Ok();
}

ControllerError PS2Controller::TestController() {
    return ExpectTestResult(PS2_CMD_TEST_CONTROLLER, PS2_CONTROLLER_TEST_PASSED,
                            "[PS2] controller self-test failed");
}

ControllerError PS2Controller::TestKeyboard() {
    return ExpectTestResult(PS2_CMD_TEST_KEYBOARD, PS2_PORT_TEST_PASSED,
                            "[PS2] keyboard port test failed");
}

ControllerError PS2Controller::TestMouse() {
    return ExpectTestResult(PS2_CMD_TEST_MOUSE, PS2_PORT_TEST_PASSED,
                            "[PS2] mouse port test failed");
}

ControllerError PS2Controller::DiagnosticDump(uint8_t (&dump)[PS2_RAM_SIZE]) {
    ControllerError err = WriteCommand(PS2_CMD_DIAGNOSTIC_DUMP);
    if (!err.IsOk()) return err;
    for (uint8_t i = 0; i < PS2_RAM_SIZE; ++i) {
        err = ReadData(dump[i]);
        if (!err.IsOk()) return err;
    }
    return ControllerError::Ok();
}

ControllerError PS2Controller::ReadInputPort(ControllerInput& input) {
    ControllerError err = WriteCommand(PS2_CMD_READ_INPUT_PORT);
    if (!err.IsOk()) return err;
    uint8_t raw = 0;
    err = ReadData(raw);
    if (!err.IsOk()) return err;
    input = ControllerInput::FromBitsTruncate(raw);
    return ControllerError::Ok();
}

ControllerError PS2Controller::WriteInputLowNibbleToStatus()  { return WriteCommand(PS2_CMD_INPUT_LOW_TO_STATUS); }
ControllerError PS2Controller::WriteInputHighNibbleToStatus() { return WriteCommand(PS2_CMD_INPUT_HIGH_TO_STATUS); }

ControllerError PS2Controller::ReadOutputPort(ControllerOutput& output) {
    ControllerError err = WriteCommand(PS2_CMD_READ_OUTPUT_PORT);
    if (!err.IsOk()) return err;
    uint8_t raw = 0;
    err = ReadData(raw);
    if (!err.IsOk()) return err;
    output = ControllerOutput::FromBitsTruncate(raw);
    return ControllerError::Ok();
}

ControllerError PS2Controller::WriteOutputPort(ControllerOutput output) {
    ControllerError err = WriteCommand(PS2_CMD_WRITE_OUTPUT_PORT);
    if (!err.IsOk()) return err;
    return WriteData(output.Bits());
}

ControllerError PS2Controller::ReadTestPort(ControllerTestPort& test) {
    ControllerError err = WriteCommand(PS2_CMD_READ_TEST_PORT);
    if (!err.IsOk()) return err;
    uint8_t raw = 0;
    err = ReadData(raw);
    if (!err.IsOk()) return err;
    test = ControllerTestPort::FromBitsTruncate(raw);
    return ControllerError::Ok();
}

ControllerError PS2Controller::WriteKeyboardBuffer(uint8_t value) {
    ControllerError err = WriteCommand(PS2_CMD_WRITE_KEYBOARD_BUFFER);
    if (!err.IsOk()) return err;
    return WriteData(value);
}

ControllerError PS2Controller::WriteMouseBuffer(uint8_t value) {
    ControllerError err = WriteCommand(PS2_CMD_WRITE_MOUSE_BUFFER);
    if (!err.IsOk()) return err;
    return WriteData(value);
}

ControllerError PS2Controller::WriteToMouse(uint8_t value) {
    ControllerError err = WriteCommand(PS2_CMD_WRITE_TO_MOUSE);
    if (!err.IsOk()) return err;
    return WriteData(value);
}

ControllerError PS2Controller::PulseOutputLowNibble(uint8_t mask) {
    return WriteComputedCommand(PS2_CMD_PULSE_OUTPUT | mask);
}

uint32_t PS2Controller::FlushOutput() {
    uint32_t dropped = 0;
    while (dropped < m_timeout && ReadStatus().Contains(PS2_STATUS_OUTPUT_FULL)) {
        (void)m_data->Read();
        ++dropped;
    }
    if (dropped) Logger::Debug("[PS2] flushed stale output");
    return dropped;
}
