//View https://wiki.osdev.org/PS/2_Mouse

#include <drivers/mouse/mouse.hpp>
#include <console/logger.hpp>

using namespace i8042::common;
using namespace i8042::drivers::ps2;
using namespace i8042::drivers::mouse;
using i8042::console::Logger;

Mouse::Mouse(PS2Controller& controller)
    : m_controller(controller)
{
}

MouseError Mouse::CheckResponse()
{
    uint8_t response = 0;
    ControllerError err = m_controller.ReadData(response);
    if (!err.IsOk()) return MouseError::FromController(err);

    if (response == PS2_RESPONSE_ACK) return MouseError::Ok();
    if (response == PS2_RESPONSE_RESEND) {
        Logger::Debug("[MOUSE] device asked for resend");
        return MouseError::Of(MouseError::RESEND, response);
    }
    Logger::DebugHex("[MOUSE] unexpected reply", response);
    return MouseError::Of(MouseError::INVALID_RESPONSE, response);
}

MouseError Mouse::SendCommand(MouseCommand command)
{
    ControllerError err = m_controller.WriteToMouse(command);
    if (!err.IsOk()) return MouseError::FromController(err);
    return CheckResponse();
}

// Unlike a plain data write, the parameter byte gets its own 0xD4; without it
// the controller hands the byte to the keyboard.
MouseError Mouse::SendCommand(MouseCommand command, uint8_t data)
{
    MouseError result = SendCommand(command);
    if (!result.IsOk()) return result;
    ControllerError err = m_controller.WriteToMouse(data);
    if (!err.IsOk()) return MouseError::FromController(err);
    return CheckResponse();
}

MouseError Mouse::Leased(MouseCommand command)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return MouseError::FromController(ControllerError::Busy());
    return SendCommand(command);
}

MouseError Mouse::Leased(MouseCommand command, uint8_t data)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return MouseError::FromController(ControllerError::Busy());
    return SendCommand(command, data);
}

bool Mouse::ResolutionToIndex(uint8_t countsPerMm, uint8_t& index)
{
    for (uint8_t i = 0; i < MOUSE_RESOLUTION_COUNT; ++i) {
        if (MOUSE_RESOLUTIONS[i] == countsPerMm) {
            index = i;
            return true;
        }
    }
    return false;
}

bool Mouse::IndexToResolution(uint8_t index, uint8_t& countsPerMm)
{
    if (index >= MOUSE_RESOLUTION_COUNT) return false;
    countsPerMm = MOUSE_RESOLUTIONS[index];
    return true;
}

bool Mouse::IsValidSampleRate(uint8_t rate)
{
    for (uint8_t i = 0; i < MOUSE_SAMPLE_RATE_COUNT; ++i) {
        if (MOUSE_SAMPLE_RATES[i] == rate) return true;
    }
    return false;
}

MousePacket Mouse::DecodePacket(uint8_t flags, uint8_t x, uint8_t y)
{
    MousePacket packet;
    packet.flags = MouseMovement::FromBitsTruncate(flags);

    // 9-bit two's complement: the ninth bit lives in the flags byte
    uint16_t rawX = x;
    uint16_t rawY = y;
    if (packet.flags.Contains(MOUSE_MOVE_X_SIGN)) rawX |= MOUSE_SIGN_EXTEND;
    if (packet.flags.Contains(MOUSE_MOVE_Y_SIGN)) rawY |= MOUSE_SIGN_EXTEND;
    packet.x = (int16_t)rawX;
    packet.y = (int16_t)rawY;
    return packet;
}

MouseError Mouse::SetScalingOneToOne()   { return Leased(MOUSE_CMD_SET_SCALING_1_1); }
MouseError Mouse::SetScalingTwoToOne()   { return Leased(MOUSE_CMD_SET_SCALING_2_1); }
MouseError Mouse::SetStreamMode()        { return Leased(MOUSE_CMD_SET_STREAM_MODE); }
MouseError Mouse::SetRemoteMode()        { return Leased(MOUSE_CMD_SET_REMOTE_MODE); }
MouseError Mouse::SetWrapMode()          { return Leased(MOUSE_CMD_SET_WRAP_MODE); }
MouseError Mouse::ResetWrapMode()        { return Leased(MOUSE_CMD_RESET_WRAP_MODE); }
MouseError Mouse::EnableDataReporting()  { return Leased(MOUSE_CMD_ENABLE_DATA_REPORTING); }
MouseError Mouse::DisableDataReporting() { return Leased(MOUSE_CMD_DISABLE_DATA_REPORTING); }
MouseError Mouse::SetDefaults()          { return Leased(MOUSE_CMD_SET_DEFAULTS); }

MouseError Mouse::SetResolution(uint8_t countsPerMm)
{
    uint8_t index = 0;
    if (!ResolutionToIndex(countsPerMm, index))
        return MouseError::Of(MouseError::INVALID_RESOLUTION, countsPerMm);
    return Leased(MOUSE_CMD_SET_RESOLUTION, index);
}

MouseError Mouse::SetSampleRate(uint8_t rate)
{
    if (!IsValidSampleRate(rate))
        return MouseError::Of(MouseError::INVALID_SAMPLE_RATE, rate);
    return Leased(MOUSE_CMD_SET_SAMPLE_RATE, rate);
}

MouseError Mouse::GetStatusPacket(MouseStatusPacket& packet)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return MouseError::FromController(ControllerError::Busy());

    MouseError result = SendCommand(MOUSE_CMD_STATUS_REQUEST);
    if (!result.IsOk()) return result;

    uint8_t bytes[MOUSE_STATUS_PACKET_SIZE];
    for (uint8_t i = 0; i < MOUSE_STATUS_PACKET_SIZE; ++i) {
        ControllerError err = m_controller.ReadData(bytes[i]);
        if (!err.IsOk()) return MouseError::FromController(err);
    }

    uint8_t resolution = 0;
    if (!IndexToResolution(bytes[1], resolution))
        return MouseError::Of(MouseError::INVALID_RESOLUTION, bytes[1]);
    if (!IsValidSampleRate(bytes[2]))
        return MouseError::Of(MouseError::INVALID_SAMPLE_RATE, bytes[2]);

    packet.status = MouseStatus::FromBitsTruncate(bytes[0]);
    packet.resolution = resolution;
    packet.sampleRate = bytes[2];
    return MouseError::Ok();
}

MouseError Mouse::ReadPacketBytes(MousePacket& packet)
{
    uint8_t bytes[MOUSE_PACKET_SIZE];
    for (uint8_t i = 0; i < MOUSE_PACKET_SIZE; ++i) {
        ControllerError err = m_controller.ReadData(bytes[i]);
        if (!err.IsOk()) return MouseError::FromController(err);
    }
    packet = DecodePacket(bytes[0], bytes[1], bytes[2]);
    return MouseError::Ok();
}

MouseError Mouse::RequestDataPacket(MousePacket& packet)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return MouseError::FromController(ControllerError::Busy());

    MouseError result = SendCommand(MOUSE_CMD_READ_DATA);
    if (!result.IsOk()) return result;
    return ReadPacketBytes(packet);
}

MouseError Mouse::ReadDataPacket(MousePacket& packet)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return MouseError::FromController(ControllerError::Busy());
    return ReadPacketBytes(packet);
}

MouseError Mouse::GetMouseType(MouseType& type)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return MouseError::FromController(ControllerError::Busy());

    MouseError result = SendCommand(MOUSE_CMD_GET_DEVICE_ID);
    if (!result.IsOk()) return result;

    uint8_t id = 0;
    ControllerError err = m_controller.ReadData(id);
    if (!err.IsOk()) return MouseError::FromController(err);

    type = MouseType::FromId(id);
    Logger::DebugKV("[MOUSE] type", type.Name());
    return MouseError::Ok();
}

MouseError Mouse::ResendLastPacket(uint8_t& firstByte)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return MouseError::FromController(ControllerError::Busy());

    ControllerError err = m_controller.WriteToMouse(MOUSE_CMD_RESEND);
    if (!err.IsOk()) return MouseError::FromController(err);

    uint8_t response = 0;
    err = m_controller.ReadData(response);
    if (!err.IsOk()) return MouseError::FromController(err);
    if (response == PS2_RESPONSE_RESEND) return MouseError::Of(MouseError::RESEND, response);
    firstByte = response;
    return MouseError::Ok();
}

MouseError Mouse::ResetAndSelfTest()
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return MouseError::FromController(ControllerError::Busy());

    MouseError result = SendCommand(MOUSE_CMD_RESET);
    if (!result.IsOk()) return result;

    uint8_t response = 0;
    ControllerError err = m_controller.ReadData(response);
    if (!err.IsOk()) return MouseError::FromController(err);

    switch (response) {
        case PS2_RESPONSE_SELF_TEST_PASSED:
            break;
        case PS2_RESPONSE_SELF_TEST_FAILED:
            Logger::LogStatus("[MOUSE] mouse self-test", false);
            result = MouseError::Of(MouseError::SELF_TEST_FAILED, response);
            break;
        case PS2_RESPONSE_RESEND:
            result = MouseError::Of(MouseError::RESEND, response);
            break;
        default:
            result = MouseError::Of(MouseError::INVALID_RESPONSE, response);
            break;
    }

    // The device ID always follows; drain it whatever the outcome
    uint8_t id = 0;
    err = m_controller.ReadData(id);
    if (!err.IsOk()) return MouseError::FromController(err);
    return result;
}
