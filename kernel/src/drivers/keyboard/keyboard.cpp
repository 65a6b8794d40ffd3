#include <drivers/keyboard/keyboard.hpp>
#include <console/logger.hpp>

using namespace i8042::drivers::keyboard;
using namespace i8042::drivers::ps2;
using i8042::console::Logger;

namespace {
    // Valid initial delays, indexed by the value of bits 5-6
    const uint16_t kTypematicDelays[KBD_TYPEMATIC_DELAY_COUNT] = { 250, 500, 750, 1000 };
}

Keyboard::Keyboard(PS2Controller& controller)
    : m_controller(controller)
{
}

KeyboardError Keyboard::CheckResponse()
{
    uint8_t response = 0;
    ControllerError err = m_controller.ReadData(response);
    if (!err.IsOk()) return KeyboardError::FromController(err);

    switch (response) {
        case PS2_RESPONSE_ACK:
            return KeyboardError::Ok();
        case PS2_RESPONSE_RESEND:
            Logger::Debug("[KBD] device asked for resend");
            return KeyboardError::Of(KeyboardError::RESEND, response);
        case PS2_RESPONSE_BUFFER_OVERRUN:
        case PS2_RESPONSE_KEY_DETECTION_ERROR:
            return KeyboardError::Of(KeyboardError::KEY_DETECTION_ERROR, response);
        default:
            Logger::DebugHex("[KBD] unexpected reply", response);
            return KeyboardError::Of(KeyboardError::INVALID_RESPONSE, response);
    }
}

KeyboardError Keyboard::SendCommand(KeyboardCommand command)
{
    ControllerError err = m_controller.WriteData(command);
    if (!err.IsOk()) return KeyboardError::FromController(err);
    return CheckResponse();
}

KeyboardError Keyboard::SendCommand(KeyboardCommand command, uint8_t data)
{
    KeyboardError result = SendCommand(command);
    if (!result.IsOk()) return result;
    ControllerError err = m_controller.WriteData(data);
    if (!err.IsOk()) return KeyboardError::FromController(err);
    return CheckResponse();
}

KeyboardError Keyboard::Leased(KeyboardCommand command)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return KeyboardError::FromController(ControllerError::Busy());
    return SendCommand(command);
}

KeyboardError Keyboard::Leased(KeyboardCommand command, uint8_t data)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return KeyboardError::FromController(ControllerError::Busy());
    return SendCommand(command, data);
}

KeyboardError Keyboard::SetLeds(KeyboardLeds leds)
{
    return Leased(KBD_CMD_SET_LEDS, leds.Bits());
}

// Echo is not acknowledged; the keyboard answers with the echo byte itself.
KeyboardError Keyboard::Echo()
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return KeyboardError::FromController(ControllerError::Busy());

    ControllerError err = m_controller.WriteData(KBD_CMD_ECHO);
    if (!err.IsOk()) return KeyboardError::FromController(err);
    uint8_t response = 0;
    err = m_controller.ReadData(response);
    if (!err.IsOk()) return KeyboardError::FromController(err);

    if (response == PS2_RESPONSE_ECHO) return KeyboardError::Ok();
    if (response == PS2_RESPONSE_RESEND) return KeyboardError::Of(KeyboardError::RESEND, response);
    return KeyboardError::Of(KeyboardError::INVALID_RESPONSE, response);
}

KeyboardError Keyboard::GetScancodeSet(uint8_t& set)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return KeyboardError::FromController(ControllerError::Busy());

    KeyboardError result = SendCommand(KBD_CMD_GET_SET_SCANCODE, KBD_SCANCODE_SET_QUERY);
    if (!result.IsOk()) return result;
    // Plain data, not a handshake byte
    return KeyboardError::FromController(m_controller.ReadData(set));
}

KeyboardError Keyboard::SetScancodeSet(uint8_t set)
{
    if (set < KBD_SCANCODE_SET_MIN || set > KBD_SCANCODE_SET_MAX)
        return KeyboardError::Of(KeyboardError::INVALID_SCANCODE_SET, set);
    return Leased(KBD_CMD_GET_SET_SCANCODE, set);
}

KeyboardError Keyboard::GetKeyboardType(KeyboardType& type)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return KeyboardError::FromController(ControllerError::Busy());

    KeyboardError result = SendCommand(KBD_CMD_IDENTIFY);
    if (result.kind == KeyboardError::RESEND) {
        // XT keyboards never acknowledge identify
        type = KeyboardType(KeyboardType::XT, 0, 0);
        Logger::DebugKV("[KBD] type", type.Name());
        return KeyboardError::Ok();
    }
    if (!result.IsOk()) return result;

    uint8_t first = 0;
    ControllerError err = m_controller.ReadData(first);
    if (err.kind == ControllerError::TIMEOUT) {
        // AT keyboards behind translation send no identification bytes
        type = KeyboardType(KeyboardType::AT_WITH_TRANSLATION, 0, 0);
        Logger::DebugKV("[KBD] type", type.Name());
        return KeyboardError::Ok();
    }
    if (!err.IsOk()) return KeyboardError::FromController(err);

    uint8_t second = 0;
    err = m_controller.ReadData(second);
    if (!err.IsOk()) return KeyboardError::FromController(err);

    type = KeyboardType::FromIdentification(first, second);
    Logger::DebugKV("[KBD] type", type.Name());
    return KeyboardError::Ok();
}

KeyboardError Keyboard::EncodeTypematic(float rateHz, uint16_t delayMs, uint8_t& encoded)
{
    // Written so that NaN fails the range check
    if (!(rateHz >= KBD_TYPEMATIC_RATE_MIN && rateHz <= KBD_TYPEMATIC_RATE_MAX))
        return KeyboardError::InvalidRate(rateHz);

    int delayIndex = -1;
    for (int i = 0; i < KBD_TYPEMATIC_DELAY_COUNT; ++i) {
        if (kTypematicDelays[i] == delayMs) {
            delayIndex = i;
            break;
        }
    }
    if (delayIndex < 0)
        return KeyboardError::InvalidDelay(delayMs);

    // 30 Hz is step 0, 2 Hz is step 31. scaled is never negative here, so
    // adding one half and truncating rounds to nearest.
    float step = (KBD_TYPEMATIC_RATE_MAX - KBD_TYPEMATIC_RATE_MIN) / KBD_TYPEMATIC_RATE_STEPS;
    float scaled = (KBD_TYPEMATIC_RATE_MAX - rateHz) / step;
    uint8_t rateBits = (uint8_t)((int)(scaled + 0.5f)) & KBD_TYPEMATIC_RATE_MASK;

    encoded = (uint8_t)(rateBits | (delayIndex << KBD_TYPEMATIC_DELAY_SHIFT));
    return KeyboardError::Ok();
}

KeyboardError Keyboard::SetTypematicRateAndDelay(float rateHz, uint16_t delayMs)
{
    uint8_t encoded = 0;
    KeyboardError result = EncodeTypematic(rateHz, delayMs, encoded);
    if (!result.IsOk()) return result;
    return Leased(KBD_CMD_SET_TYPEMATIC, encoded);
}

KeyboardError Keyboard::EnableScanning()               { return Leased(KBD_CMD_ENABLE_SCANNING); }
KeyboardError Keyboard::DisableScanning()              { return Leased(KBD_CMD_DISABLE_SCANNING); }
KeyboardError Keyboard::SetDefaults()                  { return Leased(KBD_CMD_SET_DEFAULTS); }
KeyboardError Keyboard::SetAllKeysTypematic()          { return Leased(KBD_CMD_SET_ALL_TYPEMATIC); }
KeyboardError Keyboard::SetAllKeysMakeBreak()          { return Leased(KBD_CMD_SET_ALL_MAKE_BREAK); }
KeyboardError Keyboard::SetAllKeysMakeOnly()           { return Leased(KBD_CMD_SET_ALL_MAKE_ONLY); }
KeyboardError Keyboard::SetAllKeysTypematicMakeBreak() { return Leased(KBD_CMD_SET_ALL_TYPEMATIC_MAKE_BREAK); }

KeyboardError Keyboard::SetKeyTypematic(uint8_t scancode) { return Leased(KBD_CMD_SET_KEY_TYPEMATIC, scancode); }
KeyboardError Keyboard::SetKeyMakeBreak(uint8_t scancode) { return Leased(KBD_CMD_SET_KEY_MAKE_BREAK, scancode); }
KeyboardError Keyboard::SetKeyMakeOnly(uint8_t scancode)  { return Leased(KBD_CMD_SET_KEY_MAKE_ONLY, scancode); }

KeyboardError Keyboard::ResendLastByte(uint8_t& byte)
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return KeyboardError::FromController(ControllerError::Busy());

    ControllerError err = m_controller.WriteData(KBD_CMD_RESEND);
    if (!err.IsOk()) return KeyboardError::FromController(err);
    uint8_t response = 0;
    err = m_controller.ReadData(response);
    if (!err.IsOk()) return KeyboardError::FromController(err);
    if (response == PS2_RESPONSE_RESEND) return KeyboardError::Of(KeyboardError::RESEND, response);
    byte = response;
    return KeyboardError::Ok();
}

KeyboardError Keyboard::ResetAndSelfTest()
{
    ControllerLease lease(m_controller);
    if (!lease.Acquired()) return KeyboardError::FromController(ControllerError::Busy());

    KeyboardError result = SendCommand(KBD_CMD_RESET);
    if (!result.IsOk()) return result;

    uint8_t response = 0;
    ControllerError err = m_controller.ReadData(response);
    if (!err.IsOk()) return KeyboardError::FromController(err);

    switch (response) {
        case PS2_RESPONSE_SELF_TEST_PASSED:
            return KeyboardError::Ok();
        case PS2_RESPONSE_SELF_TEST_FAILED:
            Logger::LogStatus("[KBD] keyboard self-test", false);
            return KeyboardError::Of(KeyboardError::SELF_TEST_FAILED, response);
        case PS2_RESPONSE_RESEND:
            return KeyboardError::Of(KeyboardError::RESEND, response);
        default:
            return KeyboardError::Of(KeyboardError::INVALID_RESPONSE, response);
    }
}
