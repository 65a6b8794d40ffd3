#include <drivers/ps2/ps2_error.hpp>

using namespace i8042::drivers::ps2;

const char* ControllerError::Name() const
{
    switch (kind) {
        case NONE:        return "ok";
        case TIMEOUT:     return "timeout";
        case WOULD_BLOCK: return "would block";
        case TEST_FAILED: return "test failed";
        case BUSY:        return "busy";
    }
    return "unknown";
}

KeyboardError KeyboardError::Of(Kind k, uint8_t response)
{
    KeyboardError err;
    err.kind = k;
    err.response = response;
    return err;
}

KeyboardError KeyboardError::InvalidRate(float rate)
{
    KeyboardError err;
    err.kind = INVALID_TYPEMATIC_RATE;
    err.rate = rate;
    return err;
}

KeyboardError KeyboardError::InvalidDelay(uint16_t delay)
{
    KeyboardError err;
    err.kind = INVALID_TYPEMATIC_DELAY;
    err.delay = delay;
    return err;
}

KeyboardError KeyboardError::FromController(ControllerError cause)
{
    if (cause.IsOk()) return KeyboardError();
    KeyboardError err;
    err.kind = CONTROLLER;
    err.controller = cause;
    return err;
}

const char* KeyboardError::Name() const
{
    switch (kind) {
        case NONE:                    return "ok";
        case RESEND:                  return "resend";
        case SELF_TEST_FAILED:        return "self-test failed";
        case KEY_DETECTION_ERROR:     return "key detection error";
        case INVALID_RESPONSE:        return "invalid response";
        case INVALID_TYPEMATIC_RATE:  return "invalid typematic rate";
        case INVALID_TYPEMATIC_DELAY: return "invalid typematic delay";
        case INVALID_SCANCODE_SET:    return "invalid scancode set";
        case CONTROLLER:              return controller.Name();
    }
    return "unknown";
}

MouseError MouseError::Of(Kind k, uint8_t response)
{
    MouseError err;
    err.kind = k;
    err.response = response;
    return err;
}

MouseError MouseError::FromController(ControllerError cause)
{
    if (cause.IsOk()) return MouseError();
    MouseError err;
    err.kind = CONTROLLER;
    err.controller = cause;
    return err;
}

const char* MouseError::Name() const
{
    switch (kind) {
        case NONE:                return "ok";
        case RESEND:              return "resend";
        case SELF_TEST_FAILED:    return "self-test failed";
        case INVALID_RESPONSE:    return "invalid response";
        case INVALID_RESOLUTION:  return "invalid resolution";
        case INVALID_SAMPLE_RATE: return "invalid sample rate";
        case CONTROLLER:          return controller.Name();
    }
    return "unknown";
}
