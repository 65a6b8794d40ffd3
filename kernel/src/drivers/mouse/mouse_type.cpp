#include <drivers/mouse/mouse_type.hpp>
#include <drivers/mouse/mouse_constants.hpp>

using namespace i8042::drivers::mouse;

MouseType MouseType::FromId(uint8_t id)
{
    switch (id) {
        case MOUSE_ID_STANDARD:              return MouseType(STANDARD, id);
        case MOUSE_ID_INTELLIMOUSE:          return MouseType(INTELLIMOUSE, id);
        case MOUSE_ID_INTELLIMOUSE_EXPLORER: return MouseType(INTELLIMOUSE_EXPLORER, id);
        case MOUSE_ID_TYPHOON:               return MouseType(TYPHOON, id);
        default:                             return MouseType(UNKNOWN, id);
    }
}

const char* MouseType::Name() const
{
    switch (kind) {
        case STANDARD:              return "standard";
        case INTELLIMOUSE:          return "IntelliMouse";
        case INTELLIMOUSE_EXPLORER: return "IntelliMouse Explorer";
        case TYPHOON:               return "Typhoon";
        case UNKNOWN:               return "unknown";
    }
    return "unknown";
}
