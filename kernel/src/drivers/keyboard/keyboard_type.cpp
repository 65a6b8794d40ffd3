#include <drivers/keyboard/keyboard_type.hpp>
#include <drivers/keyboard/keyboard_constants.hpp>

using namespace i8042::drivers::keyboard;

// See https://www.win.tue.nl/~aeb/linux/kbd/scancodes-10.html#ss10.3
KeyboardType KeyboardType::FromIdentification(uint8_t first, uint8_t second)
{
    Kind kind = UNKNOWN;
    if (first == KBD_ID_MF2_PREFIX) {
        switch (second) {
            case 0x83: kind = MF2; break;
            case 0x41:
            case 0xC1: kind = MF2_WITH_TRANSLATION; break;
            case 0x84: kind = THINKPAD; break;
            case 0x54: kind = THINKPAD_WITH_TRANSLATION; break;
            case 0x85: kind = NCD_N97; break;
            case 0x86: kind = KEY_122; break;
            case 0x90: kind = OLD_JAPANESE_G; break;
            case 0x91: kind = OLD_JAPANESE_P; break;
            case 0x92: kind = OLD_JAPANESE_A; break;
            default: break;
        }
    } else if (first == 0xBF && second == 0xBF) {
        kind = IBM_1390876;
    } else if (first == 0xAC && second == 0xA1) {
        kind = NCD_SUN_LAYOUT;
    }
    return KeyboardType(kind, first, second);
}

const char* KeyboardType::Name() const
{
    switch (kind) {
        case XT:                        return "XT";
        case AT_WITH_TRANSLATION:       return "AT (translated)";
        case MF2:                       return "MF2";
        case MF2_WITH_TRANSLATION:      return "MF2 (translated)";
        case THINKPAD:                  return "ThinkPad";
        case THINKPAD_WITH_TRANSLATION: return "ThinkPad (translated)";
        case KEY_122:                   return "122-key";
        case IBM_1390876:               return "IBM 1390876";
        case NCD_N97:                   return "NCD N-97";
        case NCD_SUN_LAYOUT:            return "NCD Sun layout";
        case OLD_JAPANESE_G:            return "Japanese G";
        case OLD_JAPANESE_P:            return "Japanese P";
        case OLD_JAPANESE_A:            return "Japanese A";
        case UNKNOWN:                   return "unknown";
    }
    return "unknown";
}
