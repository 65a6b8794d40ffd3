#pragma once

#ifndef  __I8042__DRIVERS__KEYBOARD__KEYBOARD_H
#define  __I8042__DRIVERS__KEYBOARD__KEYBOARD_H

#include <common/types.hpp>
#include <drivers/ps2/ps2.hpp>
#include <drivers/ps2/ps2_error.hpp>
#include <drivers/ps2/ps2_flags.hpp>
#include <drivers/keyboard/keyboard_constants.hpp>
#include <drivers/keyboard/keyboard_type.hpp>

using namespace i8042::common;
using namespace i8042::drivers::ps2;

namespace i8042
{
    namespace drivers
    {
        namespace keyboard
        {
            /*
            * @brief PS/2 keyboard on the first controller port.
            *
            * Every command is an acknowledgment cycle: the opcode goes out through the
            * data register and one reply byte comes back. ACK is success, RESEND is
            * reported and not retried, 0x00/0xFF are key detection failures, anything
            * else is an invalid response. Commands with a parameter run a second cycle
            * for the data byte.
            *
            * A Keyboard is a short-lived handle; each operation leases the controller
            * for its whole exchange.
            */
            class Keyboard
            {
                public:
                    explicit Keyboard(PS2Controller& controller);

                    KeyboardError SetLeds(KeyboardLeds leds);
                    KeyboardError Echo();

                    // Set is 1, 2 or 3
                    KeyboardError GetScancodeSet(uint8_t& set);
                    KeyboardError SetScancodeSet(uint8_t set);

                    KeyboardError GetKeyboardType(KeyboardType& type);

                    /*
                    * @brief Program key repeat.
                    * @param rateHz 2.0 to 30.0 repeats per second
                    * @param delayMs 250, 500, 750 or 1000
                    * Nothing is sent when either value is out of range.
                    */
                    KeyboardError SetTypematicRateAndDelay(float rateHz, uint16_t delayMs);

                    KeyboardError EnableScanning();
                    KeyboardError DisableScanning();
                    KeyboardError SetDefaults();

                    // Only honoured by keyboards running scancode set 3
                    KeyboardError SetAllKeysTypematic();
                    KeyboardError SetAllKeysMakeBreak();
                    KeyboardError SetAllKeysMakeOnly();
                    KeyboardError SetAllKeysTypematicMakeBreak();
                    KeyboardError SetKeyTypematic(uint8_t scancode);
                    KeyboardError SetKeyMakeBreak(uint8_t scancode);
                    KeyboardError SetKeyMakeOnly(uint8_t scancode);

                    // The keyboard answers with the byte it sent last. A RESEND in
                    // reply is an error: there is nothing to resend.
                    KeyboardError ResendLastByte(uint8_t& byte);

                    KeyboardError ResetAndSelfTest();

                    // Pack rate and delay into the typematic data byte.
                    static KeyboardError EncodeTypematic(float rateHz, uint16_t delayMs, uint8_t& encoded);

                private:
                    KeyboardError CheckResponse();
                    KeyboardError SendCommand(KeyboardCommand command);
                    KeyboardError SendCommand(KeyboardCommand command, uint8_t data);
                    KeyboardError Leased(KeyboardCommand command);
                    KeyboardError Leased(KeyboardCommand command, uint8_t data);

                    PS2Controller& m_controller;
            };
    
        }   // namespace keyboard
    }   // namespace drivers
}   // namespace i8042

#endif
