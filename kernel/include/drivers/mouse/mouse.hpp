#pragma once
#ifndef  __I8042__DRIVERS__MOUSE__MOUSE_H
#define  __I8042__DRIVERS__MOUSE__MOUSE_H

#include <common/types.hpp>
#include <drivers/ps2/ps2.hpp>
#include <drivers/ps2/ps2_error.hpp>
#include <drivers/ps2/ps2_flags.hpp>
#include <drivers/mouse/mouse_constants.hpp>
#include <drivers/mouse/mouse_type.hpp>

using namespace i8042::common;
using namespace i8042::drivers::ps2;

namespace i8042{
    namespace drivers{
        namespace mouse{

            // Decoded movement packet. Deltas are the full 9-bit signed values.
            struct MousePacket
            {
                MouseMovement flags;
                int16_t x;
                int16_t y;
            };

            // Reply to a status request, with resolution already mapped to counts/mm
            struct MouseStatusPacket
            {
                MouseStatus status;
                uint8_t resolution;
                uint8_t sampleRate;
            };
        
            /*
            * @brief PS/2 mouse on the auxiliary port.
            *
            * Same acknowledgment cycle as the keyboard, but every byte, parameters
            * included, is routed with PS2_CMD_WRITE_TO_MOUSE first. Each operation
            * leases the controller for its whole exchange.
            */
            class Mouse
            {
                public:
                    explicit Mouse(PS2Controller& controller);

                    MouseError SetScalingOneToOne();
                    MouseError SetScalingTwoToOne();

                    /*
                    @ brief Set counts per millimetre.
                    @ param countsPerMm 1, 2, 4 or 8. Anything else is rejected before a byte is sent.
                    */
                    MouseError SetResolution(uint8_t countsPerMm);

                    /*
                    @ brief Set samples per second.
                    @ param rate 10, 20, 40, 60, 80, 100 or 200. Anything else is rejected before a byte is sent.
                    */
                    MouseError SetSampleRate(uint8_t rate);

                    MouseError GetStatusPacket(MouseStatusPacket& packet);

                    MouseError SetStreamMode();
                    MouseError SetRemoteMode();
                    MouseError SetWrapMode();
                    MouseError ResetWrapMode();

                    // Ask for a packet (remote mode, polling)
                    MouseError RequestDataPacket(MousePacket& packet);
                    // Read a packet that is already pending (stream mode, from the IRQ12 handler)
                    MouseError ReadDataPacket(MousePacket& packet);

                    MouseError GetMouseType(MouseType& type);

                    MouseError EnableDataReporting();
                    MouseError DisableDataReporting();
                    MouseError SetDefaults();

                    /*
                    @ brief Ask the mouse to send its last packet again.
                    @ param firstByte First byte of the resent packet. The remaining
                    bytes are left in the buffer for the caller to drain with ReadData.
                    */
                    MouseError ResendLastPacket(uint8_t& firstByte);

                    // Also consumes the device ID byte that follows every reset
                    MouseError ResetAndSelfTest();

                    static MousePacket DecodePacket(uint8_t flags, uint8_t x, uint8_t y);

                    static bool ResolutionToIndex(uint8_t countsPerMm, uint8_t& index);
                    static bool IndexToResolution(uint8_t index, uint8_t& countsPerMm);
                    static bool IsValidSampleRate(uint8_t rate);

                private:
                    MouseError CheckResponse();
                    MouseError SendCommand(MouseCommand command);
                    MouseError SendCommand(MouseCommand command, uint8_t data);
                    MouseError Leased(MouseCommand command);
                    MouseError Leased(MouseCommand command, uint8_t data);
                    MouseError ReadPacketBytes(MousePacket& packet);

                    PS2Controller& m_controller;
            };
        }
    }
}
#endif
