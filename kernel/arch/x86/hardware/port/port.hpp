#pragma once

#ifndef __I8042__ARCH__X86__HARDWARE__PORT_H
#define __I8042__ARCH__X86__HARDWARE__PORT_H

#include <common/types.hpp>
// Well-known 8042 port numbers travel with the port classes so consumers do
// not need the arch-specific path.
#include "port_constants.hpp"

using namespace i8042::common;    

namespace i8042
{
    namespace arch
    {
        namespace x86
        {
            namespace hardware
            {
                namespace port
                {
                    /*
                    *  @brief Represents a hardware I/O port
                    *  Only the port number lives here; width-specific subclasses
                    *  decide how a transfer is issued.
                    */
                    class Port
                    {
            
                        protected:
                            /*
                            *@brief Constructs a Port object
                            *@param portnumber The port number to use
                            */
                            Port(uint16_t portnumber);
                
                            /*
                            *@brief Destroys a Port object
                            */
                            ~Port();
                
                            // The port number associated with this Port instance
                            uint16_t portnumber;

                        public:
                            uint16_t Number() const { return portnumber; }
                    };
                } // namespace port
            } // namespace hardware
        } // namespace x86
    } // namespace arch
}
#endif
