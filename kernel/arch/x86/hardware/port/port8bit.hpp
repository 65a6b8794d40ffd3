#pragma once

#ifndef __I8042__ARCH__X86__HARDWARE__PORT_PORT8BIT_H
#define __I8042__ARCH__X86__HARDWARE__PORT_PORT8BIT_H

#include <common/types.hpp>
#include "port.hpp"

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
                    *  @brief Represents an 8-bit hardware I/O port
                    *  Read and Write are a single bus cycle: no buffering, no waiting.
                    *  They are virtual so a simulated device can stand in for the
                    *  hardware in host tests.
                    */
                    class Port8Bit : public Port
                    {
            
                        public:
                
                            /*
                            * @brief Constructs a Port8Bit object
                            * @param portnumber The port number to use
                            */
                            Port8Bit(uint16_t portnumber);
                
                            /*
                            * @brief Destroys a Port8Bit object
                            */
                            virtual ~Port8Bit();

                            /*
                            * @brief Reads an 8-bit value from the port
                            * @return The 8-bit value read from the port
                            */
                            virtual uint8_t Read();
                
                            /*
                            * @brief Writes an 8-bit value to the port
                            * @param data The 8-bit value to write to the port
                            */
                            virtual void Write(uint8_t data);

                        protected:
               
                            static inline uint8_t Read8(uint16_t _port)
                            {
                                uint8_t result;
                                __asm__ volatile("inb %1, %0" : "=a" (result) : "Nd" (_port));
                                return result;
                            }

                            static inline void Write8(uint16_t _port, uint8_t _data)
                            {
                                __asm__ volatile("outb %0, %1" : : "a" (_data), "Nd" (_port));
                            }
                    };

                }
            }
        }
    }
}

#endif
