#pragma once

#include <common/types.hpp>

using namespace i8042::common;

namespace i8042 {
    namespace arch {
    
        namespace x86 {
        
            namespace hardware {
            
                namespace port {
                
                    // 8042 register addresses. The command register reads back as status.
                    static constexpr uint16_t PORT_PS2_DATA    = 0x60;
                    static constexpr uint16_t PORT_PS2_COMMAND = 0x64;
                    static constexpr uint16_t PORT_PS2_STATUS  = PORT_PS2_COMMAND;


                } // namespace port

            } // namespace hardware
            
        } // namespace x86
        
    } // namespace arch
}
