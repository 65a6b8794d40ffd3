#ifndef __I8042__COMMON__TYPES_H
#define __I8042__COMMON__TYPES_H

namespace i8042
{
   namespace common
   { 
        // Mapped onto the compiler's width macros so these are the same types a
        // hosted <stdint.h> hands out. Host tests include both.
        typedef __INT8_TYPE__           int8_t;
        typedef __UINT8_TYPE__          uint8_t;
        typedef __INT16_TYPE__          int16_t;
        typedef __UINT16_TYPE__         uint16_t;
        typedef __INT32_TYPE__          int32_t;
        typedef __UINT32_TYPE__         uint32_t;
        typedef __INT64_TYPE__          int64_t;
        typedef __UINT64_TYPE__         uint64_t;
        typedef __UINTPTR_TYPE__        uintptr_t;
        typedef __SIZE_TYPE__           size_t;
   }
}


#endif
