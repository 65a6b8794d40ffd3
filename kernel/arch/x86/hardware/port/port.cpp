#include "port.hpp"

using namespace i8042::common;
using namespace i8042::arch::x86::hardware::port;

Port::Port(uint16_t portnumber)
    : portnumber(portnumber)
{
}

Port::~Port()
{
}
