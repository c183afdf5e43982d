#pragma once

#include <cstdarg>
#include <hall.h>
#include "config.h"

namespace echo {
    auto veprintf(void(*)(void*,int), void*, char const* fmt, va_list ap) -> int;

    // defined by the application, i.e. firmware or test runner
    void debugf (const char* fmt, ...);

    // clocks, pins, and usart, in that order
    void setup (hall::Uart const& console);

    // receive one byte, send it right back, and return it
    auto step (hall::Uart const& console) -> int;

    [[noreturn]] void run (hall::Uart const& console);
}
