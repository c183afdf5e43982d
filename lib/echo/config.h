#pragma once

#include <hall.h>

// board settings, the macros can be overridden from the build

#ifndef ECHO_CLOCK_HZ
#define ECHO_CLOCK_HZ 8000000   // IRC8M, the clock after reset
#endif

#ifndef ECHO_BAUD
#define ECHO_BAUD 115200
#endif

#ifndef ECHO_BANNER
#define ECHO_BANNER 0           // 1 = send one line of info after init
#endif

namespace echo::config {
    constexpr uint32_t clockHz = ECHO_CLOCK_HZ;
    constexpr uint32_t baud = ECHO_BAUD;
    constexpr bool banner = ECHO_BANNER != 0;

    constexpr uint32_t rcu = hall::dev::RCU.addr;
    constexpr uint32_t port = hall::dev::GPIOA.addr;
    constexpr uint32_t usart = hall::dev::USART0.addr;

    constexpr int txPin = 9;    // PA9, USART0_TX
    constexpr int rxPin = 10;   // PA10, USART0_RX

    // APB2EN is overwritten, so all clocks go in at once
    constexpr uint32_t clocks =
        hall::rcu::AFEN | hall::rcu::PAEN | hall::rcu::USART0EN;

    static_assert(clocks == 0b0100'0000'0000'0101);
    static_assert(baud > 0 && clockHz / baud > 0, "baud rate too high");
}
