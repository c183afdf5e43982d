#include "hall.h"

using namespace hall;

Mmio hall::mmio;
Bus* hall::bus = &mmio;

void hall::rcu::enable (uint32_t base, uint32_t mask) {
    anyIo32(base+APB2EN) = mask;
}

auto hall::rcu::enabled (uint32_t base, uint32_t mask) -> bool {
    return (anyIo32(base+APB2EN) & mask) == mask;
}

void hall::gpio::configure (uint32_t port, int pin, uint8_t cfg) {
    ensure(0 <= pin && pin < 16);
    auto f = field(pin, cfg);
    anyIo32(port+4*f.reg, f.shift, 4) = f.value; // CTL0/CTL1
}

void Uart::init (uint32_t div) const {
    anyIo32(base+uart::BAUD) = div;
    anyIo32(base+uart::CTL0) = uart::ENABLE;
}

auto Uart::getc () const -> int {
    while (!readable()) {}
    return anyIo32(base+uart::DATA);
}

void Uart::putc (int c) const {
    while (!writable()) {}
    anyIo32(base+uart::DATA) = c;
}

auto Uart::errors () const -> int {
    uint32_t stat = anyIo32(base+uart::STAT);
    return (stat & (1<<uart::ORERR) ? ReceiveOverrun : 0) |
           (stat & (1<<uart::FERR)  ? FramingError : 0) |
           (stat & (1<<uart::NERR)  ? NoiseError : 0) |
           (stat & (1<<uart::PERR)  ? ParityError : 0);
}

#if DOCTEST
#include <doctest.h>

TEST_CASE("pin field") {
    static_assert(gpio::config(gpio::OUT_50MHZ, gpio::OUT_AF_PP) == 0b1011);
    static_assert(gpio::config(gpio::IN, gpio::IN_FLOATING) == 0b0100);

    SUBCASE("low pins in CTL0") {
        for (int pin = 0; pin < 8; ++pin) {
            auto f = gpio::field(pin, 0b1011);
            CHECK(f.reg == 0);
            CHECK(f.shift == 4*pin);
            CHECK(f.value == 0b1011);
        }
    }

    SUBCASE("high pins in CTL1") {
        for (int pin = 8; pin < 16; ++pin) {
            auto f = gpio::field(pin, gpio::IN, gpio::IN_FLOATING);
            CHECK(f.reg == 1);
            CHECK(f.shift == 4*(pin-8));
            CHECK(f.value == 0b0100);
        }
    }

    SUBCASE("tx and rx") {
        constexpr auto tx = gpio::field(9, gpio::OUT_50MHZ, gpio::OUT_AF_PP);
        constexpr auto rx = gpio::field(10, gpio::IN, gpio::IN_FLOATING);
        CHECK(tx.reg == 1);
        CHECK(tx.shift == 4);
        CHECK(rx.reg == 1);
        CHECK(rx.shift == 8);
    }
}

TEST_CASE("baud divisor") {
    static_assert(uart::divisor(8'000'000, 115200) == 69);
    CHECK(uart::divisor(8'000'000, 9600) == 833);
    CHECK(uart::divisor(108'000'000, 115200) == 937);
    CHECK(uart::divisor(8'000'000, 8'000'000) == 1);
}

#endif // DOCTEST
