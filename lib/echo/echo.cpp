#include "echo.h"

using namespace hall;

// only what the firmware prints: %d %u %x %p %%, with optional 0 and width
auto echo::veprintf(void (*fun)(void*,int), void* arg,
                    char const* fmt, va_list ap) -> int {
    int count = 0;
    auto put = [&](int c) { fun(arg, c); ++count; };

    while (*fmt) {
        if (*fmt != '%') {
            put(*fmt++);
            continue;
        }
        ++fmt;

        char fill = ' ';
        if (*fmt == '0')
            fill = *fmt++;
        int width = 0;
        while ('0' <= *fmt && *fmt <= '9')
            width = 10 * width + *fmt++ - '0';

        uint32_t num = 0;
        uint32_t base = 10;
        bool neg = false;
        switch (*fmt) {
            case 'd': { int v = va_arg(ap, int);
                        neg = v < 0;
                        num = neg ? -(uint32_t) v : (uint32_t) v;
                        break; }
            case 'u': num = va_arg(ap, unsigned); break;
            case 'x': num = va_arg(ap, unsigned); base = 16; break;
            case 'p': num = (uint32_t) (uintptr_t) va_arg(ap, void*);
                      base = 16; fill = '0'; width = 8;
                      break;
            case 0:   continue; // lone '%' at the end
            default:  put(*fmt++); continue; // "%%", others as is
        }
        ++fmt;

        char buf [10];
        int n = 0;
        do {
            buf[n++] = "0123456789ABCDEF"[num % base];
            num /= base;
        } while (num != 0);

        if (neg && fill == '0')
            put('-');
        for (int len = n + neg; width > len; --width)
            put(fill);
        if (neg && fill == ' ')
            put('-');
        while (n > 0)
            put(buf[--n]);
    }

    return count;
}

void echo::setup (Uart const& console) {
    rcu::enable(config::rcu, config::clocks);
    auto ok = rcu::enabled(config::rcu, config::clocks);
    if (!ok)
        debugf("error %d\n", ClockNotReady);
    ensure(ok);

    gpio::configure(config::port, config::txPin,
                    gpio::config(gpio::OUT_50MHZ, gpio::OUT_AF_PP));
    gpio::configure(config::port, config::rxPin,
                    gpio::config(gpio::IN, gpio::IN_FLOATING));

    auto div = uart::divisor(config::clockHz, config::baud);
    console.init(div);

    if (config::banner)
        debugf("echo %d baud, div %d\n", config::baud, div);
}

auto echo::step (Uart const& console) -> int {
    auto c = console.getc();
    console.putc(c);
    return c;
}

void echo::run (Uart const& console) {
    while (true)
        step(console);
}
