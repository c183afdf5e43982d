// Echo characters over USART0, i.e. PA9 (TX) and PA10 (RX), using a USB to
// TTL serial cable on the Longan Nano.

#include <echo.h>

using namespace hall;

constexpr Uart console (echo::config::usart);

void echo::debugf (const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    veprintf([](void* obj, int c) {
        ((Uart const*) obj)->putc(c);
    }, (void*) &console, fmt, ap);
    va_end(ap);
}

void hall::failAt (void const* pc, void const* lr) {
    echo::debugf("failAt %p %p\n", pc, lr);
    while (true) {} // nothing to return to, wait for a reset
}

int main () {
    echo::setup(console);
    echo::run(console);
}
