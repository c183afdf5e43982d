#include <doctest.h>
#include <echo.h>
#include <string>

static std::string out;
static int count;

static void format (char const* fmt, ...) {
    out.clear();
    va_list ap;
    va_start(ap, fmt);
    count = echo::veprintf([](void* p, int c) {
        *(std::string*) p += (char) c;
    }, &out, fmt, ap);
    va_end(ap);
}

TEST_CASE("veprintf") {
    SUBCASE("plain text") {
        format("hello\n");
        CHECK(out == "hello\n");
        CHECK(count == 6);
    }

    SUBCASE("decimal") {
        format("%d %d %u", 123, -42, 7u);
        CHECK(out == "123 -42 7");
        format("%u", 4000000000u);
        CHECK(out == "4000000000");
        format("[%4d] [%04d] [%4d] [%04d] [%03d]", 5, 5, -5, -5, -5);
        CHECK(out == "[   5] [0005] [  -5] [-005] [-05]");
    }

    SUBCASE("hex and pointers") {
        format("%x %02x %x", 0xDEADBEEF, 0x3, 0);
        CHECK(out == "DEADBEEF 03 0");
        format("%p", (void*) 0x1234);
        CHECK(out == "00001234");
        format("failAt %p %p\n", (void*) 0x0800'0123, nullptr);
        CHECK(out == "failAt 08000123 00000000\n");
    }

    SUBCASE("percent") {
        format("100%%");
        CHECK(out == "100%");
        CHECK(count == 4);
    }

    SUBCASE("stops at the terminator") {
        format("100%");
        CHECK(out == "100");
        CHECK(count == 3);

        char const tail [] = { 'a', '%', 0, 'X' };
        format(tail);
        CHECK(out == "a");

        char const zero [] = { '%', '0', 0, 'Y' };
        format(zero);
        CHECK(out == "");
        CHECK(count == 0);
    }

    SUBCASE("banner and errors") {
        format("echo %d baud, div %d\n", 115200, 69);
        CHECK(out == "echo 115200 baud, div 69\n");
        format("error %d\n", hall::ClockNotReady);
        CHECK(out == "error 1\n");
    }
}
