#pragma once

#include <cstdint>

// Hardware access for the GD32VF103 family (RISC-V, as on the Longan Nano)
// see [1] GD32VF103 User Manual, rev 1.2

// see https://interrupt.memfault.com/blog/asserts-in-embedded-systems
#ifdef NDEBUG
#define ensure(exp) ((void)0)
#elif __riscv
#define ensure(exp)                                     \
  do                                                    \
    if (!(exp)) {                                       \
      void* pc;                                         \
      asm volatile ("auipc %0, 0" : "=r" (pc));         \
      hall::failAt(pc, __builtin_return_address(0));    \
    }                                                   \
  while (false)
#else
#define ensure(exp)                                     \
  do                                                    \
    if (!(exp))                                         \
      hall::failAt(nullptr, __builtin_return_address(0)); \
  while (false)
#endif

namespace hall {
    [[noreturn]] void failAt (void const*, void const*); // defined by the app

    // word-wide register bank, memory-mapped on the chip, simulated in tests
    struct Bus {
        virtual ~Bus () =default;

        virtual auto read (uint32_t addr) -> uint32_t =0;
        virtual void write (uint32_t addr, uint32_t val) =0;
    };

    struct Mmio : Bus {
        auto read (uint32_t addr) -> uint32_t override {
            return *(volatile uint32_t*) (uintptr_t) addr;
        }
        void write (uint32_t addr, uint32_t val) override {
            *(volatile uint32_t*) (uintptr_t) addr = val;
        }
    };

    extern Mmio mmio;
    extern Bus* bus; // all register traffic goes through here

    template <uint32_t ADDR>
    struct Io32 {
        constexpr static auto addr = ADDR;

        auto operator() (uint32_t off) const {
            struct IOWord {
                uint32_t a;

                operator uint32_t () const { return bus->read(a); }
                auto operator= (uint32_t v) const {
                    bus->write(a, v);
                    return v;
                }
            };

            return IOWord {ADDR+off};
        }

        auto operator() (uint32_t off, int bit, uint8_t num =1) const {
            struct IOMask {
                uint32_t a; uint8_t b, w;

                operator uint32_t () const {
                    auto m = (1U<<w)-1;
                    return (bus->read(a) >> b) & m;
                }
                auto operator= (uint32_t v) const {
                    auto m = (1U<<w)-1;
                    bus->write(a, (bus->read(a) & ~(m<<b)) | ((v & m)<<b));
                    return v & m;
                }
            };

            return IOMask {ADDR + off + 4*(bit>>5), (uint8_t) (bit & 0x1F), num};
        }
    };

    constexpr Io32<0> anyIo32 {};

    // error kinds as bit flags, only ever reported, never recovered from
    enum Error : uint8_t {
        ClockNotReady  = 1<<0,
        ReceiveOverrun = 1<<1,
        FramingError   = 1<<2,
        NoiseError     = 1<<3,
        ParityError    = 1<<4,
    };

    namespace dev {
        constexpr Io32 <0x4001'0000> AFIO {};   // [1] p.101
        constexpr Io32 <0x4001'0800> GPIOA {};
        constexpr Io32 <0x4001'0C00> GPIOB {};
        constexpr Io32 <0x4001'1000> GPIOC {};
        constexpr Io32 <0x4001'1400> GPIOD {};
        constexpr Io32 <0x4001'1800> GPIOE {};
        constexpr Io32 <0x4001'3800> USART0 {};
        constexpr Io32 <0x4002'1000> RCU {};
    }

    namespace rcu {  // [1] p.70
        enum { APB2EN=0x18 };
        enum : uint32_t {
            AFEN=1<<0, PAEN=1<<2, PBEN=1<<3, PCEN=1<<4, PDEN=1<<5, PEEN=1<<6,
            USART0EN=1<<14,
        };

        // overwrites APB2EN, mask must hold every clock that is to stay on
        void enable (uint32_t base, uint32_t mask);
        auto enabled (uint32_t base, uint32_t mask) -> bool;
    }

    namespace gpio {  // [1] p.103
        enum { CTL0=0x00, CTL1=0x04, ISTAT=0x08, OCTL=0x0C };

        enum Mode : uint8_t {
            IN        = 0b00,
            OUT_10MHZ = 0b01,
            OUT_2MHZ  = 0b10,
            OUT_50MHZ = 0b11,
        };

        enum Ctl : uint8_t {
            IN_ANALOG   = 0b00, // modes with MD == IN
            IN_FLOATING = 0b01,
            IN_PULL     = 0b10,

            OUT_PP      = 0b00, // modes with MD != IN
            OUT_OD      = 0b01,
            OUT_AF_PP   = 0b10,
            OUT_AF_OD   = 0b11,
        };

        constexpr auto config (Mode md, Ctl ctl) -> uint8_t {
            return (ctl << 2) | md;
        }

        // where a pin's 4 config bits live: reg 0 is CTL0, reg 1 is CTL1
        // pin must be 0..15, anything else aliases onto another pin
        struct Field { uint8_t reg, shift, value; };

        constexpr auto field (int pin, uint8_t cfg) -> Field {
            return { (uint8_t) (pin < 8 ? 0 : 1),
                     (uint8_t) (4 * (pin & 7)),
                     (uint8_t) (cfg & 0xF) };
        }

        constexpr auto field (int pin, Mode md, Ctl ctl) -> Field {
            return field(pin, config(md, ctl));
        }

        // read-modify-write of one pin's field, other pins are left as is
        // the pin range is checked with ensure, see field()
        void configure (uint32_t port, int pin, uint8_t cfg);
    }

    namespace uart {  // [1] p.384
        enum { STAT=0x00, DATA=0x04, BAUD=0x08, CTL0=0x0C, CTL1=0x10 };
        enum { PERR=0, FERR=1, NERR=2, ORERR=3, IDLEF=4, RBNE=5, TC=6, TBE=7 };
        enum { REN=2, TEN=3, PCEN=10, WL=12, UEN=13 };

        // 8N1: WL=0 and PCEN=0 here, STB in CTL1 stays at its reset value
        constexpr uint32_t ENABLE = (1<<UEN) | (1<<TEN) | (1<<REN);

        // no rounding, the resulting baud rate error is accepted as is
        constexpr auto divisor (uint32_t hz, uint32_t baud) -> uint32_t {
            return hz / baud;
        }
    }

    struct Uart {
        constexpr Uart (uint32_t base) : base (base) {}

        void init (uint32_t div) const;

        auto readable () const -> bool {
            return anyIo32(base+uart::STAT, uart::RBNE) != 0;
        }
        auto writable () const -> bool {
            return anyIo32(base+uart::STAT, uart::TBE) != 0;
        }

        auto getc () const -> int;
        void putc (int c) const;

        // decoded error flags as hall::Error bits, getc never looks at them
        auto errors () const -> int;

        uint32_t base;
    };
}
