#pragma once

#include <hall.h>
#include <deque>
#include <map>
#include <string>
#include <vector>

// simulated register bank, installs itself as hall::bus while in scope
struct Sim : hall::Bus {
    struct Access {
        char op; // 'r' or 'w'
        uint32_t addr, val;

        auto operator== (Access const& a) const -> bool {
            return op == a.op && addr == a.addr && val == a.val;
        }
    };

    // thrown when a scripted register runs out of values, ends spin loops
    struct Exhausted { uint32_t addr; };

    Sim () : prev (hall::bus) { hall::bus = this; }
    ~Sim () { hall::bus = prev; }

    auto read (uint32_t addr) -> uint32_t override {
        auto it = script.find(addr);
        if (it != script.end()) {
            if (it->second.empty())
                throw Exhausted {addr};
            regs[addr] = it->second.front();
            it->second.pop_front();
        }
        log.push_back({'r', addr, regs[addr]});
        return regs[addr];
    }

    void write (uint32_t addr, uint32_t val) override {
        log.push_back({'w', addr, val});
        regs[addr] = val;
    }

    auto writes (uint32_t addr) const -> int {
        int n = 0;
        for (auto& a : log)
            n += a.op == 'w' && a.addr == addr;
        return n;
    }

    std::map<uint32_t,uint32_t> regs;
    std::map<uint32_t,std::deque<uint32_t>> script; // successive read values
    std::vector<Access> log;
private:
    hall::Bus* prev;
};

// what the test build's hall::failAt throws
struct FailAt { void const* pc; void const* lr; };

// everything echo::debugf printed so far, clear it before use
extern std::string debugLog;
