// include/bus.hpp
#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

// Flat 64 KiB address space. Every 16-bit address is plain storage; video
// windows, key latches and the like are conventions of whoever drives the CPU.
struct Bus {
    static constexpr size_t MEM_SIZE = 65536;

    std::array<uint8_t, MEM_SIZE> mem{};
    uint64_t cycles{0};     // elapsed CPU cycles

    uint8_t read(uint16_t addr) const { return mem[addr]; }
    void    write(uint16_t addr, uint8_t data) { mem[addr] = data; }

    // Called wherever the hardware spends cycles (base timing, page crossings,
    // taken branches).
    void tick(uint32_t n) { cycles += n; }

    // Caller guarantees origin + bytes.size() <= MEM_SIZE.
    void load(const std::vector<uint8_t>& bytes, uint16_t origin) {
        std::copy(bytes.begin(), bytes.end(), mem.begin() + origin);
    }
};
