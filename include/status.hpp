// include/status.hpp
#pragma once
#include <cstdint>

// Status byte layout, bit 0 to bit 7: C Z I D B - V N
static constexpr uint8_t F_C = 1u<<0; // Carry
static constexpr uint8_t F_Z = 1u<<1; // Zero
static constexpr uint8_t F_I = 1u<<2; // Interrupt disable
static constexpr uint8_t F_D = 1u<<3; // Decimal
static constexpr uint8_t F_B = 1u<<4; // Break
static constexpr uint8_t F_U = 1u<<5; // Unused, always reads as 1
static constexpr uint8_t F_V = 1u<<6; // Overflow
static constexpr uint8_t F_N = 1u<<7; // Negative

struct Flags {
    bool C{false}, Z{false}, I{false}, D{false}, B{false}, V{false}, N{false};

    void reset();                       // all seven flags false
    void setZN(uint8_t v) { Z = (v == 0); N = (v & 0x80) != 0; }

    // The unused bit is synthesized as 1 on pack and ignored on unpack.
    uint8_t      pack() const;
    static Flags unpack(uint8_t p);
};
