// include/addressing.hpp
#pragma once
#include <cstdint>

struct CPU;

enum class Mode : uint8_t {
    Accumulator,
    Implied,
    Immediate,
    Relative,
    ZeroPage,
    ZeroPageX,
    ZeroPageY,
    Absolute,
    AbsoluteX,
    AbsoluteY,
    Indirect,          // (abs), JMP only
    IndexedIndirect,   // (zp,X)
    IndirectIndexed,   // (zp),Y
};

// Transient result of operand decoding: an immediate byte or an effective
// address. Consumed once by a single handler.
struct Operand {
    enum class Kind : uint8_t { Immediate, Address };

    Kind     kind{Kind::Address};
    uint16_t value{0};

    static Operand immediate(uint8_t v) { return Operand{Kind::Immediate, v}; }
    static Operand address(uint16_t a)  { return Operand{Kind::Address, a}; }

    bool is_address() const { return kind == Kind::Address; }
};

struct Resolved {
    Operand operand;
    bool    page_crossed{false};
};

inline bool page_crossed(uint16_t a, uint16_t b) {
    return (a & 0xFF00) != (b & 0xFF00);
}

inline uint16_t join_bytes(uint8_t lo, uint8_t hi) {
    return static_cast<uint16_t>(lo | (static_cast<uint16_t>(hi) << 8));
}

// Consumes the operand bytes after the opcode (advancing cpu.PC) and reads
// any pointers the mode goes through.
Resolved resolve(Mode mode, CPU& cpu);

const char* mode_name(Mode mode);
int         operand_bytes(Mode mode);   // bytes after the opcode
