// include/opcodes.hpp
#pragma once
#include <cstdint>
#include <optional>
#include "addressing.hpp"

// One tag per documented mnemonic; the CPU dispatches on it with a switch.
enum class Op : uint8_t {
    ADC, AND, ASL, BCC, BCS, BEQ, BIT, BMI, BNE, BPL, BRK, BVC, BVS, CLC,
    CLD, CLI, CLV, CMP, CPX, CPY, DEC, DEX, DEY, EOR, INC, INX, INY, JMP,
    JSR, LDA, LDX, LDY, LSR, NOP, ORA, PHA, PHP, PLA, PLP, ROL, ROR, RTI,
    RTS, SBC, SEC, SED, SEI, STA, STX, STY, TAX, TAY, TSX, TXA, TXS, TYA,
};

// Immutable descriptor, one per defined opcode byte.
struct Instruction {
    Op      op;
    Mode    mode;
    uint8_t cycles;   // base cycle count
};

// Empty for bytes with no descriptor (undocumented opcodes).
std::optional<Instruction> lookup(uint8_t opcode);

const char* mnemonic(Op op);

// False when the handler would need an address the operand does not carry
// (stores, INC/DEC, jumps) or a shift is paired with a non-accumulator,
// non-memory mode.
bool operand_fits(const Instruction& ins, const Operand& o);
