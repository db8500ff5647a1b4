#include "opcodes.hpp"
#include <array>
#include <cstddef>

namespace {

struct Entry {
    uint8_t     opcode;
    Instruction ins;
};

using M = Mode;

// Documented NMOS 6502 opcodes with their base cycle counts.
const Entry kEntries[] = {
    {0x69, {Op::ADC, M::Immediate, 2}},       {0x65, {Op::ADC, M::ZeroPage, 3}},
    {0x75, {Op::ADC, M::ZeroPageX, 4}},       {0x6D, {Op::ADC, M::Absolute, 4}},
    {0x7D, {Op::ADC, M::AbsoluteX, 4}},       {0x79, {Op::ADC, M::AbsoluteY, 4}},
    {0x61, {Op::ADC, M::IndexedIndirect, 6}}, {0x71, {Op::ADC, M::IndirectIndexed, 5}},

    {0x29, {Op::AND, M::Immediate, 2}},       {0x25, {Op::AND, M::ZeroPage, 3}},
    {0x35, {Op::AND, M::ZeroPageX, 4}},       {0x2D, {Op::AND, M::Absolute, 4}},
    {0x3D, {Op::AND, M::AbsoluteX, 4}},       {0x39, {Op::AND, M::AbsoluteY, 4}},
    {0x21, {Op::AND, M::IndexedIndirect, 6}}, {0x31, {Op::AND, M::IndirectIndexed, 5}},

    {0x0A, {Op::ASL, M::Accumulator, 2}},     {0x06, {Op::ASL, M::ZeroPage, 5}},
    {0x16, {Op::ASL, M::ZeroPageX, 6}},       {0x0E, {Op::ASL, M::Absolute, 6}},
    {0x1E, {Op::ASL, M::AbsoluteX, 7}},

    {0x90, {Op::BCC, M::Relative, 2}},        {0xB0, {Op::BCS, M::Relative, 2}},
    {0xF0, {Op::BEQ, M::Relative, 2}},        {0x30, {Op::BMI, M::Relative, 2}},
    {0xD0, {Op::BNE, M::Relative, 2}},        {0x10, {Op::BPL, M::Relative, 2}},
    {0x50, {Op::BVC, M::Relative, 2}},        {0x70, {Op::BVS, M::Relative, 2}},

    {0x24, {Op::BIT, M::ZeroPage, 3}},        {0x2C, {Op::BIT, M::Absolute, 4}},

    {0x00, {Op::BRK, M::Implied, 7}},

    {0x18, {Op::CLC, M::Implied, 2}},         {0xD8, {Op::CLD, M::Implied, 2}},
    {0x58, {Op::CLI, M::Implied, 2}},         {0xB8, {Op::CLV, M::Implied, 2}},

    {0xC9, {Op::CMP, M::Immediate, 2}},       {0xC5, {Op::CMP, M::ZeroPage, 3}},
    {0xD5, {Op::CMP, M::ZeroPageX, 4}},       {0xCD, {Op::CMP, M::Absolute, 4}},
    {0xDD, {Op::CMP, M::AbsoluteX, 4}},       {0xD9, {Op::CMP, M::AbsoluteY, 4}},
    {0xC1, {Op::CMP, M::IndexedIndirect, 6}}, {0xD1, {Op::CMP, M::IndirectIndexed, 5}},

    {0xE0, {Op::CPX, M::Immediate, 2}},       {0xE4, {Op::CPX, M::ZeroPage, 3}},
    {0xEC, {Op::CPX, M::Absolute, 4}},
    {0xC0, {Op::CPY, M::Immediate, 2}},       {0xC4, {Op::CPY, M::ZeroPage, 3}},
    {0xCC, {Op::CPY, M::Absolute, 4}},

    {0xC6, {Op::DEC, M::ZeroPage, 5}},        {0xD6, {Op::DEC, M::ZeroPageX, 6}},
    {0xCE, {Op::DEC, M::Absolute, 6}},        {0xDE, {Op::DEC, M::AbsoluteX, 7}},
    {0xCA, {Op::DEX, M::Implied, 2}},         {0x88, {Op::DEY, M::Implied, 2}},

    {0x49, {Op::EOR, M::Immediate, 2}},       {0x45, {Op::EOR, M::ZeroPage, 3}},
    {0x55, {Op::EOR, M::ZeroPageX, 4}},       {0x4D, {Op::EOR, M::Absolute, 4}},
    {0x5D, {Op::EOR, M::AbsoluteX, 4}},       {0x59, {Op::EOR, M::AbsoluteY, 4}},
    {0x41, {Op::EOR, M::IndexedIndirect, 6}}, {0x51, {Op::EOR, M::IndirectIndexed, 5}},

    {0xE6, {Op::INC, M::ZeroPage, 5}},        {0xF6, {Op::INC, M::ZeroPageX, 6}},
    {0xEE, {Op::INC, M::Absolute, 6}},        {0xFE, {Op::INC, M::AbsoluteX, 7}},
    {0xE8, {Op::INX, M::Implied, 2}},         {0xC8, {Op::INY, M::Implied, 2}},

    {0x4C, {Op::JMP, M::Absolute, 3}},        {0x6C, {Op::JMP, M::Indirect, 5}},
    {0x20, {Op::JSR, M::Absolute, 6}},

    {0xA9, {Op::LDA, M::Immediate, 2}},       {0xA5, {Op::LDA, M::ZeroPage, 3}},
    {0xB5, {Op::LDA, M::ZeroPageX, 4}},       {0xAD, {Op::LDA, M::Absolute, 4}},
    {0xBD, {Op::LDA, M::AbsoluteX, 4}},       {0xB9, {Op::LDA, M::AbsoluteY, 4}},
    {0xA1, {Op::LDA, M::IndexedIndirect, 6}}, {0xB1, {Op::LDA, M::IndirectIndexed, 5}},

    {0xA2, {Op::LDX, M::Immediate, 2}},       {0xA6, {Op::LDX, M::ZeroPage, 3}},
    {0xB6, {Op::LDX, M::ZeroPageY, 4}},       {0xAE, {Op::LDX, M::Absolute, 4}},
    {0xBE, {Op::LDX, M::AbsoluteY, 4}},

    {0xA0, {Op::LDY, M::Immediate, 2}},       {0xA4, {Op::LDY, M::ZeroPage, 3}},
    {0xB4, {Op::LDY, M::ZeroPageX, 4}},       {0xAC, {Op::LDY, M::Absolute, 4}},
    {0xBC, {Op::LDY, M::AbsoluteX, 4}},

    {0x4A, {Op::LSR, M::Accumulator, 2}},     {0x46, {Op::LSR, M::ZeroPage, 5}},
    {0x56, {Op::LSR, M::ZeroPageX, 6}},       {0x4E, {Op::LSR, M::Absolute, 6}},
    {0x5E, {Op::LSR, M::AbsoluteX, 7}},

    {0xEA, {Op::NOP, M::Implied, 2}},

    {0x09, {Op::ORA, M::Immediate, 2}},       {0x05, {Op::ORA, M::ZeroPage, 3}},
    {0x15, {Op::ORA, M::ZeroPageX, 4}},       {0x0D, {Op::ORA, M::Absolute, 4}},
    {0x1D, {Op::ORA, M::AbsoluteX, 4}},       {0x19, {Op::ORA, M::AbsoluteY, 4}},
    {0x01, {Op::ORA, M::IndexedIndirect, 6}}, {0x11, {Op::ORA, M::IndirectIndexed, 5}},

    {0x48, {Op::PHA, M::Implied, 3}},         {0x08, {Op::PHP, M::Implied, 3}},
    {0x68, {Op::PLA, M::Implied, 4}},         {0x28, {Op::PLP, M::Implied, 4}},

    {0x2A, {Op::ROL, M::Accumulator, 2}},     {0x26, {Op::ROL, M::ZeroPage, 5}},
    {0x36, {Op::ROL, M::ZeroPageX, 6}},       {0x2E, {Op::ROL, M::Absolute, 6}},
    {0x3E, {Op::ROL, M::AbsoluteX, 7}},

    {0x6A, {Op::ROR, M::Accumulator, 2}},     {0x66, {Op::ROR, M::ZeroPage, 5}},
    {0x76, {Op::ROR, M::ZeroPageX, 6}},       {0x6E, {Op::ROR, M::Absolute, 6}},
    {0x7E, {Op::ROR, M::AbsoluteX, 7}},

    {0x40, {Op::RTI, M::Implied, 6}},         {0x60, {Op::RTS, M::Implied, 6}},

    {0xE9, {Op::SBC, M::Immediate, 2}},       {0xE5, {Op::SBC, M::ZeroPage, 3}},
    {0xF5, {Op::SBC, M::ZeroPageX, 4}},       {0xED, {Op::SBC, M::Absolute, 4}},
    {0xFD, {Op::SBC, M::AbsoluteX, 4}},       {0xF9, {Op::SBC, M::AbsoluteY, 4}},
    {0xE1, {Op::SBC, M::IndexedIndirect, 6}}, {0xF1, {Op::SBC, M::IndirectIndexed, 5}},

    {0x38, {Op::SEC, M::Implied, 2}},         {0xF8, {Op::SED, M::Implied, 2}},
    {0x78, {Op::SEI, M::Implied, 2}},

    {0x85, {Op::STA, M::ZeroPage, 3}},        {0x95, {Op::STA, M::ZeroPageX, 4}},
    {0x8D, {Op::STA, M::Absolute, 4}},        {0x9D, {Op::STA, M::AbsoluteX, 5}},
    {0x99, {Op::STA, M::AbsoluteY, 5}},       {0x81, {Op::STA, M::IndexedIndirect, 6}},
    {0x91, {Op::STA, M::IndirectIndexed, 6}},

    {0x86, {Op::STX, M::ZeroPage, 3}},        {0x96, {Op::STX, M::ZeroPageY, 4}},
    {0x8E, {Op::STX, M::Absolute, 4}},
    {0x84, {Op::STY, M::ZeroPage, 3}},        {0x94, {Op::STY, M::ZeroPageX, 4}},
    {0x8C, {Op::STY, M::Absolute, 4}},

    {0xAA, {Op::TAX, M::Implied, 2}},         {0xA8, {Op::TAY, M::Implied, 2}},
    {0xBA, {Op::TSX, M::Implied, 2}},         {0x8A, {Op::TXA, M::Implied, 2}},
    {0x9A, {Op::TXS, M::Implied, 2}},         {0x98, {Op::TYA, M::Implied, 2}},
};

const std::array<std::optional<Instruction>, 256>& table() {
    static const auto t = [] {
        std::array<std::optional<Instruction>, 256> tbl{};
        for (const auto& e : kEntries) tbl[e.opcode] = e.ins;
        return tbl;
    }();
    return t;
}

} // namespace

std::optional<Instruction> lookup(uint8_t opcode) {
    return table()[opcode];
}

const char* mnemonic(Op op) {
    static const char* const names[] = {
        "ADC","AND","ASL","BCC","BCS","BEQ","BIT","BMI","BNE","BPL","BRK","BVC","BVS","CLC",
        "CLD","CLI","CLV","CMP","CPX","CPY","DEC","DEX","DEY","EOR","INC","INX","INY","JMP",
        "JSR","LDA","LDX","LDY","LSR","NOP","ORA","PHA","PHP","PLA","PLP","ROL","ROR","RTI",
        "RTS","SBC","SEC","SED","SEI","STA","STX","STY","TAX","TAY","TSX","TXA","TXS","TYA",
    };
    return names[static_cast<size_t>(op)];
}

bool operand_fits(const Instruction& ins, const Operand& o) {
    switch (ins.op) {
        case Op::STA: case Op::STX: case Op::STY:
        case Op::INC: case Op::DEC:
        case Op::JMP: case Op::JSR:
            return o.is_address();
        case Op::ASL: case Op::LSR: case Op::ROL: case Op::ROR:
            return ins.mode == Mode::Accumulator || o.is_address();
        default:
            return true;
    }
}
