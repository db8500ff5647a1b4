// src/disasm.cpp
#include "disasm.hpp"

#include <iomanip>
#include <sstream>

#include "addressing.hpp"
#include "bus.hpp"
#include "opcodes.hpp"

std::string hex8(uint8_t v) {
    std::ostringstream o;
    o << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << int(v);
    return o.str();
}

std::string hex16(uint16_t v) {
    std::ostringstream o;
    o << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << int(v);
    return o.str();
}

int instruction_length(uint8_t opcode) {
    const std::optional<Instruction> ins = lookup(opcode);
    if (!ins) return 1;
    return 1 + operand_bytes(ins->mode);
}

static std::string format_operand(Mode mode, uint16_t pc, uint8_t lo, uint8_t hi) {
    const uint16_t abs = join_bytes(lo, hi);
    switch (mode) {
        case Mode::Accumulator:     return "A";
        case Mode::Implied:         return "";
        case Mode::Immediate:       return "#$" + hex8(lo);
        case Mode::Relative: {
            // Target is relative to the following instruction
            const uint16_t target = static_cast<uint16_t>(pc + 2 + static_cast<int8_t>(lo));
            return "$" + hex16(target);
        }
        case Mode::ZeroPage:        return "$" + hex8(lo);
        case Mode::ZeroPageX:       return "$" + hex8(lo) + ",X";
        case Mode::ZeroPageY:       return "$" + hex8(lo) + ",Y";
        case Mode::Absolute:        return "$" + hex16(abs);
        case Mode::AbsoluteX:       return "$" + hex16(abs) + ",X";
        case Mode::AbsoluteY:       return "$" + hex16(abs) + ",Y";
        case Mode::Indirect:        return "($" + hex16(abs) + ")";
        case Mode::IndexedIndirect: return "($" + hex8(lo) + ",X)";
        case Mode::IndirectIndexed: return "($" + hex8(lo) + "),Y";
    }
    return "";
}

std::string disassemble(const Bus& bus, uint16_t pc, int* length) {
    const uint8_t op = bus.read(pc);
    const int L = instruction_length(op);
    if (length) *length = L;

    const uint8_t lo = (L >= 2 ? bus.read(static_cast<uint16_t>(pc + 1)) : 0);
    const uint8_t hi = (L >= 3 ? bus.read(static_cast<uint16_t>(pc + 2)) : 0);

    std::ostringstream out;

    // bytes column (up to 3 bytes)
    out << hex16(pc) << ":  "
        << hex8(op) << (L >= 2 ? (" " + hex8(lo)) : "   ")
        << (L >= 3 ? (" " + hex8(hi)) : "   ")
        << "   ";

    const std::optional<Instruction> ins = lookup(op);
    if (!ins) {
        out << ".DB $" << hex8(op);
        return out.str();
    }

    out << mnemonic(ins->op);
    const std::string operand = format_operand(ins->mode, pc, lo, hi);
    if (!operand.empty()) out << ' ' << operand;
    return out.str();
}
