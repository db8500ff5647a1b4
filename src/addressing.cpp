#include "addressing.hpp"
#include "cpu.hpp"

Resolved resolve(Mode mode, CPU& cpu) {
    switch (mode) {
        case Mode::Accumulator:
            return Resolved{Operand::immediate(cpu.regs.A), false};
        case Mode::Implied:
            return Resolved{Operand::address(0x0000), false};

        case Mode::Immediate:
        case Mode::Relative:   // signed displacement, interpreted by branch()
            return Resolved{Operand::immediate(cpu.fetch8()), false};

        case Mode::ZeroPage:
            return Resolved{Operand::address(cpu.fetch8()), false};
        case Mode::ZeroPageX: {
            // Indexed zero page wraps inside page 0
            uint8_t zp = static_cast<uint8_t>(cpu.fetch8() + cpu.regs.X);
            return Resolved{Operand::address(zp), false};
        }
        case Mode::ZeroPageY: {
            uint8_t zp = static_cast<uint8_t>(cpu.fetch8() + cpu.regs.Y);
            return Resolved{Operand::address(zp), false};
        }

        case Mode::Absolute:
            return Resolved{Operand::address(cpu.fetch16()), false};
        case Mode::AbsoluteX: {
            uint16_t base = cpu.fetch16();
            uint16_t ea = static_cast<uint16_t>(base + cpu.regs.X);
            return Resolved{Operand::address(ea), page_crossed(base, ea)};
        }
        case Mode::AbsoluteY: {
            uint16_t base = cpu.fetch16();
            uint16_t ea = static_cast<uint16_t>(base + cpu.regs.Y);
            return Resolved{Operand::address(ea), page_crossed(base, ea)};
        }

        case Mode::Indirect: {
            // NMOS quirk: the high byte is fetched from the same page as the
            // low byte, so JMP ($10FF) reads $10FF and $1000.
            uint16_t ptr = cpu.fetch16();
            uint16_t ptr_hi = static_cast<uint16_t>((ptr & 0xFF00) | ((ptr + 1) & 0x00FF));
            uint8_t lo = cpu.read(ptr, "pointer lo");
            uint8_t hi = cpu.read(ptr_hi, "pointer hi");
            return Resolved{Operand::address(join_bytes(lo, hi)), false};
        }
        case Mode::IndexedIndirect: {
            uint8_t zp = static_cast<uint8_t>(cpu.fetch8() + cpu.regs.X);
            uint8_t lo = cpu.read(zp, "pointer lo");
            uint8_t hi = cpu.read(static_cast<uint8_t>(zp + 1), "pointer hi");
            return Resolved{Operand::address(join_bytes(lo, hi)), false};
        }
        case Mode::IndirectIndexed: {
            uint8_t zp = cpu.fetch8();
            uint8_t lo = cpu.read(zp, "pointer lo");
            uint8_t hi = cpu.read(static_cast<uint8_t>(zp + 1), "pointer hi");
            uint16_t base = join_bytes(lo, hi);
            uint16_t ea = static_cast<uint16_t>(base + cpu.regs.Y);
            return Resolved{Operand::address(ea), page_crossed(base, ea)};
        }
    }
    return Resolved{Operand::address(0x0000), false};
}

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Accumulator:     return "accumulator";
        case Mode::Implied:         return "implied";
        case Mode::Immediate:       return "immediate";
        case Mode::Relative:        return "relative";
        case Mode::ZeroPage:        return "zero page";
        case Mode::ZeroPageX:       return "zero page,X";
        case Mode::ZeroPageY:       return "zero page,Y";
        case Mode::Absolute:        return "absolute";
        case Mode::AbsoluteX:       return "absolute,X";
        case Mode::AbsoluteY:       return "absolute,Y";
        case Mode::Indirect:        return "indirect";
        case Mode::IndexedIndirect: return "(zp,X)";
        case Mode::IndirectIndexed: return "(zp),Y";
    }
    return "?";
}

int operand_bytes(Mode mode) {
    switch (mode) {
        case Mode::Accumulator:
        case Mode::Implied:
            return 0;
        case Mode::Absolute:
        case Mode::AbsoluteX:
        case Mode::AbsoluteY:
        case Mode::Indirect:
            return 2;
        default:
            return 1;
    }
}
