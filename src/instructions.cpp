#include "cpu.hpp"

uint8_t CPU::value_of(const Operand& o) {
    if (o.is_address()) return read(o.value, "operand value");
    return static_cast<uint8_t>(o.value);
}

void CPU::adc(uint8_t v) {
    const uint16_t sum = static_cast<uint16_t>(regs.A + v + (flags.C ? 1 : 0));
    const uint8_t r = static_cast<uint8_t>(sum);
    flags.C = sum > 0xFF;
    flags.setZN(r);
    // Signed overflow: result sign differs from both inputs
    flags.V = ((v ^ r) & (regs.A ^ r) & 0x80) != 0;
    regs.A = r;
}

void CPU::compare(uint8_t reg, uint8_t v) {
    flags.Z = reg == v;
    flags.C = reg >= v;
    flags.N = (static_cast<uint8_t>(reg - v) & 0x80) != 0;
}

uint8_t CPU::shift(Op op, uint8_t v) {
    const bool carry_in = flags.C;
    uint8_t r = 0;
    switch (op) {
        case Op::ASL: flags.C = (v & 0x80) != 0; r = static_cast<uint8_t>(v << 1); break;
        case Op::LSR: flags.C = (v & 0x01) != 0; r = static_cast<uint8_t>(v >> 1); break;
        case Op::ROL:
            flags.C = (v & 0x80) != 0;
            r = static_cast<uint8_t>((v << 1) | (carry_in ? 0x01 : 0x00));
            break;
        case Op::ROR:
            flags.C = (v & 0x01) != 0;
            r = static_cast<uint8_t>((v >> 1) | (carry_in ? 0x80 : 0x00));
            break;
        default: break;
    }
    flags.setZN(r);
    return r;
}

void CPU::execute(const Instruction& ins, const Operand& o) {
    const uint16_t ea = o.value;

    switch (ins.op) {
        // Loads / stores
        case Op::LDA: regs.A = value_of(o); flags.setZN(regs.A); break;
        case Op::LDX: regs.X = value_of(o); flags.setZN(regs.X); break;
        case Op::LDY: regs.Y = value_of(o); flags.setZN(regs.Y); break;
        case Op::STA: write(ea, regs.A, "STA"); break;
        case Op::STX: write(ea, regs.X, "STX"); break;
        case Op::STY: write(ea, regs.Y, "STY"); break;

        // Transfers
        case Op::TAX: regs.X = regs.A; flags.setZN(regs.X); break;
        case Op::TAY: regs.Y = regs.A; flags.setZN(regs.Y); break;
        case Op::TXA: regs.A = regs.X; flags.setZN(regs.A); break;
        case Op::TYA: regs.A = regs.Y; flags.setZN(regs.A); break;
        case Op::TSX: regs.X = regs.SP; flags.setZN(regs.X); break;
        case Op::TXS: regs.SP = regs.X; break;

        // Arithmetic
        case Op::ADC: adc(value_of(o)); break;
        case Op::SBC: adc(static_cast<uint8_t>(~value_of(o))); break;   // A + ~M + C

        // Increment / decrement
        case Op::INC: {
            uint8_t v = static_cast<uint8_t>(read(ea, "INC") + 1);
            write(ea, v, "INC");
            flags.setZN(v);
            break;
        }
        case Op::DEC: {
            uint8_t v = static_cast<uint8_t>(read(ea, "DEC") - 1);
            write(ea, v, "DEC");
            flags.setZN(v);
            break;
        }
        case Op::INX: regs.X = static_cast<uint8_t>(regs.X + 1); flags.setZN(regs.X); break;
        case Op::INY: regs.Y = static_cast<uint8_t>(regs.Y + 1); flags.setZN(regs.Y); break;
        case Op::DEX: regs.X = static_cast<uint8_t>(regs.X - 1); flags.setZN(regs.X); break;
        case Op::DEY: regs.Y = static_cast<uint8_t>(regs.Y - 1); flags.setZN(regs.Y); break;

        // Logic
        case Op::AND: regs.A &= value_of(o); flags.setZN(regs.A); break;
        case Op::ORA: regs.A |= value_of(o); flags.setZN(regs.A); break;
        case Op::EOR: regs.A ^= value_of(o); flags.setZN(regs.A); break;
        case Op::BIT: {
            uint8_t v = value_of(o);
            flags.Z = (regs.A & v) == 0;
            flags.N = (v & 0x80) != 0;
            flags.V = (v & 0x40) != 0;
            break;
        }

        // Shifts / rotates: accumulator or read-modify-write on memory
        case Op::ASL:
        case Op::LSR:
        case Op::ROL:
        case Op::ROR:
            if (ins.mode == Mode::Accumulator) {
                regs.A = shift(ins.op, regs.A);
            } else {
                uint8_t r = shift(ins.op, read(ea, mnemonic(ins.op)));
                write(ea, r, mnemonic(ins.op));
            }
            break;

        // Compares
        case Op::CMP: compare(regs.A, value_of(o)); break;
        case Op::CPX: compare(regs.X, value_of(o)); break;
        case Op::CPY: compare(regs.Y, value_of(o)); break;

        // Branches
        case Op::BCC: branch(static_cast<int8_t>(value_of(o)), !flags.C); break;
        case Op::BCS: branch(static_cast<int8_t>(value_of(o)),  flags.C); break;
        case Op::BEQ: branch(static_cast<int8_t>(value_of(o)),  flags.Z); break;
        case Op::BNE: branch(static_cast<int8_t>(value_of(o)), !flags.Z); break;
        case Op::BMI: branch(static_cast<int8_t>(value_of(o)),  flags.N); break;
        case Op::BPL: branch(static_cast<int8_t>(value_of(o)), !flags.N); break;
        case Op::BVS: branch(static_cast<int8_t>(value_of(o)),  flags.V); break;
        case Op::BVC: branch(static_cast<int8_t>(value_of(o)), !flags.V); break;

        // Jumps and subroutines. PC is set to target-1; step() adds the 1.
        case Op::JMP: PC = static_cast<uint16_t>(ea - 1); break;
        case Op::JSR:
            push16(PC);     // PC is on the last JSR byte: return address - 1
            PC = static_cast<uint16_t>(ea - 1);
            break;
        case Op::RTS: PC = pop16(); break;
        case Op::RTI:
            flags = Flags::unpack(pop() & 0xCF);
            PC = static_cast<uint16_t>(pop16() - 1);
            break;

        // Stack
        case Op::PHA: push(regs.A); break;
        case Op::PHP: push(static_cast<uint8_t>(flags.pack() | F_B | F_U)); break;
        case Op::PLA: regs.A = pop(); flags.setZN(regs.A); break;
        case Op::PLP: flags = Flags::unpack(pop() & 0xCF); break;   // B and bit 5 dropped

        // Flags
        case Op::CLC: flags.C = false; break;
        case Op::CLD: flags.D = false; break;
        case Op::CLI: flags.I = false; break;
        case Op::CLV: flags.V = false; break;
        case Op::SEC: flags.C = true; break;
        case Op::SED: flags.D = true; break;
        case Op::SEI: flags.I = true; break;

        case Op::NOP: break;
        case Op::BRK: halted = true; break;
    }
}
