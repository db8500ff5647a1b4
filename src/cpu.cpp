#include "cpu.hpp"
#include <utility>

CPU::CPU() {
    reset();
}

void CPU::reset() {
    regs = Registers{};
    regs.SP = POWER_ON_SP;
    flags = Flags::unpack(POWER_ON_STATUS);
    PC = join_bytes(bus.read(RESET_VECTOR), bus.read(RESET_VECTOR + 1));
    halted = false;
    fault.reset();
    bus.cycles = 0;
    phase_ = Phase::Fetch;
    events_.clear();
    timeline.clear();
}

LoadError CPU::load(const std::vector<uint8_t>& image, uint16_t origin) {
    if (static_cast<size_t>(origin) + image.size() > Bus::MEM_SIZE) return LoadError::Oversized;
    bus.load(image, origin);
    write16(RESET_VECTOR, origin);
    reset();
    return LoadError::None;
}

void CPU::write16(uint16_t addr, uint16_t value) {
    bus.write(addr, static_cast<uint8_t>(value & 0xFF));
    bus.write(static_cast<uint16_t>(addr + 1), static_cast<uint8_t>(value >> 8));
}

void CPU::push_event(BusDir dir, uint16_t addr, uint8_t data, const char* note) {
    events_.push_back(BusEvent{bus.cycles, phase_, dir, addr, data, note});
}

uint8_t CPU::read(uint16_t addr, const char* note) {
    uint8_t v = bus.read(addr);
    if (tracing) push_event(BusDir::Read, addr, v, note);
    return v;
}

void CPU::write(uint16_t addr, uint8_t data, const char* note) {
    bus.write(addr, data);
    if (tracing) push_event(BusDir::Write, addr, data, note);
}

void CPU::charge(uint32_t n, const char* note) {
    bus.tick(n);
    if (tracing) push_event(BusDir::None, PC, static_cast<uint8_t>(n), note);
}

uint8_t CPU::fetch8() {
    PC = static_cast<uint16_t>(PC + 1);
    return read(PC, "operand");
}

uint16_t CPU::fetch16() {
    PC = static_cast<uint16_t>(PC + 1);
    uint8_t lo = read(PC, "operand lo");
    PC = static_cast<uint16_t>(PC + 1);
    uint8_t hi = read(PC, "operand hi");
    return join_bytes(lo, hi);
}

void CPU::push(uint8_t v) {
    write(static_cast<uint16_t>(STACK_BASE | regs.SP), v, "push");
    regs.SP = static_cast<uint8_t>(regs.SP - 1);
}

void CPU::push16(uint16_t v) {
    const uint8_t hi = static_cast<uint8_t>(v >> 8);
    const uint8_t lo = static_cast<uint8_t>(v & 0xFF);
    push(hi);
    push(lo);
}

uint8_t CPU::pop() {
    regs.SP = static_cast<uint8_t>(regs.SP + 1);
    return read(static_cast<uint16_t>(STACK_BASE | regs.SP), "pop");
}

uint16_t CPU::pop16() {
    uint8_t lo = pop();
    uint8_t hi = pop();
    return join_bytes(lo, hi);
}

void CPU::branch(int8_t offset, bool taken) {
    if (!taken) return;
    charge(1, "branch taken");
    // Relative to the instruction after the branch
    const uint16_t next = static_cast<uint16_t>(PC + 1);
    const uint16_t target = static_cast<uint16_t>(next + offset);
    if (page_crossed(next, target)) charge(1, "branch page cross");
    PC = static_cast<uint16_t>(target - 1);   // step() adds the final 1
}

std::optional<Fault> CPU::raise(FaultKind kind, uint16_t pc, uint8_t opcode) {
    PC = pc;
    fault = Fault{kind, pc, opcode};
    return fault;
}

std::optional<Fault> CPU::step() {
    if (halted) return std::nullopt;

    events_.clear();
    const uint16_t start = PC;

    phase_ = Phase::Fetch;
    const uint8_t opcode = read(PC, "opcode fetch");
    const std::optional<Instruction> ins = lookup(opcode);
    if (!ins) return raise(FaultKind::UnresolvedOpcode, start, opcode);

    phase_ = Phase::Resolve;
    const Resolved res = resolve(ins->mode, *this);
    if (!operand_fits(*ins, res.operand)) return raise(FaultKind::OperandMismatch, start, opcode);

    charge(ins->cycles, mnemonic(ins->op));
    if (res.page_crossed) charge(1, "page cross");

    phase_ = Phase::Execute;
    execute(*ins, res.operand);
    PC = static_cast<uint16_t>(PC + 1);

    if (tracing) record_frame(start, opcode);
    return std::nullopt;
}

std::optional<Fault> CPU::run(const std::function<void(CPU&)>& after_step) {
    while (!halted) {
        if (std::optional<Fault> f = step()) return f;
        if (after_step) after_step(*this);
    }
    return std::nullopt;
}

void CPU::record_frame(uint16_t pc, uint8_t opcode) {
    TraceFrame tf{
        bus.cycles, pc, opcode, regs.A, regs.X, regs.Y, regs.SP, flags.pack(), events_
    };
    timeline.push_back(std::move(tf));
    while (trace_limit > 0 && timeline.size() > trace_limit)
        timeline.pop_front();
}
