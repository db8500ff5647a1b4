// include/cpu.hpp
#pragma once
#include <cstdint>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <vector>
#include "addressing.hpp"
#include "bus.hpp"
#include "errors.hpp"
#include "opcodes.hpp"
#include "status.hpp"
#include "trace.hpp"

struct Registers {
    uint8_t A{0}, X{0}, Y{0};
    uint8_t SP{0xFD};       // offset into the stack page
};

struct CPU {
    // Memory map
    static constexpr uint16_t STACK_BASE     = 0x0100;
    static constexpr uint16_t RESET_VECTOR   = 0xFFFC;   // lo at FFFC, hi at FFFD
    static constexpr uint16_t DEFAULT_ORIGIN = 0x0600;

    // Power-on pattern
    static constexpr uint8_t POWER_ON_STATUS = F_U | F_I;   // 0x24
    static constexpr uint8_t POWER_ON_SP     = 0xFD;

    Bus       bus;
    Registers regs;
    Flags     flags;
    uint16_t  PC{0};
    bool      halted{false};         // set by BRK, cleared only by reset()
    std::optional<Fault> fault;      // last fault reported by step()

    // Visual trace timeline (one frame per instruction)
    bool   tracing{false};
    size_t trace_limit{4096};
    std::deque<TraceFrame> timeline;   // oldest first

    CPU();

    // API
    void      reset();
    LoadError load(const std::vector<uint8_t>& image, uint16_t origin = DEFAULT_ORIGIN);
    void      write16(uint16_t addr, uint16_t value);

    // Run controls. Both return the fault that stopped execution, if any.
    std::optional<Fault> step();
    std::optional<Fault> run(const std::function<void(CPU&)>& after_step = {});

    // Invoke the handler for an already-resolved operand. Precondition:
    // operand_fits(ins, o); step() checks it before calling.
    void execute(const Instruction& ins, const Operand& o);

    // Bus access as seen by the core; recorded in the trace when enabled
    uint8_t read(uint16_t addr, const char* note = "");
    void    write(uint16_t addr, uint8_t data, const char* note = "");

    // Operand consumption: advance PC, then read the byte it points at
    uint8_t  fetch8();
    uint16_t fetch16();

    // Stack lives in page 1; SP wraps within it
    void     push(uint8_t v);
    void     push16(uint16_t v);    // high byte first
    uint8_t  pop();
    uint16_t pop16();               // low byte first

    // PC must point at the branch operand. Charges the taken/page-cross cycles.
    void branch(int8_t offset, bool taken);

private:
    Phase phase_{Phase::Fetch};
    std::vector<BusEvent> events_;  // events of the instruction in flight

    std::optional<Fault> raise(FaultKind kind, uint16_t pc, uint8_t opcode);
    void    charge(uint32_t n, const char* note);
    void    push_event(BusDir dir, uint16_t addr, uint8_t data, const char* note);
    void    record_frame(uint16_t pc, uint8_t opcode);

    // Handler helpers (instructions.cpp)
    uint8_t value_of(const Operand& o);
    void    adc(uint8_t v);
    void    compare(uint8_t reg, uint8_t v);
    uint8_t shift(Op op, uint8_t v);
};
