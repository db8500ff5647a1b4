// include/trace.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Part of a step a bus event happened in.
enum class Phase {
    Fetch, Resolve, Execute
};

enum class BusDir { Read, Write, None };   // None: cycles spent without a transfer

struct BusEvent {
    uint64_t cycle;        // bus cycle count when the event happened
    Phase    phase;
    BusDir   dir;
    uint16_t address;      // memory address (PC for None events)
    uint8_t  data;         // byte transferred, or cycles charged for None
    std::string note;      // e.g., "opcode fetch", "STA", "page cross"
};

struct TraceFrame {
    // Snapshot after each completed instruction
    uint64_t cycle;
    uint16_t pc;           // address the instruction was fetched from
    uint8_t  opcode;
    uint8_t  a, x, y, sp, status;
    std::vector<BusEvent> events; // events emitted by this instruction
};

const char* phase_name(Phase p);
