// include/errors.hpp
#pragma once
#include <cstdint>
#include <string>

// Why a step could not complete. Neither kind halts the CPU; the driving
// loop decides what to do with it.
enum class FaultKind {
    UnresolvedOpcode,   // no descriptor for the fetched byte
    OperandMismatch,    // descriptor pairs a handler with the wrong operand kind
};

struct Fault {
    FaultKind kind;
    uint16_t  pc;       // address of the faulting opcode
    uint8_t   opcode;
};

// Image loading failures. A load that reports anything but None wrote nothing.
enum class LoadError {
    None,
    NotFound,
    Unreadable,
    Empty,
    Malformed,
    Oversized,
};

const char* to_string(FaultKind k);
const char* to_string(LoadError e);
std::string describe(const Fault& f);
