#include "errors.hpp"
#include <cstdio>

const char* to_string(FaultKind k) {
    switch (k) {
        case FaultKind::UnresolvedOpcode: return "unresolved opcode";
        case FaultKind::OperandMismatch:  return "operand mismatch";
    }
    return "?";
}

const char* to_string(LoadError e) {
    switch (e) {
        case LoadError::None:       return "ok";
        case LoadError::NotFound:   return "file not found";
        case LoadError::Unreadable: return "file unreadable";
        case LoadError::Empty:      return "image is empty";
        case LoadError::Malformed:  return "malformed image";
        case LoadError::Oversized:  return "image does not fit in the address space";
    }
    return "?";
}

std::string describe(const Fault& f) {
    char buf[64];
    std::snprintf(buf, sizeof buf, "%s $%02X at $%04X", to_string(f.kind), f.opcode, f.pc);
    return buf;
}
