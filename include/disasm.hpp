// include/disasm.hpp
#pragma once
#include <cstdint>
#include <string>

struct Bus;

std::string hex8(uint8_t v);     // "0F"
std::string hex16(uint16_t v);   // "060F"

// Opcode plus operand bytes; 1 for bytes with no table entry.
int instruction_length(uint8_t opcode);

// One line per instruction, e.g. "0600:  A9 10      LDA #$10".
// Bytes with no table entry come out as ".DB $xx".
std::string disassemble(const Bus& bus, uint16_t pc, int* length = nullptr);
