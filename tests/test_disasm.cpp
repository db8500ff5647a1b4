// trace6502 - disassembler tests

#include <catch2/catch.hpp>
#include <initializer_list>
#include <string>
#include "bus.hpp"
#include "disasm.hpp"

static void poke(Bus& bus, uint16_t addr, std::initializer_list<uint8_t> bytes) {
	for (uint8_t b : bytes) bus.write(addr++, b);
}

TEST_CASE("Disassembler line format", "[disasm]") {
	Bus bus;
	int len = 0;

	SECTION("Immediate") {
		poke(bus, 0x0600, {0xA9, 0x10});
		REQUIRE(disassemble(bus, 0x0600, &len) == "0600:  A9 10      LDA #$10");
		REQUIRE(len == 2);
	}

	SECTION("Absolute") {
		poke(bus, 0x0602, {0x8D, 0x00, 0x02});
		REQUIRE(disassemble(bus, 0x0602, &len) == "0602:  8D 00 02   STA $0200");
		REQUIRE(len == 3);
	}

	SECTION("Implied and accumulator") {
		poke(bus, 0x0605, {0xEA, 0x0A});
		REQUIRE(disassemble(bus, 0x0605, &len) == "0605:  EA         NOP");
		REQUIRE(len == 1);
		REQUIRE(disassemble(bus, 0x0606) == "0606:  0A         ASL A");
	}

	SECTION("Unknown opcode is data") {
		poke(bus, 0x0700, {0x02});
		REQUIRE(disassemble(bus, 0x0700, &len) == "0700:  02         .DB $02");
		REQUIRE(len == 1);
	}

	SECTION("Branch targets are absolute") {
		poke(bus, 0x0600, {0xD0, 0xFE});
		REQUIRE(disassemble(bus, 0x0600) == "0600:  D0 FE      BNE $0600");
		poke(bus, 0x0610, {0xF0, 0x10});
		REQUIRE(disassemble(bus, 0x0610) == "0610:  F0 10      BEQ $0622");
	}

	SECTION("Indexed and indirect modes") {
		poke(bus, 0x0000, {0xB1, 0x20, 0x6C, 0xFF, 0x10, 0x81, 0x40, 0xB6, 0x05, 0x7D, 0x34, 0x12});
		REQUIRE(disassemble(bus, 0x0000) == "0000:  B1 20      LDA ($20),Y");
		REQUIRE(disassemble(bus, 0x0002) == "0002:  6C FF 10   JMP ($10FF)");
		REQUIRE(disassemble(bus, 0x0005) == "0005:  81 40      STA ($40,X)");
		REQUIRE(disassemble(bus, 0x0007) == "0007:  B6 05      LDX $05,Y");
		REQUIRE(disassemble(bus, 0x0009) == "0009:  7D 34 12   ADC $1234,X");
	}
}

TEST_CASE("Instruction length", "[disasm]") {
	REQUIRE(instruction_length(0x00) == 1);
	REQUIRE(instruction_length(0xA9) == 2);
	REQUIRE(instruction_length(0x4C) == 3);
	REQUIRE(instruction_length(0x02) == 1);
	REQUIRE(hex8(0x0F) == "0F");
	REQUIRE(hex16(0xBEEF) == "BEEF");
}
