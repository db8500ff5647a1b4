// trace6502 - CPU core tests: reset, load, run loop, stack, branches,
// faults and the trace timeline

#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include "cpu.hpp"
#include "demo_program.hpp"
#include "machine.hpp"

// LDA #$10; STA $20; LDA #$01; ADC $20; STA $21; INC $21; LDY $21; INY; BRK
static const std::vector<uint8_t> kSumProgram = {
	0xA9, 0x10, 0x85, 0x20, 0xA9, 0x01, 0x65, 0x20,
	0x85, 0x21, 0xE6, 0x21, 0xA4, 0x21, 0xC8, 0x00,
};

static void boot(CPU& cpu, const std::vector<uint8_t>& program, uint16_t origin = CPU::DEFAULT_ORIGIN) {
	REQUIRE(cpu.load(program, origin) == LoadError::None);
}

// Cycles charged by one step
static uint64_t step_cycles(CPU& cpu) {
	const uint64_t before = cpu.bus.cycles;
	REQUIRE_FALSE(cpu.step());
	return cpu.bus.cycles - before;
}

TEST_CASE("CPU reset and load", "[cpu][reset]") {
	CPU cpu;

	SECTION("Power-on pattern") {
		REQUIRE(cpu.regs.A == 0);
		REQUIRE(cpu.regs.X == 0);
		REQUIRE(cpu.regs.Y == 0);
		REQUIRE(cpu.regs.SP == 0xFD);
		REQUIRE(cpu.flags.pack() == 0x24);
		REQUIRE_FALSE(cpu.halted);
	}

	SECTION("Load copies the image and points the reset vector at it") {
		boot(cpu, {0xEA, 0xEA, 0x00}, 0x8000);
		REQUIRE(cpu.PC == 0x8000);
		REQUIRE(cpu.bus.read(0xFFFC) == 0x00);
		REQUIRE(cpu.bus.read(0xFFFD) == 0x80);
		REQUIRE(cpu.bus.read(0x8002) == 0x00);
		REQUIRE(cpu.bus.read(0x8000) == 0xEA);
	}

	SECTION("Reset reloads PC from the vector and restores registers") {
		boot(cpu, kSumProgram);
		REQUIRE_FALSE(cpu.run());
		cpu.write16(CPU::RESET_VECTOR, 0x0604);
		cpu.reset();
		REQUIRE(cpu.PC == 0x0604);
		REQUIRE(cpu.regs.A == 0);
		REQUIRE(cpu.regs.SP == 0xFD);
		REQUIRE_FALSE(cpu.halted);
		REQUIRE(cpu.bus.cycles == 0);
		REQUIRE(cpu.bus.read(0x0020) == 0x10);   // memory survives reset
	}

	SECTION("Oversized images are rejected without writing") {
		std::vector<uint8_t> big(0x20, 0xAA);
		REQUIRE(cpu.load(big, 0xFFF0) == LoadError::Oversized);
		REQUIRE(cpu.bus.read(0xFFF0) == 0x00);
		REQUIRE(cpu.bus.read(0xFFFC) == 0x00);
	}
}

TEST_CASE("End-to-end program", "[cpu][run]") {
	CPU cpu;
	boot(cpu, kSumProgram);

	REQUIRE_FALSE(cpu.run());
	REQUIRE(cpu.halted);
	REQUIRE(cpu.bus.read(0x0020) == 0x10);
	REQUIRE(cpu.bus.read(0x0021) == 0x12);
	REQUIRE(cpu.regs.A == 0x11);
	REQUIRE(cpu.regs.Y == 0x13);
	REQUIRE(cpu.PC == 0x0610);
	// 2+3+2+3+3+5+3+2+7
	REQUIRE(cpu.bus.cycles == 30);
}

TEST_CASE("Run loop callback", "[cpu][run]") {
	CPU cpu;
	boot(cpu, {0xEA, 0xEA, 0xEA, 0x00});

	int calls = 0;
	REQUIRE_FALSE(cpu.run([&](CPU& c) {
		++calls;
		c.bus.write(0x00FE, static_cast<uint8_t>(calls));
	}));
	REQUIRE(calls == 4);
	REQUIRE(cpu.bus.read(0x00FE) == 4);

	SECTION("A halted CPU does not step") {
		const uint16_t pc = cpu.PC;
		REQUIRE_FALSE(cpu.step());
		REQUIRE(cpu.PC == pc);
		REQUIRE_FALSE(cpu.run([&](CPU&) { ++calls; }));
		REQUIRE(calls == 4);
	}
}

TEST_CASE("Stack discipline", "[cpu][stack]") {
	CPU cpu;

	SECTION("16-bit round trip, high byte pushed first") {
		cpu.push16(0xBEEF);
		REQUIRE(cpu.regs.SP == 0xFB);
		REQUIRE(cpu.bus.read(0x01FD) == 0xBE);
		REQUIRE(cpu.bus.read(0x01FC) == 0xEF);
		REQUIRE(cpu.pop16() == 0xBEEF);
		REQUIRE(cpu.regs.SP == 0xFD);
	}

	SECTION("Stack pointer wraps inside page 1") {
		cpu.regs.SP = 0x00;
		cpu.push(0x42);
		REQUIRE(cpu.bus.read(0x0100) == 0x42);
		REQUIRE(cpu.regs.SP == 0xFF);
		REQUIRE(cpu.pop() == 0x42);
		REQUIRE(cpu.regs.SP == 0x00);
	}

	SECTION("JSR then RTS returns to the next instruction") {
		// $0600 JSR $0610 ; $0603 LDA #$42 ; $0605 BRK ; $0610 RTS
		std::vector<uint8_t> p(0x11, 0xEA);
		p[0x00] = 0x20; p[0x01] = 0x10; p[0x02] = 0x06;
		p[0x03] = 0xA9; p[0x04] = 0x42;
		p[0x05] = 0x00;
		p[0x10] = 0x60;
		boot(cpu, p);

		REQUIRE(step_cycles(cpu) == 6);
		REQUIRE(cpu.PC == 0x0610);
		REQUIRE(cpu.regs.SP == 0xFB);
		REQUIRE(cpu.bus.read(0x01FD) == 0x06);
		REQUIRE(cpu.bus.read(0x01FC) == 0x02);

		REQUIRE(step_cycles(cpu) == 6);
		REQUIRE(cpu.PC == 0x0603);
		REQUIRE(cpu.regs.SP == 0xFD);

		REQUIRE_FALSE(cpu.run());
		REQUIRE(cpu.regs.A == 0x42);
	}
}

TEST_CASE("Branch timing", "[cpu][branch]") {
	CPU cpu;

	SECTION("Untaken branch costs the base cycles only") {
		boot(cpu, {0xA9, 0x00, 0xD0, 0x05, 0x00});   // LDA #0 ; BNE +5
		REQUIRE_FALSE(cpu.step());
		REQUIRE(step_cycles(cpu) == 2);
		REQUIRE(cpu.PC == 0x0604);
	}

	SECTION("Taken branch within the page costs one more") {
		boot(cpu, {0xA9, 0x01, 0xD0, 0x02, 0x00, 0x00, 0x00});
		REQUIRE_FALSE(cpu.step());
		REQUIRE(step_cycles(cpu) == 3);
		REQUIRE(cpu.PC == 0x0606);
	}

	SECTION("Taken branch across a page costs two more") {
		boot(cpu, {0xD0, 0x10}, 0x06FC);              // Z is clear after reset
		REQUIRE(step_cycles(cpu) == 4);
		REQUIRE(cpu.PC == 0x070E);
	}

	SECTION("Backward branch") {
		boot(cpu, {0xEA, 0xEA, 0xF0, 0xFC});          // BEQ back to $0600
		cpu.flags.Z = true;
		REQUIRE_FALSE(cpu.step());
		REQUIRE_FALSE(cpu.step());
		REQUIRE(step_cycles(cpu) == 3);
		REQUIRE(cpu.PC == 0x0600);
	}
}

TEST_CASE("Page-cross penalty", "[cpu][timing]") {
	CPU cpu;

	SECTION("LDA absolute,X") {
		boot(cpu, {0xA2, 0x01, 0xBD, 0xFF, 0x06, 0xBD, 0x00, 0x06});
		REQUIRE(step_cycles(cpu) == 2);
		REQUIRE(step_cycles(cpu) == 5);
		REQUIRE(step_cycles(cpu) == 4);
	}

	SECTION("Stores are charged too") {
		boot(cpu, {0xA2, 0x01, 0x9D, 0xFF, 0x02});    // STA $02FF,X
		REQUIRE_FALSE(cpu.step());
		REQUIRE(step_cycles(cpu) == 6);
		REQUIRE(cpu.bus.read(0x0300) == 0x00);
	}
}

TEST_CASE("Unresolved opcode", "[cpu][fault]") {
	CPU cpu;
	boot(cpu, {0xA9, 0x33, 0x02, 0x00});
	REQUIRE_FALSE(cpu.step());

	const auto mem_before = cpu.bus.mem;
	const Registers regs = cpu.regs;
	const uint8_t status = cpu.flags.pack();
	const uint64_t cycles = cpu.bus.cycles;

	std::optional<Fault> f = cpu.step();
	REQUIRE(f);
	REQUIRE(f->kind == FaultKind::UnresolvedOpcode);
	REQUIRE(f->pc == 0x0602);
	REQUIRE(f->opcode == 0x02);
	REQUIRE(describe(*f) == "unresolved opcode $02 at $0602");

	REQUIRE(cpu.PC == 0x0602);
	REQUIRE(cpu.regs.A == regs.A);
	REQUIRE(cpu.regs.X == regs.X);
	REQUIRE(cpu.regs.Y == regs.Y);
	REQUIRE(cpu.regs.SP == regs.SP);
	REQUIRE(cpu.flags.pack() == status);
	REQUIRE(cpu.bus.cycles == cycles);
	REQUIRE(cpu.bus.mem == mem_before);
	REQUIRE_FALSE(cpu.halted);
	REQUIRE(cpu.fault);

	SECTION("run stops on the fault and reports it") {
		int calls = 0;
		std::optional<Fault> r = cpu.run([&](CPU&) { ++calls; });
		REQUIRE(r);
		REQUIRE(r->pc == 0x0602);
		REQUIRE(calls == 0);
	}

	SECTION("reset clears the fault") {
		cpu.reset();
		REQUIRE_FALSE(cpu.fault);
	}
}

TEST_CASE("Trace timeline", "[cpu][trace]") {
	CPU cpu;
	boot(cpu, kSumProgram);

	SECTION("Off by default") {
		REQUIRE_FALSE(cpu.run());
		REQUIRE(cpu.timeline.empty());
	}

	SECTION("One frame per instruction with its bus events") {
		cpu.tracing = true;
		REQUIRE_FALSE(cpu.run());
		REQUIRE(cpu.timeline.size() == 9);

		const TraceFrame& lda = cpu.timeline[0];
		REQUIRE(lda.pc == 0x0600);
		REQUIRE(lda.opcode == 0xA9);
		REQUIRE(lda.a == 0x10);
		REQUIRE(lda.cycle == 2);
		REQUIRE_FALSE(lda.events.empty());
		REQUIRE(lda.events.front().dir == BusDir::Read);
		REQUIRE(lda.events.front().phase == Phase::Fetch);
		REQUIRE(lda.events.front().address == 0x0600);

		const TraceFrame& sta = cpu.timeline[1];
		bool wrote = false;
		for (const BusEvent& e : sta.events) {
			if (e.dir == BusDir::Write) {
				REQUIRE(e.address == 0x0020);
				REQUIRE(e.data == 0x10);
				REQUIRE(e.phase == Phase::Execute);
				wrote = true;
			}
		}
		REQUIRE(wrote);
		REQUIRE(cpu.timeline.back().opcode == 0x00);
		REQUIRE(std::string(phase_name(Phase::Resolve)) == "RES");
	}

	SECTION("Bounded by trace_limit") {
		cpu.tracing = true;
		cpu.trace_limit = 3;
		REQUIRE_FALSE(cpu.run());
		REQUIRE(cpu.timeline.size() == 3);
		REQUIRE(cpu.timeline.front().opcode == 0xA4);
		REQUIRE(cpu.timeline.back().opcode == 0x00);

		cpu.reset();
		REQUIRE(cpu.timeline.empty());
	}

	SECTION("A long run keeps only the newest frames, in order") {
		boot(cpu, {0xE8, 0x4C, 0x00, 0x06});   // INX ; JMP $0600
		cpu.tracing = true;
		cpu.trace_limit = 3;
		for (int i = 0; i < 10000; ++i)
			REQUIRE_FALSE(cpu.step());

		REQUIRE(cpu.timeline.size() == 3);
		REQUIRE(cpu.regs.X == 0x88);            // 5000 & $FF
		REQUIRE(cpu.timeline[0].opcode == 0x4C);
		REQUIRE(cpu.timeline[1].opcode == 0xE8);
		REQUIRE(cpu.timeline[2].opcode == 0x4C);
		REQUIRE(cpu.timeline[2].cycle == cpu.bus.cycles);
		REQUIRE(cpu.timeline[1].cycle == cpu.timeline[2].cycle - 3);
		REQUIRE(cpu.timeline[0].cycle == cpu.timeline[1].cycle - 2);
		REQUIRE(cpu.timeline[1].x == 0x88);
	}
}

TEST_CASE("Demo program on the machine conventions", "[cpu][machine]") {
	Options opt;
	Machine m(opt, 1234);
	CPU cpu;
	boot(cpu, demo_program());

	m.press_key(KEY_D);
	REQUIRE(m.pending_keys() == 1);

	REQUIRE_FALSE(cpu.run([&](CPU& c) { m.after_step(c); }));
	REQUIRE(cpu.halted);
	REQUIRE(m.pending_keys() == 0);
	REQUIRE(cpu.bus.read(opt.input) == KEY_D);

	for (uint16_t a = 0x0200; a < 0x0600; ++a) {
		const uint8_t v = cpu.bus.read(a);
		REQUIRE(v >= 1);
		REQUIRE(v <= 15);
	}
	const uint8_t r = cpu.bus.read(opt.random);
	REQUIRE(r >= 1);
	REQUIRE(r <= 15);

	REQUIRE(m.pixel(cpu, 0, 0) == cpu.bus.read(0x0200));
	REQUIRE(m.pixel(cpu, 31, 31) == cpu.bus.read(0x05FF));
}

TEST_CASE("Machine palette", "[machine]") {
	const Rgb black = Machine::palette(0);
	REQUIRE((black.r == 0 && black.g == 0 && black.b == 0));
	const Rgb white = Machine::palette(1);
	REQUIRE((white.r == 255 && white.g == 255 && white.b == 255));
	REQUIRE(Machine::palette(2).r == Machine::palette(9).r);
	const Rgb cyan = Machine::palette(15);
	REQUIRE((cyan.r == 0 && cyan.g == 255 && cyan.b == 255));
}
