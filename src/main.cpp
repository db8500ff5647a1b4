// src/main.cpp
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <unordered_set>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <chrono>
#include <thread>

#include "cpu.hpp"
#include "demo_program.hpp"
#include "disasm.hpp"
#include "loader.hpp"
#include "machine.hpp"
#include "options.hpp"

// Steps a --batch run may take before it is treated as a runaway program.
static constexpr uint64_t kBatchStepLimit = 50'000'000;

static std::string flag_string(const Flags& f) {
    std::string s = "nv-bdizc";
    if (f.N) s[0] = 'N';
    if (f.V) s[1] = 'V';
    if (f.B) s[3] = 'B';
    if (f.D) s[4] = 'D';
    if (f.I) s[5] = 'I';
    if (f.Z) s[6] = 'Z';
    if (f.C) s[7] = 'C';
    return s;
}

static void print_regs(const CPU& c) {
    std::cout << "PC="<<hex16(c.PC)
              << "  A="<<hex8(c.regs.A)
              << "  X="<<hex8(c.regs.X)
              << "  Y="<<hex8(c.regs.Y)
              << "  SP="<<hex8(c.regs.SP)
              << "  P="<<hex8(c.flags.pack()) << " [" << flag_string(c.flags) << "]"
              << "  cycles="<<std::dec<<c.bus.cycles
              << (c.halted ? "  HALTED" : "") << "\n";
    if (c.fault) std::cout << "last fault: " << describe(*c.fault) << "\n";
}

static void report_fault(const Fault& f) {
    std::cerr << "[cpu] " << describe(f) << "\n";
}

static void dump_mem(const CPU& c, uint16_t base, int rows=8, int cols=16) {
    for (int r = 0; r < rows; r++) {
        uint16_t addr = static_cast<uint16_t>(base + r*cols);
        std::cout << hex16(addr) << ": ";
        for (int ccol = 0; ccol < cols; ccol++) {
            std::cout << hex8(c.bus.read(static_cast<uint16_t>(addr + ccol))) << ' ';
        }
        std::cout << "\n";
    }
}

static void disasm_range(const CPU& c, uint16_t start, int count_instrs) {
    uint16_t pc = start;
    for (int i = 0; i < count_instrs; ++i) {
        int len = 1;
        std::cout << disassemble(c.bus, pc, &len) << "\n";
        pc = static_cast<uint16_t>(pc + len);
    }
}

// Print the last K trace frames (bus view per instruction)
static void print_trace(const CPU& c, int k) {
    if (c.timeline.empty()) {
        std::cout << (c.tracing ? "(no trace yet)\n" : "(tracing is off, start with --trace)\n");
        return;
    }
    int start = std::max(0, static_cast<int>(c.timeline.size()) - k);
    for (int i = start; i < static_cast<int>(c.timeline.size()); ++i) {
        const auto& t = c.timeline[i];
        std::cout << std::dec << t.cycle << "  "
                  << hex16(t.pc) << "  "
                  << hex8(t.opcode) << "  "
                  << hex8(t.a) << " " << hex8(t.x) << " " << hex8(t.y) << " "
                  << hex8(t.sp) << " " << hex8(t.status)
                  << "  events:" << t.events.size() << "\n";
        for (const auto& e : t.events) {
            const char* dir = e.dir == BusDir::Read ? "RD" : e.dir == BusDir::Write ? "WR" : "--";
            std::cout << "    " << phase_name(e.phase) << " " << dir;
            if (e.dir == BusDir::None)
                std::cout << " +" << int(e.data) << " cyc";
            else
                std::cout << " [" << hex16(e.address) << "] = " << hex8(e.data);
            std::cout << "  " << e.note << "\n";
        }
    }
}

static int run_batch(CPU& cpu, Machine& m) {
    uint64_t steps = 0;
    std::optional<Fault> f = cpu.run([&](CPU& c) {
        m.after_step(c);
        if (++steps >= kBatchStepLimit) {
            std::cerr << "[batch] no BRK after " << steps << " steps, giving up\n";
            print_regs(c);
            std::exit(3);
        }
    });
    print_regs(cpu);
    if (f) {
        report_fault(*f);
        return 2;
    }
    return 0;
}

// Loads a file given to a REPL command; reports through the loaders' own tags.
static void load_into_memory(CPU& cpu, const std::string& tag, bool hex,
                             const std::string& path, uint16_t base) {
    std::vector<uint8_t> buf;
    LoadError err = hex ? read_file_hexbytes(path, buf) : read_file_binary(path, buf);
    if (err != LoadError::None) {
        std::cout << tag << " failed to read '" << path << "': " << to_string(err) << "\n";
        return;
    }
    if (static_cast<size_t>(base) + buf.size() > Bus::MEM_SIZE) {
        std::cout << tag << " " << to_string(LoadError::Oversized) << " at " << hex16(base) << "\n";
        return;
    }
    cpu.bus.load(buf, base);
    std::cout << tag << " loaded " << std::dec << buf.size() << " bytes at " << hex16(base) << "\n";
}

int main(int argc, char** argv) {
    Machine m;
    std::string err;
    if (!parse_options(argc, argv, m.opt, err)) {
        std::cerr << "[trace6502] " << err << "\n" << usage(argv[0]);
        return 1;
    }
    if (m.opt.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    CPU cpu;
    // The demo only uses relative branches, so any origin works
    LoadError le = m.opt.image.empty()
                       ? cpu.load(demo_program(), m.opt.origin)
                       : load_image(cpu, m.opt.image, m.opt.hex, m.opt.origin);
    if (le != LoadError::None) {
        std::cerr << "[trace6502] cannot load '" << m.opt.image << "': " << to_string(le) << "\n";
        return 1;
    }
    cpu.tracing = m.opt.trace;
    cpu.trace_limit = m.opt.trace_limit;

    if (m.opt.batch) return run_batch(cpu, m);

    std::unordered_set<uint16_t> breakpoints;

    // One instruction; false when the CPU did not advance.
    auto step_once = [&]() {
        if (cpu.halted) return false;
        if (std::optional<Fault> f = cpu.step()) {
            report_fault(*f);
            return false;
        }
        m.after_step(cpu);
        return true;
    };

    std::cout << "trace6502 monitor\n";
    std::cout << "Type 'help' for commands.\n\n";
    print_regs(cpu);

    std::string line;
    while (true) {
        std::cout << "\n> " << std::flush;
        if (!std::getline(std::cin, line)) break;

        std::istringstream iss(line);
        std::string cmd; iss >> cmd;
        if (cmd.empty()) continue;

        cmd = lowercase(cmd);

        if (cmd=="q" || cmd=="quit" || cmd=="exit") {
            break;
        }
        else if (cmd=="help" || cmd=="h" || cmd=="?") {
            std::cout <<
R"(Commands:
  s                 step one instruction
  r N               run N instructions
  g                 run until halt, fault or breakpoint
  p                 print registers
  m ADDR [ROWS]     dump memory from hex ADDR (default 8 rows of 16)
  w ADDR BYTE       write BYTE at ADDR (both hex)
  b ADDR            add breakpoint at PC==ADDR (hex)
  bl                list breakpoints
  bc [ADDR]         clear breakpoint at ADDR or all if none
  t [K]             show last K trace frames (default 20)
  d ADDR [N]        disassemble N instructions starting at ADDR (default 16)
  loadhex FILE ADDR load a hex-text file into memory at ADDR
  loadbin FILE ADDR load a binary file into memory at ADDR
  setrv ADDR        set the reset vector (takes effect on reset)
  reset             reset CPU from the reset vector and clear trace
  sleep MS          sleep for MS milliseconds
  help              this text
  quit              exit
)";
        }
        else if (cmd=="s") {
            step_once();
            print_regs(cpu);
        }
        else if (cmd=="r") {
            int n=0; iss>>n; if (n<=0) n=1;
            for (int i=0; i<n && !cpu.halted; i++) {
                if (i > 0 && breakpoints.count(cpu.PC)) { std::cout<<"* Breakpoint hit at PC="<<hex16(cpu.PC)<<"\n"; break; }
                if (!step_once()) break;
            }
            print_regs(cpu);
        }
        else if (cmd=="g") {
            bool first = true;
            while (!cpu.halted) {
                if (!first && breakpoints.count(cpu.PC)) { std::cout<<"* Breakpoint hit at PC="<<hex16(cpu.PC)<<"\n"; break; }
                first = false;
                if (!step_once()) break;
            }
            print_regs(cpu);
        }
        else if (cmd=="p") {
            print_regs(cpu);
        }
        else if (cmd=="m") {
            std::string saddr; int rows=8; iss>>saddr>>rows;
            uint16_t addr = 0;
            if (!parse_hex16(saddr, addr)) { std::cout<<"usage: m ADDR [ROWS]\n"; continue; }
            dump_mem(cpu, addr, rows > 0 ? rows : 8, 16);
        }
        else if (cmd=="w") {
            std::string saddr, sbyte; iss>>saddr>>sbyte;
            uint16_t addr = 0, val = 0;
            if (!parse_hex16(saddr, addr) || !parse_hex16(sbyte, val) || val > 0xFF) {
                std::cout<<"usage: w ADDR BYTE\n"; continue;
            }
            cpu.bus.write(addr, static_cast<uint8_t>(val));
            std::cout<<"Wrote "<<hex8(static_cast<uint8_t>(val))<<" to ["<<hex16(addr)<<"]\n";
        }
        else if (cmd=="b") {
            std::string saddr; iss>>saddr;
            uint16_t addr = 0;
            if (!parse_hex16(saddr, addr)) { std::cout<<"usage: b ADDR\n"; continue; }
            breakpoints.insert(addr);
            std::cout<<"Breakpoint added at PC="<<hex16(addr)<<"\n";
        }
        else if (cmd=="bl") {
            if (breakpoints.empty()) std::cout<<"(no breakpoints)\n";
            for (auto pc : breakpoints) std::cout<<" - "<<hex16(pc)<<"\n";
        }
        else if (cmd=="bc") {
            std::string saddr; iss>>saddr;
            uint16_t addr = 0;
            if (saddr.empty()) { breakpoints.clear(); std::cout<<"Breakpoints cleared.\n"; }
            else if (!parse_hex16(saddr, addr)) { std::cout<<"usage: bc [ADDR]\n"; }
            else {
                breakpoints.erase(addr);
                std::cout<<"Cleared "<<hex16(addr)<<"\n";
            }
        }
        else if (cmd=="t") {
            int k=20; iss>>k; if (k<=0) k=20;
            print_trace(cpu, k);
        }
        else if (cmd=="d" || cmd=="dis" || cmd=="disasm") {
            std::string saddr; int n = 16;
            iss >> saddr >> n;
            uint16_t addr = 0;
            if (saddr.empty()) addr = cpu.PC;
            else if (!parse_hex16(saddr, addr)) { std::cout << "usage: d [ADDR] [N]\n"; continue; }
            if (n <= 0) n = 16;
            disasm_range(cpu, addr, n);
        }
        else if (cmd=="loadbin" || cmd=="loadhex") {
            std::string path, saddr; iss >> path >> saddr;
            uint16_t base = 0;
            if (path.empty() || !parse_hex16(saddr, base)) { std::cout<<"usage: "<<cmd<<" <path> <addr-hex>\n"; continue; }
            load_into_memory(cpu, "[" + cmd + "]", cmd == "loadhex", path, base);
        }
        else if (cmd=="setrv") {
            // little-endian address stored at FFFC/FFFD
            std::string saddr; iss >> saddr;
            uint16_t start = 0;
            if (!parse_hex16(saddr, start)) { std::cout<<"usage: setrv <addr-hex>\n"; continue; }
            cpu.write16(CPU::RESET_VECTOR, start);
            std::cout<<"[setrv] reset vector set to "<<hex16(start)<<"\n";
        }
        else if (cmd=="reset") {
            cpu.reset();
            std::cout<<"Reset done.\n";
            print_regs(cpu);
        }
        else if (cmd=="sleep") {
            int ms=0; iss>>ms; if (ms>0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
        else {
            std::cout<<"Unknown command. Type 'help'.\n";
        }
    }

    return 0;
}
