// src/options.cpp
#include "options.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

static bool parse_number(const std::string& s, int base, unsigned long max, unsigned long& out) {
    if (s.empty()) return false;
    std::string t = s;
    if (base == 16) {
        if (t[0] == '$') t = t.substr(1);
        else if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) t = t.substr(2);
    }
    if (t.empty()) return false;
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(t.c_str(), &end, base);
    if (errno != 0 || *end != '\0' || t[0] == '-' || v > max) return false;
    out = v;
    return true;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

bool parse_hex16(const std::string& s, uint16_t& out) {
    unsigned long n = 0;
    if (!parse_number(s, 16, 0xFFFF, n)) return false;
    out = static_cast<uint16_t>(n);
    return true;
}

bool parse_options(int argc, char** argv, Options& opt, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        // Flags taking a value
        auto value = [&](std::string& v) {
            if (i + 1 >= argc) { err = "missing value for " + arg; return false; }
            v = argv[++i];
            return true;
        };
        auto addr = [&](uint16_t& dst) {
            std::string v;
            if (!value(v)) return false;
            if (!parse_hex16(v, dst)) { err = "bad address for " + arg + ": '" + v + "'"; return false; }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            opt.help = true;
        } else if (arg == "--hex") {
            opt.hex = true;
        } else if (arg == "--trace") {
            opt.trace = true;
        } else if (arg == "--batch") {
            opt.batch = true;
        } else if (arg == "--origin") {
            if (!addr(opt.origin)) return false;
        } else if (arg == "--video") {
            if (!addr(opt.video)) return false;
        } else if (arg == "--input") {
            if (!addr(opt.input)) return false;
        } else if (arg == "--random") {
            if (!addr(opt.random)) return false;
        } else if (arg == "--trace-limit" || arg == "--delay-us") {
            std::string v; unsigned long n = 0;
            if (!value(v)) return false;
            if (!parse_number(v, 10, 0xFFFFFFFFul, n)) { err = "bad number for " + arg + ": '" + v + "'"; return false; }
            if (arg == "--trace-limit") opt.trace_limit = static_cast<size_t>(n);
            else opt.delay_us = static_cast<unsigned>(n);
        } else if (!arg.empty() && arg[0] == '-') {
            err = "unknown option " + arg;
            return false;
        } else {
            if (!opt.image.empty()) { err = "more than one image given"; return false; }
            opt.image = arg;
        }
    }
    return true;
}

std::string usage(const char* prog) {
    return std::string("usage: ") + prog + " [options] [IMAGE]\n" +
R"(
Options:
  --origin HEX      load address and reset vector (default 0600)
  --hex             IMAGE is a text file of hex bytes
  --trace           record a bus-level trace of every instruction
  --trace-limit N   keep at most N trace frames (default 4096, 0 = no limit)
  --delay-us N      sleep N microseconds after every step
  --video HEX       framebuffer base, 32x32 bytes (default 0200)
  --input HEX       key latch address (default 00FF)
  --random HEX      random byte address (default 00FE)
  --batch           run to halt, print registers and exit
  -h, --help        this text

Without IMAGE the built-in demo program is loaded.
)";
}
