// include/options.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "cpu.hpp"

// Machine conventions and run settings shared by the CLI and GUI frontends.
struct Options {
    std::string image;                 // empty: run the built-in demo
    bool        hex{false};            // image is hex text, not raw binary
    uint16_t    origin{CPU::DEFAULT_ORIGIN};

    bool        trace{false};
    size_t      trace_limit{4096};
    unsigned    delay_us{0};           // sleep after each step in the run loop

    uint16_t    video{0x0200};         // 32x32 framebuffer, one byte per pixel
    uint16_t    input{0x00FF};         // last key pressed
    uint16_t    random{0x00FE};        // fresh random byte every step

    bool        batch{false};
    bool        help{false};
};

// Returns false and fills err on a bad command line.
bool parse_options(int argc, char** argv, Options& opt, std::string& err);

std::string usage(const char* prog);

// ASCII lowercase; bytes outside ASCII pass through unchanged.
std::string lowercase(std::string s);

// "0600", "$0600" or "0x0600"; false on anything else or a value over FFFF.
bool parse_hex16(const std::string& s, uint16_t& out);
