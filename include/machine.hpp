// include/machine.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <random>
#include "options.hpp"

struct CPU;

// Key codes the demo-style programs poll for in the input latch
static constexpr uint8_t KEY_W = 0x77;
static constexpr uint8_t KEY_A = 0x61;
static constexpr uint8_t KEY_S = 0x73;
static constexpr uint8_t KEY_D = 0x64;

struct Rgb { uint8_t r, g, b; };

// The memory-mapped conventions a frontend imposes on the flat bus between
// steps: a key latch, a random byte and a 32x32 framebuffer.
struct Machine {
    static constexpr int SCREEN_W = 32;
    static constexpr int SCREEN_H = 32;

    Options opt;

    Machine() = default;
    explicit Machine(const Options& o, uint32_t seed = std::random_device{}());

    // Queue a key; one queued key is latched per step.
    void press_key(uint8_t key) { keys_.push_back(key); }
    size_t pending_keys() const { return keys_.size(); }

    // Per-step hook for CPU::run: latch a key, refresh the random byte, pace.
    void after_step(CPU& c);

    uint8_t pixel(const CPU& c, int x, int y) const;

    static Rgb palette(uint8_t colour);

private:
    std::deque<uint8_t> keys_;
    std::mt19937 rng_{std::random_device{}()};
    std::uniform_int_distribution<int> random_byte_{1, 15};
};
