#include "machine.hpp"

#include <chrono>
#include <thread>

#include "cpu.hpp"

Machine::Machine(const Options& o, uint32_t seed) : opt(o), rng_(seed) {}

void Machine::after_step(CPU& c) {
    if (!keys_.empty()) {
        c.bus.write(opt.input, keys_.front());
        keys_.pop_front();
    }
    c.bus.write(opt.random, static_cast<uint8_t>(random_byte_(rng_)));
    if (opt.delay_us) std::this_thread::sleep_for(std::chrono::microseconds(opt.delay_us));
}

uint8_t Machine::pixel(const CPU& c, int x, int y) const {
    return c.bus.read(static_cast<uint16_t>(opt.video + y * SCREEN_W + x));
}

Rgb Machine::palette(uint8_t colour) {
    switch (colour) {
        case 0:           return {0, 0, 0};         // black
        case 1:           return {255, 255, 255};   // white
        case 2:  case 9:  return {128, 128, 128};   // grey
        case 3:  case 10: return {255, 0, 0};       // red
        case 4:  case 11: return {0, 255, 0};       // green
        case 5:  case 12: return {0, 0, 255};       // blue
        case 6:  case 13: return {255, 0, 255};     // magenta
        case 7:  case 14: return {255, 255, 0};     // yellow
        default:          return {0, 255, 255};     // cyan
    }
}
