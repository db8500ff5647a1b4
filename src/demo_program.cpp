#include "demo_program.hpp"
#include <initializer_list>

// Paints the 32x32 framebuffer at $0200 with random colours from $FE,
// repeating until a key lands in $FF, then finishes the pass and stops.
std::vector<uint8_t> demo_program() {
    std::vector<uint8_t> p;
    auto emit = [&](std::initializer_list<uint8_t> bytes) { p.insert(p.end(), bytes); };
    // start ($0600):
    emit({0xA2, 0x00});                     // LDX #$00
    // fill ($0602):
    for (uint8_t page = 0x02; page <= 0x05; ++page) {
        emit({0xA5, 0xFE});                 // LDA $FE      random colour
        emit({0x9D, 0x00, page});           // STA $0p00,X
    }
    emit({0xE8});                           // INX
    emit({0xD0, 0xE9});                     // BNE fill
    emit({0xA5, 0xFF});                     // LDA $FF      key latch
    emit({0xF0, 0xE3});                     // BEQ start
    emit({0x00});                           // BRK
    return p;
}
