#include "status.hpp"

void Flags::reset() {
    C = Z = I = D = B = V = N = false;
}

uint8_t Flags::pack() const {
    uint8_t p = F_U;
    if (C) p |= F_C;
    if (Z) p |= F_Z;
    if (I) p |= F_I;
    if (D) p |= F_D;
    if (B) p |= F_B;
    if (V) p |= F_V;
    if (N) p |= F_N;
    return p;
}

Flags Flags::unpack(uint8_t p) {
    Flags f;
    f.C = (p & F_C) != 0;
    f.Z = (p & F_Z) != 0;
    f.I = (p & F_I) != 0;
    f.D = (p & F_D) != 0;
    f.B = (p & F_B) != 0;
    f.V = (p & F_V) != 0;
    f.N = (p & F_N) != 0;
    return f;
}
