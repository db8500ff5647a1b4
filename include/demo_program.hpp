// include/demo_program.hpp
#pragma once
#include <cstdint>
#include <vector>

// Built-in image, assembled for CPU::DEFAULT_ORIGIN.
std::vector<uint8_t> demo_program();
