// include/loader.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "errors.hpp"

struct CPU;

// Raw binary image, copied byte for byte.
LoadError read_file_binary(const std::string& path, std::vector<uint8_t>& out);

// Accepts text files containing hex bytes separated by spaces/newlines, e.g.:
//   A9 10 85 20   ; LDA #$10 / STA $20
// A 0x prefix is allowed; ',' and '_' are ignored; '#', ';' and '//' start
// a comment.
LoadError read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out);

// Reads an image with one of the above and hands it to CPU::load.
LoadError load_image(CPU& cpu, const std::string& path, bool hex, uint16_t origin);
