// src/loader.cpp
#include "loader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include "bus.hpp"
#include "cpu.hpp"

namespace fs = std::filesystem;

static bool is_hex(char c) {
    return (c>='0'&&c<='9')||(c>='a'&&c<='f')||(c>='A'&&c<='F');
}

static unsigned hex_value(char c) {
    if (c >= '0' && c <= '9') return unsigned(c - '0');
    if (c >= 'a' && c <= 'f') return unsigned(c - 'a' + 10);
    return unsigned(c - 'A' + 10);
}

LoadError read_file_binary(const std::string& path, std::vector<uint8_t>& out) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        std::cerr << "[loadbin] cannot find '" << path << "'\n";
        return LoadError::NotFound;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        std::cerr << "[loadbin] cannot open '" << path << "'\n";
        return LoadError::Unreadable;
    }
    f.seekg(0, std::ios::end);
    std::streamsize n = f.tellg();
    if (n < 0) return LoadError::Unreadable;
    if (n == 0) {
        std::cerr << "[loadbin] '" << path << "' is empty\n";
        return LoadError::Empty;
    }
    if (static_cast<size_t>(n) > Bus::MEM_SIZE) {
        std::cerr << "[loadbin] '" << path << "' is larger than the address space\n";
        return LoadError::Oversized;
    }
    f.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    f.read(reinterpret_cast<char*>(buf.data()), n);
    if (!f) {
        std::cerr << "[loadbin] short read on '" << path << "'\n";
        return LoadError::Unreadable;
    }
    out = std::move(buf);
    return LoadError::None;
}

LoadError read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        std::cerr << "[loadhex] cannot find '" << path << "'\n";
        return LoadError::NotFound;
    }
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[loadhex] cannot open '" << path << "'\n";
        return LoadError::Unreadable;
    }

    std::vector<uint8_t> buf;
    std::string line;
    size_t lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        // strip comment markers: # ... ; ... // ...
        auto cut = line.find_first_of("#;");
        if (cut != std::string::npos) line.resize(cut);
        cut = line.find("//");
        if (cut != std::string::npos) line.resize(cut);

        std::replace(line.begin(), line.end(), ',', ' ');

        std::istringstream iss(line);
        std::string tok;
        while (iss >> tok) {
            tok.erase(std::remove(tok.begin(), tok.end(), '_'), tok.end());
            if (tok.size() > 2 && tok[0]=='0' && (tok[1]=='x' || tok[1]=='X'))
                tok = tok.substr(2);
            if (tok.empty()) continue;

            if (!std::all_of(tok.begin(), tok.end(), is_hex)) {
                std::cerr << "[loadhex] non-hex token '" << tok
                          << "' at line " << lineno << "\n";
                return LoadError::Malformed;
            }
            if (tok.size() > 2) {
                std::cerr << "[loadhex] byte out of range '" << tok
                          << "' at line " << lineno << "\n";
                return LoadError::Malformed;
            }
            unsigned v = 0;
            for (char c : tok) v = v * 16 + hex_value(c);
            buf.push_back(static_cast<uint8_t>(v));
            if (buf.size() > Bus::MEM_SIZE) {
                std::cerr << "[loadhex] '" << path << "' is larger than the address space\n";
                return LoadError::Oversized;
            }
        }
    }
    if (buf.empty()) {
        std::cerr << "[loadhex] no bytes read from '" << path << "'\n";
        return LoadError::Empty;
    }
    out = std::move(buf);
    return LoadError::None;
}

LoadError load_image(CPU& cpu, const std::string& path, bool hex, uint16_t origin) {
    std::vector<uint8_t> image;
    LoadError err = hex ? read_file_hexbytes(path, image) : read_file_binary(path, image);
    if (err != LoadError::None) return err;

    // Placement failures are reported by the caller
    return cpu.load(image, origin);
}
