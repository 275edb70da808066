#pragma once

#include <dag/block.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Dagstore {

// Conversions between raw bytes and PostgreSQL's bytea hex text form (\x0a1b...).

inline constexpr char k_hex_lut[] = "0123456789abcdef";

inline std::string bytes_to_bytea_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(2 + len * 2);
    out.push_back('\\');
    out.push_back('x');
    for (size_t i = 0; i < len; ++i) {
        out.push_back(k_hex_lut[(data[i] >> 4) & 0xF]);
        out.push_back(k_hex_lut[data[i] & 0xF]);
    }
    return out;
}

inline std::string cid_to_bytea_hex(const Cid& cid) {
    return bytes_to_bytea_hex(cid.data(), cid.size());
}

inline uint8_t hex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw std::invalid_argument(std::string("Invalid hex digit: ") + c);
}

// Parse bytea output in hex format; the escape format (bytea_output = 'escape') is rejected.
inline std::vector<uint8_t> bytea_hex_to_bytes(const std::string& text) {
    if (text.size() < 2 || text[0] != '\\' || text[1] != 'x' || (text.size() % 2) != 0) {
        throw std::invalid_argument("Not a bytea hex literal");
    }
    std::vector<uint8_t> out;
    out.reserve((text.size() - 2) / 2);
    for (size_t i = 2; i < text.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((hex_nibble(text[i]) << 4) | hex_nibble(text[i + 1])));
    }
    return out;
}

} // namespace Dagstore
