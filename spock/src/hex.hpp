#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Upper-case hex, no separators.
std::string hex_encode(const std::vector<uint8_t>& data);

// Accepts an optional 0x prefix and an odd digit count (an implicit leading
// zero). Throws std::invalid_argument on any other character.
std::vector<uint8_t> hex_decode(const std::string& hex);

// Left-pads with zero bytes to exactly width bytes. Leading zero bytes
// beyond width are dropped; a wider value throws std::invalid_argument.
std::vector<uint8_t> pad_left(const std::vector<uint8_t>& data, size_t width);

// hex_decode followed by pad_left.
std::vector<uint8_t> hex_decode_padded(const std::string& hex, size_t width);
