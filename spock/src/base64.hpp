#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Standard alphabet with '=' padding.
std::string base64_encode(const uint8_t* data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

// Line breaks and spaces are skipped. Characters outside the alphabet, data
// after the padding, or a dangling 6-bit group throw std::invalid_argument.
std::vector<uint8_t> base64_decode(const std::string& encoded);
