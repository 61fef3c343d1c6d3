#include "hex.hpp"
#include <stdexcept>

static const char kDigits[] = "0123456789ABCDEF";

static int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0F];
    }
    return out;
}

std::vector<uint8_t> hex_decode(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X'))
        digits = digits.substr(2);
    if (digits.size() % 2 != 0)
        digits.insert(digits.begin(), '0');

    std::vector<uint8_t> out(digits.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = nibble(digits[2 * i]);
        int lo = nibble(digits[2 * i + 1]);
        if (hi < 0 || lo < 0)
            throw std::invalid_argument("Invalid hex string: " + hex);
        out[i] = (uint8_t)((hi << 4) | lo);
    }
    return out;
}

std::vector<uint8_t> pad_left(const std::vector<uint8_t>& data, size_t width) {
    size_t skip = 0;
    while (data.size() - skip > width && data[skip] == 0)
        ++skip;
    if (data.size() - skip > width)
        throw std::invalid_argument("Value wider than " + std::to_string(width) + " bytes");

    std::vector<uint8_t> out(width - (data.size() - skip), 0);
    out.insert(out.end(), data.begin() + (long)skip, data.end());
    return out;
}

std::vector<uint8_t> hex_decode_padded(const std::string& hex, size_t width) {
    return pad_left(hex_decode(hex), width);
}
