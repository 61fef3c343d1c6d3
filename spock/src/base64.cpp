#include "base64.hpp"
#include <stdexcept>

static const char kTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t b = (uint32_t)data[i] << 16;
        if (i + 1 < len) b |= (uint32_t)data[i + 1] << 8;
        if (i + 2 < len) b |= (uint32_t)data[i + 2];

        out += kTable[(b >> 18) & 0x3F];
        out += kTable[(b >> 12) & 0x3F];
        out += (i + 1 < len) ? kTable[(b >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? kTable[(b >> 0) & 0x3F] : '=';
    }
    return out;
}

static int decode_char(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> out;
    out.reserve((encoded.size() / 4) * 3);

    uint32_t buf = 0;
    int bits = 0;
    size_t pad = 0;

    for (unsigned char c : encoded) {
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        if (c == '=') {
            ++pad;
            continue;
        }
        if (pad > 0)
            throw std::invalid_argument("base64: data after padding");
        int val = decode_char(c);
        if (val < 0)
            throw std::invalid_argument("base64: invalid character");
        buf = (buf << 6) | (uint32_t)val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((uint8_t)((buf >> bits) & 0xFF));
        }
    }
    if (bits >= 6 || pad > 2)
        throw std::invalid_argument("base64: truncated input");
    return out;
}
