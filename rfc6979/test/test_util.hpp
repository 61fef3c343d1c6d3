#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <openssl/bn.h>
#include <openssl/crypto.h>

inline bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

inline bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

inline std::vector<uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0)
        throw std::invalid_argument("odd-length hex: " + hex);
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i)
        out[i] = (uint8_t)std::stoul(hex.substr(2 * i, 2), nullptr, 16);
    return out;
}

inline std::string to_hex(const std::vector<uint8_t>& data) {
    static const char kDigits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0F];
    }
    return out;
}

inline std::string bn_hex(const BIGNUM* v) {
    char* s = BN_bn2hex(v);
    if (!s) throw std::runtime_error("BN_bn2hex failed");
    std::string out(s);
    OPENSSL_free(s);
    return out;
}

// Owns a BIGNUM parsed from hex; test code only.
struct TestBn {
    BIGNUM* bn = nullptr;
    explicit TestBn(const std::string& hex = "0") {
        if (BN_hex2bn(&bn, hex.c_str()) == 0)
            throw std::invalid_argument("bad hex: " + hex);
    }
    ~TestBn() { BN_free(bn); }
    TestBn(const TestBn&) = delete;
    TestBn& operator=(const TestBn&) = delete;
};
