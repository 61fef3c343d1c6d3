#include "hex.hpp"
#include "base64.hpp"
#include "pem_io.hpp"
#include <iostream>
#include <fstream>
#include <cstdio>
#include <stdexcept>

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

template <typename Fn>
static bool throws(Fn fn, const std::string& label) {
    try {
        fn();
    } catch (const std::exception&) {
        return true;
    }
    return fail(label + ": expected an exception");
}

static bool test_hex() {
    bool ok = true;
    ok &= check(hex_encode({0x00, 0xAB, 0x7F}) == "00AB7F", "hex_encode");
    ok &= check(hex_decode("0x00ab7F") == std::vector<uint8_t>({0x00, 0xAB, 0x7F}),
                "hex_decode with prefix and mixed case");
    ok &= check(hex_decode("ABC") == std::vector<uint8_t>({0x0A, 0xBC}),
                "hex_decode odd length");
    ok &= check(hex_decode("").empty(), "hex_decode empty");
    ok &= throws([] { hex_decode("12G4"); }, "hex_decode bad digit");

    ok &= check(hex_decode_padded("1", 3) == std::vector<uint8_t>({0, 0, 1}), "pad 1 to 3");
    ok &= check(hex_decode_padded("000001", 1) == std::vector<uint8_t>({1}),
                "leading zero bytes dropped");
    ok &= throws([] { hex_decode_padded("0102", 1); }, "value wider than width");
    return ok;
}

static bool test_base64() {
    bool ok = true;
    const std::string sample = "sample";
    std::vector<uint8_t> bytes(sample.begin(), sample.end());

    ok &= check(base64_encode(bytes) == "c2FtcGxl", "base64 of 'sample'");
    ok &= check(base64_encode(std::vector<uint8_t>{'t', 'e', 's', 't'}) == "dGVzdA==",
                "base64 padding");
    ok &= check(base64_decode("dGVz\ndA==") == std::vector<uint8_t>({'t', 'e', 's', 't'}),
                "base64 decode across a line break");
    ok &= throws([] { base64_decode("dGVz*A=="); }, "base64 invalid character");
    ok &= throws([] { base64_decode("dG=Vz"); }, "base64 data after padding");
    ok &= throws([] { base64_decode("dGVzd"); }, "base64 dangling group");
    return ok;
}

static bool test_pem() {
    bool ok = true;
    const std::string path = "test_formats_tmp.pem";
    std::vector<uint8_t> data(100);
    for (size_t i = 0; i < data.size(); ++i) data[i] = (uint8_t)(i * 7);

    write_pem(path, kDerSigLabel, data);

    std::string label;
    ok &= check(read_pem_any(path, label) == data, "read_pem_any data");
    ok &= check(label == kDerSigLabel, "read_pem_any label: " + label);
    ok &= check(read_pem(path, kDerSigLabel) == data, "read_pem with the right label");
    ok &= throws([&] { read_pem(path, kP1363SigLabel); }, "read_pem with the wrong label");

    {
        std::ofstream f(path);
        f << "-----BEGIN " << kP1363SigLabel << "-----\nAAAA\n";
    }
    ok &= throws([&] { read_pem_any(path, label); }, "PEM without footer");

    {
        std::ofstream f(path);
        f << "just text\n";
    }
    ok &= throws([&] { read_pem_any(path, label); }, "file without PEM block");

    std::remove(path.c_str());
    ok &= throws([&] { read_pem_any(path, label); }, "missing file");
    return ok;
}

int main() {
    bool ok = true;
    try {
        ok &= test_hex();
        ok &= test_base64();
        ok &= test_pem();
    } catch (const std::exception& e) {
        ok = fail(std::string("unexpected exception: ") + e.what());
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
