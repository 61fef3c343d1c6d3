#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Explicit prime-field curve parameters, all big-endian hex.
struct CurveSpec {
    std::string name;           // label only, e.g. "toy17"
    std::string p, a, b;        // y^2 = x^3 + a*x + b over GF(p)
    std::string gx, gy;         // base point
    std::string n;              // prime order of the base point (cofactor 1)
};

struct EcKey {
    std::string curve_name;     // "P-256", "secp256k1", ... or CurveSpec::name
    bool is_explicit = false;   // true: curve_spec holds the parameters
    CurveSpec curve_spec;
    std::string hash;           // default digest for this key, e.g. "SHA-256"; may be empty
    std::vector<uint8_t> d;     // private scalar, big-endian; empty for a public key
    std::vector<uint8_t> pub;   // SEC1 uncompressed point (04 || x || y)
};
