#pragma once
#include "curve.hpp"
#include <vector>
#include <cstdint>
#include <openssl/evp.h>

namespace rfc6979 {

// Upper bound on nonce candidates tried by sign(). For a prime q each
// candidate is rejected with probability at most 1/2 (about 2^-qlen on the
// standard curves), so 256 rejections in a row happen with probability at
// most 2^-256. No key and digest reach the bound in practice; hitting it
// means a broken HMAC or curve backend.
static constexpr int kMaxNonceAttempts = 256;

// r and s as big-endian integers, each exactly curve.scalar_bytes() long.
struct Signature {
    std::vector<uint8_t> r;
    std::vector<uint8_t> s;
};

// Deterministic ECDSA (RFC 6979 section 3.2 driving ANSI X9.62 signing).
//   priv   - private scalar x, big-endian, in [1, q-1]
//   digest - H(m), computed with md; any length, bits2int applies
//   md     - the hash that produced digest; it also keys the HMAC_DRBG
// Throws std::invalid_argument on bad input and std::runtime_error on
// collaborator failure. Low-S normalization is not applied.
Signature sign(const Curve& curve,
               const std::vector<uint8_t>& priv,
               const std::vector<uint8_t>& digest,
               const EVP_MD* md);

// Standard ECDSA verification of sig over digest with public point pub
// (SEC1 encoded). Returns false for any invalid signature; throws
// std::invalid_argument if pub is not a point on the curve.
bool verify(const Curve& curve,
            const std::vector<uint8_t>& pub,
            const std::vector<uint8_t>& digest,
            const Signature& sig);

} // namespace rfc6979
