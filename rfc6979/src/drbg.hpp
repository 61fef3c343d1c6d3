#pragma once
#include "digest.hpp"
#include <vector>
#include <cstdint>
#include <openssl/bn.h>
#include <openssl/evp.h>

// HMAC_DRBG restricted to the use RFC 6979 section 3.2 makes of it:
// one seeding from (x, h1), then a stream of candidate nonces.

namespace rfc6979 {

// Key and working register. Both are exactly the hash output length.
struct DrbgState {
    std::vector<uint8_t> k;
    std::vector<uint8_t> v;
};

// Steps 3.2.b through 3.2.g:
//   K = 00..00, V = 01..01
//   K = HMAC_K(V || 0x00 || x_octets || h1_octets), V = HMAC_K(V)
//   K = HMAC_K(V || 0x01 || x_octets || h1_octets), V = HMAC_K(V)
// x_octets is int2octets(x), h1_octets is bits2octets(h1).
DrbgState seed_state(const Hmac& hmac,
                     const std::vector<uint8_t>& x_octets,
                     const std::vector<uint8_t>& h1_octets);

// Candidate nonce stream for one (x, h1) pair. Every call to next() yields a
// new candidate and advances the state irreversibly; construct a new
// generator to replay the sequence.
class NonceGenerator {
public:
    // x must already be in [1, q-1]; h1 is the raw message digest.
    NonceGenerator(const EVP_MD* md, const BIGNUM* q,
                   const BIGNUM* x, const std::vector<uint8_t>& h1);
    ~NonceGenerator();

    NonceGenerator(const NonceGenerator&) = delete;
    NonceGenerator& operator=(const NonceGenerator&) = delete;

    // Writes bits2int(T) into k_out. The value is NOT range checked: it may
    // be zero or >= q, and the caller decides whether to take it.
    void next(BIGNUM* k_out);

    const DrbgState& state() const { return state_; }
    int qlen() const { return qlen_; }

private:
    Hmac      hmac_;
    int       qlen_;
    DrbgState state_;
};

} // namespace rfc6979
