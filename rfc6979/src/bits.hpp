#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <openssl/bn.h>

// Conversions between octet strings and integers sized by the group order
// (RFC 6979 section 2.3). qlen is the bit length of q, rolen = ceil(qlen / 8).

namespace rfc6979 {

inline size_t octet_length(int qlen) {
    return (size_t)(qlen + 7) / 8;
}

// Big-endian value of in[0..len), keeping only the leftmost qlen bits when the
// string is longer than qlen bits. An empty string gives zero.
void bits2int(const uint8_t* in, size_t len, int qlen, BIGNUM* out);

inline void bits2int(const std::vector<uint8_t>& in, int qlen, BIGNUM* out) {
    bits2int(in.data(), in.size(), qlen, out);
}

// v as exactly rolen big-endian bytes. Throws if v does not fit.
std::vector<uint8_t> int2octets(const BIGNUM* v, size_t rolen);

// bits2int(in) reduced modulo q, as rolen bytes.
std::vector<uint8_t> bits2octets(const std::vector<uint8_t>& in, const BIGNUM* q);

} // namespace rfc6979
