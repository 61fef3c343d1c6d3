#include "bits.hpp"
#include <stdexcept>
#include <string>

namespace rfc6979 {

void bits2int(const uint8_t* in, size_t len, int qlen, BIGNUM* out) {
    if (len == 0) {
        BN_zero(out);
        return;
    }
    if (!BN_bin2bn(in, (int)len, out))
        throw std::runtime_error("bits2int: BN_bin2bn failed");

    // Bit length of the string, not of the value: leading zero bytes count.
    size_t blen = len * 8;
    if (blen > (size_t)qlen) {
        if (!BN_rshift(out, out, (int)(blen - (size_t)qlen)))
            throw std::runtime_error("bits2int: BN_rshift failed");
    }
}

std::vector<uint8_t> int2octets(const BIGNUM* v, size_t rolen) {
    std::vector<uint8_t> out(rolen, 0);
    if (BN_is_negative(v) || (size_t)BN_num_bytes(v) > rolen)
        throw std::runtime_error("int2octets: value does not fit in " +
                                 std::to_string(rolen) + " bytes");
    if (BN_bn2binpad(v, out.data(), (int)rolen) < 0)
        throw std::runtime_error("int2octets: BN_bn2binpad failed");
    return out;
}

std::vector<uint8_t> bits2octets(const std::vector<uint8_t>& in, const BIGNUM* q) {
    int qlen = BN_num_bits(q);

    BIGNUM* z = BN_new();
    if (!z) throw std::runtime_error("bits2octets: BN_new failed");

    try {
        bits2int(in, qlen, z);
        // z < 2^qlen <= 2q, so one subtraction reduces it.
        if (BN_cmp(z, q) >= 0 && !BN_sub(z, z, q))
            throw std::runtime_error("bits2octets: BN_sub failed");
        std::vector<uint8_t> out = int2octets(z, octet_length(qlen));
        BN_clear_free(z);
        return out;
    } catch (...) {
        BN_clear_free(z);
        throw;
    }
}

} // namespace rfc6979
