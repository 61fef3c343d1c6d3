#include "drbg.hpp"
#include "bits.hpp"
#include <openssl/crypto.h>
#include <stdexcept>

namespace rfc6979 {

// K = HMAC_K(V || tag || provided), V = HMAC_K(V)
static void update(const Hmac& hmac, DrbgState& st, uint8_t tag,
                   const std::vector<uint8_t>& provided)
{
    std::vector<uint8_t> msg;
    msg.reserve(st.v.size() + 1 + provided.size());
    msg.insert(msg.end(), st.v.begin(), st.v.end());
    msg.push_back(tag);
    msg.insert(msg.end(), provided.begin(), provided.end());

    st.k = hmac.mac(st.k, msg);
    st.v = hmac.mac(st.k, st.v);
    OPENSSL_cleanse(msg.data(), msg.size());
}

DrbgState seed_state(const Hmac& hmac,
                     const std::vector<uint8_t>& x_octets,
                     const std::vector<uint8_t>& h1_octets)
{
    DrbgState st;
    st.k.assign(hmac.size(), 0x00);
    st.v.assign(hmac.size(), 0x01);

    std::vector<uint8_t> provided;
    provided.reserve(x_octets.size() + h1_octets.size());
    provided.insert(provided.end(), x_octets.begin(),  x_octets.end());
    provided.insert(provided.end(), h1_octets.begin(), h1_octets.end());

    update(hmac, st, 0x00, provided);
    update(hmac, st, 0x01, provided);

    OPENSSL_cleanse(provided.data(), provided.size());
    return st;
}

NonceGenerator::NonceGenerator(const EVP_MD* md, const BIGNUM* q,
                               const BIGNUM* x, const std::vector<uint8_t>& h1)
    : hmac_(md), qlen_(BN_num_bits(q))
{
    if (qlen_ <= 0)
        throw std::invalid_argument("NonceGenerator: group order is zero");

    std::vector<uint8_t> x_octets = int2octets(x, octet_length(qlen_));
    state_ = seed_state(hmac_, x_octets, bits2octets(h1, q));
    OPENSSL_cleanse(x_octets.data(), x_octets.size());
}

NonceGenerator::~NonceGenerator() {
    OPENSSL_cleanse(state_.k.data(), state_.k.size());
    OPENSSL_cleanse(state_.v.data(), state_.v.size());
}

void NonceGenerator::next(BIGNUM* k_out) {
    // 3.2.h.1-2: T = V_1 || V_2 || ... until at least qlen bits
    std::vector<uint8_t> t;
    t.reserve(octet_length(qlen_) + hmac_.size());
    while (t.size() * 8 < (size_t)qlen_) {
        state_.v = hmac_.mac(state_.k, state_.v);
        t.insert(t.end(), state_.v.begin(), state_.v.end());
    }

    // 3.2.h.3
    bits2int(t, qlen_, k_out);
    OPENSSL_cleanse(t.data(), t.size());

    // Reseed once per emitted candidate, whether or not it is taken.
    update(hmac_, state_, 0x00, {});
}

} // namespace rfc6979
