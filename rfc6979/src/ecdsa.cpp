#include "ecdsa.hpp"
#include "bits.hpp"
#include "drbg.hpp"
#include <stdexcept>
#include <string>

namespace rfc6979 {

namespace {

// BN_CTX frame for one operation. Temporaries come from the secure heap and
// are cleared when the frame is released, including on throw.
struct BnScratch {
    BN_CTX* ctx;

    BnScratch() : ctx(BN_CTX_secure_new()) {
        if (!ctx) throw std::runtime_error("BN_CTX_secure_new failed");
        BN_CTX_start(ctx);
    }
    ~BnScratch() {
        BN_CTX_end(ctx);
        BN_CTX_free(ctx);
    }
    BnScratch(const BnScratch&) = delete;
    BnScratch& operator=(const BnScratch&) = delete;

    BIGNUM* get() {
        BIGNUM* v = BN_CTX_get(ctx);
        if (!v) throw std::runtime_error("BN_CTX_get failed");
        return v;
    }
};

} // namespace

// ── Signing ───────────────────────────────────────────────────────────────────

Signature sign(const Curve& curve,
               const std::vector<uint8_t>& priv,
               const std::vector<uint8_t>& digest,
               const EVP_MD* md)
{
    if (!md)
        throw std::invalid_argument("sign: no hash given");
    if (digest.empty())
        throw std::invalid_argument("sign: empty digest");
    if (priv.empty())
        throw std::invalid_argument("sign: empty private key");

    const BIGNUM* q     = curve.order();
    const int     qlen  = curve.order_bits();
    const size_t  rolen = curve.scalar_bytes();

    BnScratch bn;
    BIGNUM* x    = bn.get();
    BIGNUM* e    = bn.get();
    BIGNUM* k    = bn.get();
    BIGNUM* kinv = bn.get();
    BIGNUM* r    = bn.get();
    BIGNUM* s    = bn.get();
    BIGNUM* t    = bn.get();

    if (!BN_bin2bn(priv.data(), (int)priv.size(), x))
        throw std::runtime_error("sign: BN_bin2bn failed");
    if (BN_is_zero(x) || BN_cmp(x, q) >= 0)
        throw std::invalid_argument("sign: private scalar out of range [1, q-1] for " +
                                    curve.name());

    // The signature equation takes bits2int(h1) as is; only the DRBG seed
    // uses the reduced bits2octets form.
    bits2int(digest, qlen, e);

    NonceGenerator gen(md, q, x, digest);
    BN_set_flags(k, BN_FLG_CONSTTIME);

    for (int attempt = 0; attempt < kMaxNonceAttempts; ++attempt) {
        gen.next(k);
        if (BN_is_zero(k) || BN_cmp(k, q) >= 0)
            continue;

        // r = x(k*G) mod q
        curve.base_mul_x(k, r, bn.ctx);
        if (!BN_nnmod(r, r, q, bn.ctx))
            throw std::runtime_error("sign: BN_nnmod failed");
        if (BN_is_zero(r))
            continue;

        // s = k^-1 * (e + r*x) mod q
        if (!BN_mod_inverse(kinv, k, q, bn.ctx) ||
            !BN_mod_mul(t, r, x, q, bn.ctx) ||
            !BN_mod_add(t, t, e, q, bn.ctx) ||
            !BN_mod_mul(s, kinv, t, q, bn.ctx))
            throw std::runtime_error("sign: modular arithmetic failed");
        if (BN_is_zero(s))
            continue;

        Signature sig;
        sig.r = int2octets(r, rolen);
        sig.s = int2octets(s, rolen);
        return sig;
    }

    throw std::runtime_error("sign: no usable nonce after " +
                             std::to_string(kMaxNonceAttempts) + " candidates");
}

// ── Verification ──────────────────────────────────────────────────────────────

bool verify(const Curve& curve,
            const std::vector<uint8_t>& pub,
            const std::vector<uint8_t>& digest,
            const Signature& sig)
{
    if (digest.empty())
        throw std::invalid_argument("verify: empty digest");

    const EC_GROUP* group = curve.group();
    const BIGNUM*   q     = curve.order();

    BnScratch bn;
    BIGNUM* r  = bn.get();
    BIGNUM* s  = bn.get();
    BIGNUM* e  = bn.get();
    BIGNUM* w  = bn.get();
    BIGNUM* u1 = bn.get();
    BIGNUM* u2 = bn.get();
    BIGNUM* v  = bn.get();

    EC_POINT* pt_q = EC_POINT_new(group);
    if (!pt_q) throw std::runtime_error("verify: EC_POINT_new failed");
    if (EC_POINT_oct2point(group, pt_q, pub.data(), pub.size(), bn.ctx) != 1 ||
        EC_POINT_is_at_infinity(group, pt_q)) {
        EC_POINT_free(pt_q);
        throw std::invalid_argument("verify: public key is not a point on " + curve.name());
    }

    if (sig.r.empty() || sig.s.empty() ||
        !BN_bin2bn(sig.r.data(), (int)sig.r.size(), r) ||
        !BN_bin2bn(sig.s.data(), (int)sig.s.size(), s)) {
        EC_POINT_free(pt_q);
        return false;
    }
    if (BN_is_zero(r) || BN_cmp(r, q) >= 0 ||
        BN_is_zero(s) || BN_cmp(s, q) >= 0) {
        EC_POINT_free(pt_q);
        return false;
    }

    try {
        bits2int(digest, curve.order_bits(), e);
    } catch (...) {
        EC_POINT_free(pt_q);
        throw;
    }

    // u1 = e/s, u2 = r/s
    if (!BN_mod_inverse(w, s, q, bn.ctx) ||
        !BN_mod_mul(u1, e, w, q, bn.ctx) ||
        !BN_mod_mul(u2, r, w, q, bn.ctx)) {
        EC_POINT_free(pt_q);
        throw std::runtime_error("verify: modular arithmetic failed");
    }

    EC_POINT* pt_x = EC_POINT_new(group);
    if (!pt_x || EC_POINT_mul(group, pt_x, u1, pt_q, u2, bn.ctx) != 1) {
        EC_POINT_free(pt_x);
        EC_POINT_free(pt_q);
        throw std::runtime_error("verify: EC_POINT_mul failed");
    }
    EC_POINT_free(pt_q);

    if (EC_POINT_is_at_infinity(group, pt_x)) {
        EC_POINT_free(pt_x);
        return false;
    }
    if (EC_POINT_get_affine_coordinates(group, pt_x, v, nullptr, bn.ctx) != 1) {
        EC_POINT_free(pt_x);
        throw std::runtime_error("verify: EC_POINT_get_affine_coordinates failed");
    }
    EC_POINT_free(pt_x);

    if (!BN_nnmod(v, v, q, bn.ctx))
        throw std::runtime_error("verify: BN_nnmod failed");
    return BN_cmp(v, r) == 0;
}

} // namespace rfc6979
