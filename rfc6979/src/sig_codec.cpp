#include "sig_codec.hpp"
#include "bits.hpp"
#include <openssl/ecdsa.h>
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <stdexcept>

namespace rfc6979 {

SigEncoding encoding_from_name(const std::string& name) {
    if (name == "p1363") return SigEncoding::P1363;
    if (name == "der")   return SigEncoding::DER;
    throw std::invalid_argument("Unknown signature encoding: " + name +
                                " (must be p1363 or der)");
}

const char* encoding_name(SigEncoding enc) {
    return enc == SigEncoding::DER ? "der" : "p1363";
}

// ── IEEE P1363 ────────────────────────────────────────────────────────────────

std::vector<uint8_t> to_p1363(const Signature& sig) {
    if (sig.r.size() != sig.s.size())
        throw std::invalid_argument("to_p1363: r and s differ in width");

    std::vector<uint8_t> out;
    out.reserve(sig.r.size() + sig.s.size());
    out.insert(out.end(), sig.r.begin(), sig.r.end());
    out.insert(out.end(), sig.s.begin(), sig.s.end());
    return out;
}

Signature from_p1363(const std::vector<uint8_t>& data, size_t scalar_bytes) {
    if (scalar_bytes == 0 || data.size() != 2 * scalar_bytes)
        throw std::invalid_argument("from_p1363: expected " +
                                    std::to_string(2 * scalar_bytes) + " bytes, got " +
                                    std::to_string(data.size()));
    Signature sig;
    sig.r.assign(data.begin(), data.begin() + (long)scalar_bytes);
    sig.s.assign(data.begin() + (long)scalar_bytes, data.end());
    return sig;
}

// ── DER ───────────────────────────────────────────────────────────────────────

std::vector<uint8_t> to_der(const Signature& sig) {
    BIGNUM* r = BN_bin2bn(sig.r.data(), (int)sig.r.size(), nullptr);
    BIGNUM* s = BN_bin2bn(sig.s.data(), (int)sig.s.size(), nullptr);
    if (!r || !s) {
        BN_free(r);
        BN_free(s);
        throw std::runtime_error("to_der: BN_bin2bn failed");
    }

    ECDSA_SIG* dsig = ECDSA_SIG_new();
    if (!dsig) {
        BN_free(r);
        BN_free(s);
        throw std::runtime_error("to_der: ECDSA_SIG_new failed");
    }
    ECDSA_SIG_set0(dsig, r, s);  // transfers ownership of r and s

    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(dsig, &der);
    ECDSA_SIG_free(dsig);        // also frees r and s
    if (der_len <= 0)
        throw std::runtime_error("to_der: i2d_ECDSA_SIG failed");

    std::vector<uint8_t> out(der, der + der_len);
    OPENSSL_free(der);
    return out;
}

Signature from_der(const std::vector<uint8_t>& der, size_t scalar_bytes) {
    const unsigned char* p = der.data();
    ECDSA_SIG* dsig = d2i_ECDSA_SIG(nullptr, &p, (long)der.size());
    if (!dsig)
        throw std::invalid_argument("from_der: not a DER ECDSA signature");
    if (p != der.data() + der.size()) {
        ECDSA_SIG_free(dsig);
        throw std::invalid_argument("from_der: trailing bytes after signature");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(dsig, &r, &s);

    Signature sig;
    try {
        sig.r = int2octets(r, scalar_bytes);
        sig.s = int2octets(s, scalar_bytes);
    } catch (const std::exception& e) {
        ECDSA_SIG_free(dsig);
        throw std::invalid_argument(std::string("from_der: ") + e.what());
    }
    ECDSA_SIG_free(dsig);
    return sig;
}

std::vector<uint8_t> encode(const Signature& sig, SigEncoding enc) {
    return enc == SigEncoding::DER ? to_der(sig) : to_p1363(sig);
}

Signature decode(const std::vector<uint8_t>& data, SigEncoding enc, size_t scalar_bytes) {
    return enc == SigEncoding::DER ? from_der(data, scalar_bytes)
                                   : from_p1363(data, scalar_bytes);
}

// ── Low-S ─────────────────────────────────────────────────────────────────────

bool is_low_s(const Curve& curve, const Signature& sig) {
    BIGNUM* s    = BN_bin2bn(sig.s.data(), (int)sig.s.size(), nullptr);
    BIGNUM* half = BN_dup(curve.order());
    if (!s || !half || !BN_rshift1(half, half)) {
        BN_free(s);
        BN_free(half);
        throw std::runtime_error("is_low_s: BIGNUM allocation failed");
    }
    bool low = BN_cmp(s, half) <= 0;
    BN_free(s);
    BN_free(half);
    return low;
}

Signature normalize_low_s(const Curve& curve, const Signature& sig) {
    if (is_low_s(curve, sig))
        return sig;

    BIGNUM* s = BN_bin2bn(sig.s.data(), (int)sig.s.size(), nullptr);
    if (!s || !BN_sub(s, curve.order(), s)) {
        BN_free(s);
        throw std::runtime_error("normalize_low_s: BN_sub failed");
    }

    Signature out;
    out.r = sig.r;
    try {
        out.s = int2octets(s, curve.scalar_bytes());
    } catch (...) {
        BN_free(s);
        throw;
    }
    BN_free(s);
    return out;
}

} // namespace rfc6979
