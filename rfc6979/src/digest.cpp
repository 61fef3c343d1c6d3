#include "digest.hpp"
#include <openssl/core_names.h>
#include <openssl/params.h>
#include <stdexcept>
#include <string>

namespace rfc6979 {

// ── Hash names ────────────────────────────────────────────────────────────────

struct DigestName {
    const char*   name;
    const EVP_MD* (*md_fn)();
};

static const DigestName kDigests[] = {
    {"SHA-1",       EVP_sha1},
    {"SHA-224",     EVP_sha224},
    {"SHA-256",     EVP_sha256},
    {"SHA-384",     EVP_sha384},
    {"SHA-512",     EVP_sha512},
    {"SHA-512/224", EVP_sha512_224},
    {"SHA-512/256", EVP_sha512_256},
    {"SHA3-224",    EVP_sha3_224},
    {"SHA3-256",    EVP_sha3_256},
    {"SHA3-384",    EVP_sha3_384},
    {"SHA3-512",    EVP_sha3_512},
};

const EVP_MD* digest_by_name(const std::string& name) {
    const EVP_MD* md = nullptr;
    for (const auto& d : kDigests) {
        if (name == d.name) {
            md = d.md_fn();
            break;
        }
    }
    if (!md)
        md = EVP_get_digestbyname(name.c_str());
    if (!md)
        throw std::invalid_argument("Unknown hash: " + name);
    if (EVP_MD_get_flags(md) & EVP_MD_FLAG_XOF)
        throw std::invalid_argument("Extendable-output hash not usable with HMAC: " + name);
    return md;
}

std::string digest_name(const EVP_MD* md) {
    int nid = EVP_MD_get_type(md);
    for (const auto& d : kDigests) {
        if (EVP_MD_get_type(d.md_fn()) == nid)
            return d.name;
    }
    return EVP_MD_get0_name(md);
}

std::vector<uint8_t> digest(const EVP_MD* md, const uint8_t* data, size_t len) {
    std::vector<uint8_t> out((size_t)EVP_MD_get_size(md));
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out.data(), &out_len, md, nullptr) != 1)
        throw std::runtime_error("EVP_Digest failed");
    out.resize(out_len);
    return out;
}

// ── HMAC ──────────────────────────────────────────────────────────────────────

Hmac::Hmac(const EVP_MD* md) {
    if (!md) throw std::invalid_argument("Hmac: no hash given");

    int size = EVP_MD_get_size(md);
    if (size <= 0)
        throw std::invalid_argument("Hmac: hash has no fixed output size");
    size_    = (size_t)size;
    md_name_ = EVP_MD_get0_name(md);

    mac_ = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
    if (!mac_) throw std::runtime_error("EVP_MAC_fetch(HMAC) failed");
}

Hmac::~Hmac() {
    EVP_MAC_free(mac_);
}

std::vector<uint8_t> Hmac::mac(const std::vector<uint8_t>& key,
                               const std::vector<uint8_t>& msg) const
{
    EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(mac_);
    if (!ctx) throw std::runtime_error("EVP_MAC_CTX_new failed");

    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST,
                                                 const_cast<char*>(md_name_.c_str()), 0);
    params[1] = OSSL_PARAM_construct_end();

    if (EVP_MAC_init(ctx, key.data(), key.size(), params) != 1) {
        EVP_MAC_CTX_free(ctx);
        throw std::runtime_error("HMAC init failed for " + md_name_);
    }
    if (!msg.empty() && EVP_MAC_update(ctx, msg.data(), msg.size()) != 1) {
        EVP_MAC_CTX_free(ctx);
        throw std::runtime_error("HMAC update failed");
    }

    std::vector<uint8_t> out(size_);
    size_t out_len = 0;
    if (EVP_MAC_final(ctx, out.data(), &out_len, out.size()) != 1) {
        EVP_MAC_CTX_free(ctx);
        throw std::runtime_error("HMAC final failed");
    }
    EVP_MAC_CTX_free(ctx);

    out.resize(out_len);
    return out;
}

} // namespace rfc6979
