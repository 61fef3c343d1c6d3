#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <openssl/evp.h>

namespace rfc6979 {

// Resolve a hash name ("SHA-1", "SHA-256", "SHA3-384", ...) to an OpenSSL
// digest. Unknown names and extendable-output functions throw
// std::invalid_argument.
const EVP_MD* digest_by_name(const std::string& name);

// Display name for md, e.g. "SHA-256".
std::string digest_name(const EVP_MD* md);

std::vector<uint8_t> digest(const EVP_MD* md, const uint8_t* data, size_t len);

inline std::vector<uint8_t> digest(const EVP_MD* md, const std::vector<uint8_t>& data) {
    return digest(md, data.data(), data.size());
}

// HMAC keyed per call over a fixed hash. Holds the fetched EVP_MAC.
class Hmac {
public:
    explicit Hmac(const EVP_MD* md);
    ~Hmac();

    Hmac(const Hmac&) = delete;
    Hmac& operator=(const Hmac&) = delete;

    // Output (and key) length in bytes.
    size_t size() const { return size_; }

    std::vector<uint8_t> mac(const std::vector<uint8_t>& key,
                             const std::vector<uint8_t>& msg) const;

private:
    EVP_MAC*    mac_ = nullptr;
    std::string md_name_;
    size_t      size_ = 0;
};

} // namespace rfc6979
