#pragma once
#include "ec_key.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <openssl/ec.h>
#include <openssl/bn.h>

namespace rfc6979 {

// A prime-order elliptic-curve group. Immutable after construction, so one
// instance may be read from several threads.
class Curve {
public:
    // "P-224", "P-256", "P-384", "P-521", or any OpenSSL curve short name
    // ("secp256k1", "brainpoolP256r1", ...). Throws std::invalid_argument
    // for unknown names.
    static Curve named(const std::string& name);

    // Curve from explicit hex parameters. The group is checked with
    // EC_GROUP_check; bad parameters throw std::runtime_error.
    static Curve from_spec(const CurveSpec& spec);

    // Named or explicit curve as described by a key.
    static Curve for_key(const EcKey& key);

    ~Curve();
    Curve(Curve&& other) noexcept;
    Curve& operator=(Curve&& other) noexcept;
    Curve(const Curve&) = delete;
    Curve& operator=(const Curve&) = delete;

    const std::string& name() const { return name_; }
    const EC_GROUP* group() const { return group_; }

    // Group order q, its bit length qlen and rolen = ceil(qlen / 8).
    const BIGNUM* order() const { return EC_GROUP_get0_order(group_); }
    int order_bits() const { return BN_num_bits(order()); }
    size_t scalar_bytes() const { return (size_t)(order_bits() + 7) / 8; }

    // Hash conventionally paired with the curve ("SHA-256" for P-256, ...);
    // empty when there is none.
    const std::string& default_hash() const { return default_hash_; }

    // x-coordinate of k*G (not reduced mod q). k must not be a multiple of q.
    void base_mul_x(const BIGNUM* k, BIGNUM* x_out, BN_CTX* ctx) const;

    // SEC1 uncompressed public point (04 || x || y) for private scalar d.
    std::vector<uint8_t> public_key(const std::vector<uint8_t>& d) const;

private:
    Curve(EC_GROUP* group, std::string name, std::string default_hash);

    EC_GROUP*   group_ = nullptr;
    std::string name_;
    std::string default_hash_;
};

} // namespace rfc6979
