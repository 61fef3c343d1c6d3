#include "curve.hpp"
#include <openssl/obj_mac.h>
#include <openssl/objects.h>
#include <stdexcept>
#include <utility>

namespace rfc6979 {

// ── Named curves ──────────────────────────────────────────────────────────────

struct NamedCurve {
    const char* name;
    const char* group_name;   // OpenSSL short name
    int         nid;
    const char* hash;         // digest matching curve security level
};

static const NamedCurve kNamedCurves[] = {
    {"P-224", "secp224r1",  NID_secp224r1,        "SHA-224"},
    {"P-256", "prime256v1", NID_X9_62_prime256v1, "SHA-256"},
    {"P-384", "secp384r1",  NID_secp384r1,        "SHA-384"},
    {"P-521", "secp521r1",  NID_secp521r1,        "SHA-512"},
};

Curve::Curve(EC_GROUP* group, std::string name, std::string default_hash)
    : group_(group), name_(std::move(name)), default_hash_(std::move(default_hash)) {}

Curve::~Curve() {
    EC_GROUP_free(group_);
}

Curve::Curve(Curve&& other) noexcept
    : group_(other.group_),
      name_(std::move(other.name_)),
      default_hash_(std::move(other.default_hash_))
{
    other.group_ = nullptr;
}

Curve& Curve::operator=(Curve&& other) noexcept {
    if (this != &other) {
        EC_GROUP_free(group_);
        group_        = other.group_;
        name_         = std::move(other.name_);
        default_hash_ = std::move(other.default_hash_);
        other.group_  = nullptr;
    }
    return *this;
}

Curve Curve::named(const std::string& name) {
    for (const auto& c : kNamedCurves) {
        if (name == c.name || name == c.group_name) {
            EC_GROUP* group = EC_GROUP_new_by_curve_name(c.nid);
            if (!group)
                throw std::runtime_error("EC_GROUP_new_by_curve_name failed for " + name);
            return Curve(group, c.name, c.hash);
        }
    }

    int nid = OBJ_sn2nid(name.c_str());
    if (nid == NID_undef)
        nid = EC_curve_nist2nid(name.c_str());
    if (nid == NID_undef)
        throw std::invalid_argument("Unknown curve: " + name);

    EC_GROUP* group = EC_GROUP_new_by_curve_name(nid);
    if (!group)
        throw std::invalid_argument("Not an elliptic curve: " + name);
    return Curve(group, name, "");
}

// ── Explicit curves ───────────────────────────────────────────────────────────

static bool parse_hex_bn(const std::string& hex, BIGNUM* out) {
    std::string digits = hex;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X'))
        digits = digits.substr(2);
    // BN_hex2bn would take a leading '-' and count it as a digit
    if (digits.empty() || digits[0] == '-')
        return false;
    return BN_hex2bn(&out, digits.c_str()) == (int)digits.size() && !BN_is_negative(out);
}

Curve Curve::from_spec(const CurveSpec& spec) {
    BN_CTX*   ctx   = BN_CTX_new();
    BIGNUM*   p     = BN_new();
    BIGNUM*   a     = BN_new();
    BIGNUM*   b     = BN_new();
    BIGNUM*   gx    = BN_new();
    BIGNUM*   gy    = BN_new();
    BIGNUM*   n     = BN_new();
    EC_GROUP* group = nullptr;
    EC_POINT* g     = nullptr;

    auto cleanup = [&]() {
        EC_POINT_free(g);
        BN_free(n);
        BN_free(gy);
        BN_free(gx);
        BN_free(b);
        BN_free(a);
        BN_free(p);
        BN_CTX_free(ctx);
    };
    auto fail = [&](const std::string& msg) {
        cleanup();
        EC_GROUP_free(group);
        throw std::runtime_error("curve " + spec.name + ": " + msg);
    };

    if (!ctx || !p || !a || !b || !gx || !gy || !n)
        fail("allocation failed");

    if (!parse_hex_bn(spec.p,  p)  || !parse_hex_bn(spec.a,  a) ||
        !parse_hex_bn(spec.b,  b)  || !parse_hex_bn(spec.gx, gx) ||
        !parse_hex_bn(spec.gy, gy) || !parse_hex_bn(spec.n,  n)) {
        cleanup();
        throw std::invalid_argument("curve " + spec.name + ": malformed hex parameter");
    }

    group = EC_GROUP_new_curve_GFp(p, a, b, ctx);
    if (!group) fail("EC_GROUP_new_curve_GFp failed");

    g = EC_POINT_new(group);
    if (!g) fail("EC_POINT_new failed");
    if (EC_POINT_set_affine_coordinates(group, g, gx, gy, ctx) != 1)
        fail("base point is not on the curve");

    if (EC_GROUP_set_generator(group, g, n, BN_value_one()) != 1)
        fail("EC_GROUP_set_generator failed");
    if (EC_GROUP_check(group, ctx) != 1)
        fail("EC_GROUP_check rejected the parameters");
    if (BN_check_prime(n, ctx, nullptr) != 1)
        fail("group order is not prime");

    cleanup();
    return Curve(group, spec.name, "");
}

Curve Curve::for_key(const EcKey& key) {
    if (key.is_explicit)
        return from_spec(key.curve_spec);
    return named(key.curve_name);
}

// ── Scalar multiplication ─────────────────────────────────────────────────────

void Curve::base_mul_x(const BIGNUM* k, BIGNUM* x_out, BN_CTX* ctx) const {
    EC_POINT* pt = EC_POINT_new(group_);
    if (!pt) throw std::runtime_error("EC_POINT_new failed");

    if (EC_POINT_mul(group_, pt, k, nullptr, nullptr, ctx) != 1) {
        EC_POINT_free(pt);
        throw std::runtime_error("EC_POINT_mul failed");
    }
    if (EC_POINT_is_at_infinity(group_, pt)) {
        EC_POINT_free(pt);
        throw std::runtime_error("k*G is the point at infinity");
    }
    if (EC_POINT_get_affine_coordinates(group_, pt, x_out, nullptr, ctx) != 1) {
        EC_POINT_free(pt);
        throw std::runtime_error("EC_POINT_get_affine_coordinates failed");
    }
    EC_POINT_free(pt);
}

std::vector<uint8_t> Curve::public_key(const std::vector<uint8_t>& d) const {
    BIGNUM* priv_bn = BN_bin2bn(d.data(), (int)d.size(), nullptr);
    if (!priv_bn) throw std::runtime_error("public_key: BN_bin2bn failed");

    if (BN_is_zero(priv_bn) || BN_cmp(priv_bn, order()) >= 0) {
        BN_clear_free(priv_bn);
        throw std::invalid_argument("private scalar out of range [1, q-1] for " + name_);
    }

    BN_CTX*   ctx = BN_CTX_new();
    EC_POINT* pt  = EC_POINT_new(group_);
    if (!ctx || !pt ||
        EC_POINT_mul(group_, pt, priv_bn, nullptr, nullptr, ctx) != 1) {
        EC_POINT_free(pt);
        BN_CTX_free(ctx);
        BN_clear_free(priv_bn);
        throw std::runtime_error("public_key: EC_POINT_mul failed");
    }
    BN_clear_free(priv_bn);

    size_t pk_len = EC_POINT_point2oct(group_, pt, POINT_CONVERSION_UNCOMPRESSED,
                                       nullptr, 0, ctx);
    std::vector<uint8_t> pk(pk_len);
    if (pk_len == 0 ||
        EC_POINT_point2oct(group_, pt, POINT_CONVERSION_UNCOMPRESSED,
                           pk.data(), pk.size(), ctx) != pk_len) {
        EC_POINT_free(pt);
        BN_CTX_free(ctx);
        throw std::runtime_error("public_key: EC_POINT_point2oct failed");
    }

    EC_POINT_free(pt);
    BN_CTX_free(ctx);
    return pk;
}

} // namespace rfc6979
