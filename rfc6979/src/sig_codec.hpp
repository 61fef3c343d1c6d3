#pragma once
#include "ecdsa.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>

namespace rfc6979 {

enum class SigEncoding { P1363, DER };

// "p1363" / "der" (case-sensitive). Throws std::invalid_argument otherwise.
SigEncoding encoding_from_name(const std::string& name);
const char* encoding_name(SigEncoding enc);

// IEEE P1363: r || s, each scalar_bytes long.
std::vector<uint8_t> to_p1363(const Signature& sig);
Signature from_p1363(const std::vector<uint8_t>& data, size_t scalar_bytes);

// ASN.1 DER ECDSA-Sig-Value. from_der pads r and s to scalar_bytes and
// rejects trailing garbage or values wider than scalar_bytes.
std::vector<uint8_t> to_der(const Signature& sig);
Signature from_der(const std::vector<uint8_t>& der, size_t scalar_bytes);

std::vector<uint8_t> encode(const Signature& sig, SigEncoding enc);
Signature decode(const std::vector<uint8_t>& data, SigEncoding enc, size_t scalar_bytes);

// Low-S policy, applied by callers that need it; sign() never does.
// True if s <= q/2.
bool is_low_s(const Curve& curve, const Signature& sig);
// Replaces s by q - s when s > q/2.
Signature normalize_low_s(const Curve& curve, const Signature& sig);

} // namespace rfc6979
