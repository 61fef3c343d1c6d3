#pragma once
#include "ec_key.hpp"
#include "curve.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

// Key document:
//   type:  ecdsa-key
//   curve: P-256 | {name, p, a, b, gx, gy, n}
//   hash:  SHA-256          (optional)
//   d:     <hex>            (absent in public keys)
//   pub:   <hex, SEC1>      (optional when d is present)

// Fields of a key map without completing them. Throws std::runtime_error
// on missing or malformed fields.
EcKey key_from_yaml(const YAML::Node& node);

// Builds the key's curve, pads d to the scalar width and derives pub from
// it. A stored pub that differs from the derived one is rejected. Fills in
// the curve's default hash when the key names none.
rfc6979::Curve complete_key(EcKey& key);

// Parse and complete a key document.
EcKey parse_key(const std::string& yaml_text);
EcKey load_key(const std::string& path);

// with_private = false leaves out d.
std::string emit_key_yaml(const EcKey& key, bool with_private);
