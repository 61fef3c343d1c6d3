#pragma once
#include <string>
#include <vector>

// One entry of a vector table, after signing and verifying it.
struct VectorResult {
    std::string name;
    bool        passed = false;
    std::string detail;     // why it failed; empty on success
};

// Runs every entry of a YAML vector table (type: ecdsa-vectors):
//   keys:    [{id, curve, d, x?, y?}]
//   vectors: [{name, key, hash, message, r, s}]
// Each message is hashed, the digest clipped to rolen = ceil(qlen/8) bytes
// when longer, then signed, compared with (r, s) and verified. A key whose
// x/y disagree with d fails every vector that uses it. Throws
// std::runtime_error when the table itself is malformed.
std::vector<VectorResult> run_vectors(const std::string& path);
