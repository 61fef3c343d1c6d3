#include "vectors.hpp"
#include "key_io.hpp"
#include "hex.hpp"
#include "digest.hpp"
#include "ecdsa.hpp"
#include <yaml-cpp/yaml.h>
#include <map>
#include <stdexcept>

struct TableKey {
    EcKey          key;
    rfc6979::Curve curve;
    std::string    error;   // non-empty: key is unusable
};

// Compares the key's stated public coordinates against the derived point.
static std::string check_coordinates(const YAML::Node& node, const EcKey& key) {
    if (!node["x"] && !node["y"])
        return "";

    size_t field_bytes = (key.pub.size() - 1) / 2;
    std::vector<uint8_t> x(key.pub.begin() + 1, key.pub.begin() + 1 + (long)field_bytes);
    std::vector<uint8_t> y(key.pub.begin() + 1 + (long)field_bytes, key.pub.end());

    if (node["x"] && hex_decode_padded(node["x"].as<std::string>(), field_bytes) != x)
        return "public x mismatch: derived " + hex_encode(x);
    if (node["y"] && hex_decode_padded(node["y"].as<std::string>(), field_bytes) != y)
        return "public y mismatch: derived " + hex_encode(y);
    return "";
}

static VectorResult run_one(const YAML::Node& v, const TableKey& tk) {
    VectorResult res;
    res.name = v["name"].as<std::string>();
    if (!tk.error.empty()) {
        res.detail = tk.error;
        return res;
    }

    const EVP_MD* md = rfc6979::digest_by_name(v["hash"].as<std::string>(tk.key.hash));
    std::string message = v["message"].as<std::string>();
    std::vector<uint8_t> h = rfc6979::digest(
        md, reinterpret_cast<const uint8_t*>(message.data()), message.size());

    size_t clip = tk.curve.scalar_bytes();
    if (h.size() > clip)
        h.resize(clip);

    size_t rolen = tk.curve.scalar_bytes();
    std::vector<uint8_t> want_r = hex_decode_padded(v["r"].as<std::string>(), rolen);
    std::vector<uint8_t> want_s = hex_decode_padded(v["s"].as<std::string>(), rolen);

    rfc6979::Signature sig = rfc6979::sign(tk.curve, tk.key.d, h, md);
    if (sig.r != want_r) {
        res.detail = "r = " + hex_encode(sig.r) + ", expected " + hex_encode(want_r);
        return res;
    }
    if (sig.s != want_s) {
        res.detail = "s = " + hex_encode(sig.s) + ", expected " + hex_encode(want_s);
        return res;
    }
    if (!rfc6979::verify(tk.curve, tk.key.pub, h, sig)) {
        res.detail = "signature does not verify";
        return res;
    }

    res.passed = true;
    return res;
}

std::vector<VectorResult> run_vectors(const std::string& path) {
    YAML::Node doc = YAML::LoadFile(path);

    std::string doc_type = doc["type"].as<std::string>("");
    if (doc_type != "ecdsa-vectors")
        throw std::runtime_error("YAML vectors: 'type' field must be 'ecdsa-vectors' (got '" +
                                 doc_type + "')");

    YAML::Node key_seq = doc["keys"];
    YAML::Node vec_seq = doc["vectors"];
    if (!key_seq || !key_seq.IsSequence())
        throw std::runtime_error("YAML vectors: missing 'keys' sequence");
    if (!vec_seq || !vec_seq.IsSequence())
        throw std::runtime_error("YAML vectors: missing 'vectors' sequence");

    std::map<std::string, TableKey> keys;
    for (const auto& kn : key_seq) {
        std::string id = kn["id"].as<std::string>();
        EcKey key = key_from_yaml(kn);
        if (key.d.empty())
            throw std::runtime_error("YAML vectors: key '" + id + "' has no 'd'");

        rfc6979::Curve curve = complete_key(key);
        std::string error = check_coordinates(kn, key);
        keys.emplace(id, TableKey{std::move(key), std::move(curve), std::move(error)});
    }

    std::vector<VectorResult> results;
    for (const auto& vn : vec_seq) {
        std::string key_id = vn["key"].as<std::string>();
        auto it = keys.find(key_id);
        if (it == keys.end())
            throw std::runtime_error("YAML vectors: unknown key '" + key_id + "'");

        try {
            results.push_back(run_one(vn, it->second));
        } catch (const std::exception& e) {
            VectorResult res;
            res.name   = vn["name"].as<std::string>("(unnamed)");
            res.detail = e.what();
            results.push_back(std::move(res));
        }
    }
    return results;
}
