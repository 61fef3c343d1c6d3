#include "key_io.hpp"
#include "hex.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

// ── YAML parser ───────────────────────────────────────────────────────────────

static std::string required(const YAML::Node& node, const char* field, const char* where) {
    YAML::Node v = node[field];
    if (!v || !v.IsScalar())
        throw std::runtime_error(std::string("YAML ") + where + ": missing '" + field + "'");
    return v.as<std::string>();
}

static CurveSpec curve_spec_from_yaml(const YAML::Node& node) {
    CurveSpec spec;
    spec.name = node["name"].as<std::string>("explicit");
    spec.p    = required(node, "p",  "curve");
    spec.a    = required(node, "a",  "curve");
    spec.b    = required(node, "b",  "curve");
    spec.gx   = required(node, "gx", "curve");
    spec.gy   = required(node, "gy", "curve");
    spec.n    = required(node, "n",  "curve");
    return spec;
}

EcKey key_from_yaml(const YAML::Node& node) {
    if (!node.IsMap())
        throw std::runtime_error("YAML key: expected a map");

    EcKey key;
    YAML::Node curve = node["curve"];
    if (!curve)
        throw std::runtime_error("YAML key: missing 'curve'");
    if (curve.IsMap()) {
        key.is_explicit = true;
        key.curve_spec  = curve_spec_from_yaml(curve);
        key.curve_name  = key.curve_spec.name;
    } else {
        key.curve_name = curve.as<std::string>();
    }

    key.hash = node["hash"].as<std::string>("");
    try {
        if (node["d"])
            key.d = hex_decode(node["d"].as<std::string>());
        if (node["pub"])
            key.pub = hex_decode(node["pub"].as<std::string>());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("YAML key: ") + e.what());
    }
    return key;
}

rfc6979::Curve complete_key(EcKey& key) {
    rfc6979::Curve curve = rfc6979::Curve::for_key(key);

    if (!key.d.empty()) {
        key.d = pad_left(key.d, curve.scalar_bytes());
        std::vector<uint8_t> derived = curve.public_key(key.d);
        if (!key.pub.empty() && key.pub != derived)
            throw std::runtime_error("key: stored pub does not match d on " + curve.name());
        key.pub = derived;
    } else if (key.pub.empty()) {
        throw std::runtime_error("key: neither 'd' nor 'pub' present");
    }

    if (key.hash.empty())
        key.hash = curve.default_hash();
    return curve;
}

EcKey parse_key(const std::string& yaml_text) {
    YAML::Node doc = YAML::Load(yaml_text);

    std::string doc_type = doc["type"].as<std::string>("");
    if (doc_type != "ecdsa-key")
        throw std::runtime_error("YAML key: 'type' field must be 'ecdsa-key' (got '" +
                                 doc_type + "')");

    EcKey key = key_from_yaml(doc);
    complete_key(key);
    return key;
}

EcKey load_key(const std::string& path) {
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open key file: " + path);
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return parse_key(text);
}

// ── YAML emission ─────────────────────────────────────────────────────────────

std::string emit_key_yaml(const EcKey& key, bool with_private) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << "ecdsa-key";

    out << YAML::Key << "curve" << YAML::Value;
    if (key.is_explicit) {
        const CurveSpec& c = key.curve_spec;
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "p"    << YAML::Value << YAML::DoubleQuoted << c.p;
        out << YAML::Key << "a"    << YAML::Value << YAML::DoubleQuoted << c.a;
        out << YAML::Key << "b"    << YAML::Value << YAML::DoubleQuoted << c.b;
        out << YAML::Key << "gx"   << YAML::Value << YAML::DoubleQuoted << c.gx;
        out << YAML::Key << "gy"   << YAML::Value << YAML::DoubleQuoted << c.gy;
        out << YAML::Key << "n"    << YAML::Value << YAML::DoubleQuoted << c.n;
        out << YAML::EndMap;
    } else {
        out << key.curve_name;
    }

    if (!key.hash.empty())
        out << YAML::Key << "hash" << YAML::Value << key.hash;
    if (with_private && !key.d.empty())
        out << YAML::Key << "d" << YAML::Value << YAML::DoubleQuoted << hex_encode(key.d);
    out << YAML::Key << "pub" << YAML::Value << YAML::DoubleQuoted << hex_encode(key.pub);

    out << YAML::EndMap;
    out << YAML::EndDoc;

    return std::string(out.c_str()) + "\n";
}
