#include "curve.hpp"
#include "digest.hpp"
#include "drbg.hpp"
#include "ecdsa.hpp"
#include "sig_codec.hpp"
#include "hex.hpp"
#include "key_io.hpp"
#include "pem_io.hpp"
#include "vectors.hpp"
#include <openssl/bn.h>
#include <iostream>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <string>
#include <vector>
#include <cctype>
#include <cstdlib>

// ── Exit codes ────────────────────────────────────────────────────────────────
static const int EXIT_OK     = 0;
static const int EXIT_USAGE  = 1;
static const int EXIT_CRYPTO = 2;
static const int EXIT_IO     = 3;

// ── Usage ─────────────────────────────────────────────────────────────────────
static void print_usage(const char* prog) {
    std::cerr <<
        "Usage: " << prog << " <command> [options] [file]\n"
        "\n"
        "Commands:\n"
        "  sign      Sign a file with deterministic ECDSA (RFC 6979)\n"
        "  verify    Verify a signature over a file\n"
        "  pubkey    Print the public half of a key\n"
        "  nonce     Print the nonce candidates for a file\n"
        "  vectors   Run a YAML test vector table\n"
        "\n"
        "Options:\n"
        "  --key <file>            Key file (YAML)\n"
        "  --hash <name>           Hash (default: the key's hash)\n"
        "  --sig <file>            Signature file (output for sign, input for verify)\n"
        "  --encoding <p1363|der>  Signature encoding for sign (default: p1363)\n"
        "  --low-s                 Normalize s to the lower half of the order\n"
        "  --prehashed             The file holds a hex digest, not the message\n"
        "  --count <N>             Number of candidates for nonce (default: 1)\n"
        "\n"
        "Examples:\n"
        "  " << prog << " sign    --key alice.key.yaml --sig msg.sig msg.txt\n"
        "  " << prog << " verify  --key alice.pub.yaml --sig msg.sig msg.txt\n"
        "  " << prog << " pubkey  --key alice.key.yaml > alice.pub.yaml\n"
        "  " << prog << " nonce   --key alice.key.yaml --count 4 msg.txt\n"
        "  " << prog << " vectors data/rfc6979_vectors.yaml\n";
}

// ── Argument parser ───────────────────────────────────────────────────────────
struct Args {
    std::string command;
    std::string key, hash, sig;
    std::string encoding = "p1363";
    bool        low_s = false;
    bool        prehashed = false;
    int         count = 1;
    std::string file;
};

static bool parse_args(int argc, char** argv, Args& args, const char* prog) {
    if (argc < 2) {
        print_usage(prog);
        return false;
    }
    args.command = argv[1];
    if (args.command == "--help" || args.command == "-h") {
        print_usage(prog);
        return false;
    }
    if (args.command != "sign"   &&
        args.command != "verify" &&
        args.command != "pubkey" &&
        args.command != "nonce"  &&
        args.command != "vectors") {
        std::cerr << "Unknown command: " << args.command << "\n\n";
        print_usage(prog);
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string opt = argv[i];
        auto need_val = [&]() -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Option " << opt << " requires a value\n";
                return false;
            }
            return true;
        };

        if (opt == "--key") {
            if (!need_val()) return false;
            args.key = argv[++i];
        } else if (opt == "--hash") {
            if (!need_val()) return false;
            args.hash = argv[++i];
        } else if (opt == "--sig") {
            if (!need_val()) return false;
            args.sig = argv[++i];
        } else if (opt == "--encoding") {
            if (!need_val()) return false;
            args.encoding = argv[++i];
            if (args.encoding != "p1363" && args.encoding != "der") {
                std::cerr << "Invalid encoding: " << args.encoding
                          << " (must be p1363 or der)\n";
                return false;
            }
        } else if (opt == "--low-s") {
            args.low_s = true;
        } else if (opt == "--prehashed") {
            args.prehashed = true;
        } else if (opt == "--count") {
            if (!need_val()) return false;
            std::string n = argv[++i];
            char* end = nullptr;
            long v = std::strtol(n.c_str(), &end, 10);
            if (n.empty() || *end != '\0' || v < 1 || v > 1000) {
                std::cerr << "Invalid count: " << n << " (must be 1..1000)\n";
                return false;
            }
            args.count = (int)v;
        } else if (!opt.empty() && opt[0] == '-') {
            std::cerr << "Unknown option: " << opt << "\n\n";
            print_usage(prog);
            return false;
        } else if (args.file.empty()) {
            args.file = opt;
        } else {
            std::cerr << "Unexpected argument: " << opt << "\n";
            return false;
        }
    }
    return true;
}

// ── Read a binary file into a vector ─────────────────────────────────────────
static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open file for reading: " + path);
    return std::vector<uint8_t>(
        std::istreambuf_iterator<char>(f),
        std::istreambuf_iterator<char>());
}

// ── Shared steps ──────────────────────────────────────────────────────────────

// Key plus its curve; load failures are I/O errors.
struct LoadedKey {
    EcKey          key;
    rfc6979::Curve curve;
};

static LoadedKey load_loaded_key(const std::string& path) {
    EcKey key = load_key(path);
    rfc6979::Curve curve = rfc6979::Curve::for_key(key);
    return LoadedKey{std::move(key), std::move(curve)};
}

// --hash beats the key's hash.
static const EVP_MD* pick_hash(const Args& args, const EcKey& key) {
    std::string name = args.hash.empty() ? key.hash : args.hash;
    if (name.empty())
        throw std::invalid_argument("no hash named by the key; pass --hash");
    return rfc6979::digest_by_name(name);
}

// H(file), or the hex digest stored in the file with --prehashed.
static std::vector<uint8_t> message_digest(const Args& args, const EVP_MD* md) {
    std::vector<uint8_t> data = read_file(args.file);
    if (!args.prehashed)
        return rfc6979::digest(md, data);

    std::string hex;
    for (uint8_t c : data) {
        if (!std::isspace(c)) hex += (char)c;
    }
    std::vector<uint8_t> h = hex_decode(hex);
    if (h.empty())
        throw std::runtime_error("Empty digest in " + args.file);
    return h;
}

// ── Commands ──────────────────────────────────────────────────────────────────
static int cmd_sign(const Args& args) {
    if (args.key.empty() || args.file.empty()) {
        std::cerr << "sign requires --key and a file\n";
        return EXIT_USAGE;
    }

    std::optional<LoadedKey> lk;
    const EVP_MD* md = nullptr;
    std::vector<uint8_t> h;
    try {
        lk = load_loaded_key(args.key);
        md = pick_hash(args, lk->key);
        h  = message_digest(args, md);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_IO;
    }
    if (lk->key.d.empty()) {
        std::cerr << "Error: " << args.key << " holds no private scalar\n";
        return EXIT_USAGE;
    }

    rfc6979::SigEncoding enc = rfc6979::encoding_from_name(args.encoding);
    std::vector<uint8_t> sig_bytes;
    try {
        rfc6979::Signature sig = rfc6979::sign(lk->curve, lk->key.d, h, md);
        if (args.low_s)
            sig = rfc6979::normalize_low_s(lk->curve, sig);
        sig_bytes = rfc6979::encode(sig, enc);
    } catch (const std::exception& e) {
        std::cerr << "Error: sign: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }

    const char* label = enc == rfc6979::SigEncoding::DER ? kDerSigLabel : kP1363SigLabel;
    try {
        if (args.sig.empty()) {
            write_pem(std::cout, label, sig_bytes);
        } else {
            write_pem(args.sig, label, sig_bytes);
            std::cout << "Signed " << args.file << "\n"
                      << "  Curve:     " << lk->curve.name() << "\n"
                      << "  Hash:      " << rfc6979::digest_name(md) << "\n"
                      << "  Signature: " << args.sig << " (" << sig_bytes.size()
                      << " bytes, " << args.encoding << ")\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_IO;
    }
    return EXIT_OK;
}

static int cmd_verify(const Args& args) {
    if (args.key.empty() || args.sig.empty() || args.file.empty()) {
        std::cerr << "verify requires --key, --sig, and a file\n";
        return EXIT_USAGE;
    }

    std::optional<LoadedKey> lk;
    const EVP_MD* md = nullptr;
    std::vector<uint8_t> h, sig_bytes;
    std::string label;
    try {
        lk        = load_loaded_key(args.key);
        md        = pick_hash(args, lk->key);
        h         = message_digest(args, md);
        sig_bytes = read_pem_any(args.sig, label);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_IO;
    }

    rfc6979::SigEncoding enc;
    if (label == kP1363SigLabel) {
        enc = rfc6979::SigEncoding::P1363;
    } else if (label == kDerSigLabel) {
        enc = rfc6979::SigEncoding::DER;
    } else {
        std::cerr << "Error: " << args.sig << ": not an ECDSA signature (" << label << ")\n";
        return EXIT_IO;
    }

    bool ok = false;
    try {
        rfc6979::Signature sig = rfc6979::decode(sig_bytes, enc, lk->curve.scalar_bytes());
        ok = rfc6979::verify(lk->curve, lk->key.pub, h, sig);
    } catch (const std::exception& e) {
        std::cerr << "Error: verify: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }

    if (!ok) {
        std::cout << "Signature INVALID\n";
        return EXIT_CRYPTO;
    }
    std::cout << "Signature OK (" << lk->curve.name() << ", "
              << rfc6979::digest_name(md) << ")\n";
    return EXIT_OK;
}

static int cmd_pubkey(const Args& args) {
    if (args.key.empty()) {
        std::cerr << "pubkey requires --key\n";
        return EXIT_USAGE;
    }
    try {
        std::cout << emit_key_yaml(load_key(args.key), false);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_IO;
    }
    return EXIT_OK;
}

static int cmd_nonce(const Args& args) {
    if (args.key.empty() || args.file.empty()) {
        std::cerr << "nonce requires --key and a file\n";
        return EXIT_USAGE;
    }

    std::optional<LoadedKey> lk;
    const EVP_MD* md = nullptr;
    std::vector<uint8_t> h;
    try {
        lk = load_loaded_key(args.key);
        md = pick_hash(args, lk->key);
        h  = message_digest(args, md);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_IO;
    }
    if (lk->key.d.empty()) {
        std::cerr << "Error: " << args.key << " holds no private scalar\n";
        return EXIT_USAGE;
    }

    const BIGNUM* q = lk->curve.order();
    BIGNUM* x = BN_secure_new();
    BIGNUM* k = BN_secure_new();
    if (!x || !k || !BN_bin2bn(lk->key.d.data(), (int)lk->key.d.size(), x)) {
        BN_clear_free(x);
        BN_clear_free(k);
        std::cerr << "Error: nonce: BIGNUM allocation failed\n";
        return EXIT_CRYPTO;
    }

    try {
        rfc6979::NonceGenerator gen(md, q, x, h);
        size_t rolen = lk->curve.scalar_bytes();
        for (int i = 0; i < args.count; ++i) {
            gen.next(k);
            bool in_range = !BN_is_zero(k) && BN_cmp(k, q) < 0;
            std::vector<uint8_t> kb(rolen);
            if (BN_bn2binpad(k, kb.data(), (int)rolen) < 0)
                throw std::runtime_error("BN_bn2binpad failed");
            std::cout << "k[" << i << "] = " << hex_encode(kb)
                      << (in_range ? "" : "  (out of range)") << "\n";
        }
    } catch (const std::exception& e) {
        BN_clear_free(x);
        BN_clear_free(k);
        std::cerr << "Error: nonce: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }

    BN_clear_free(x);
    BN_clear_free(k);
    return EXIT_OK;
}

static int cmd_vectors(const Args& args) {
    if (args.file.empty()) {
        std::cerr << "vectors requires a vector file\n";
        return EXIT_USAGE;
    }

    std::vector<VectorResult> results;
    try {
        results = run_vectors(args.file);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << args.file << ": " << e.what() << "\n";
        return EXIT_IO;
    }

    int failed = 0;
    for (const auto& r : results) {
        if (r.passed) {
            std::cout << "PASS " << r.name << "\n";
        } else {
            std::cout << "FAIL " << r.name << ": " << r.detail << "\n";
            ++failed;
        }
    }
    std::cout << (results.size() - (size_t)failed) << "/" << results.size() << " passed\n";
    return failed == 0 ? EXIT_OK : EXIT_CRYPTO;
}

// ── main ──────────────────────────────────────────────────────────────────────
int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args, argv[0]))
        return EXIT_USAGE;

    if (args.command == "sign")    return cmd_sign(args);
    if (args.command == "verify")  return cmd_verify(args);
    if (args.command == "pubkey")  return cmd_pubkey(args);
    if (args.command == "nonce")   return cmd_nonce(args);
    if (args.command == "vectors") return cmd_vectors(args);
    return EXIT_USAGE;
}
