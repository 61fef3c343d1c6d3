#include "sig_codec.hpp"
#include "digest.hpp"
#include "test_util.hpp"
#include <iostream>

// P-256, SHA-256, "sample"; s is in the upper half of the order.
static const char* kR =
    "EFD48B2AACB6A8FD1140DD9CD45E81D69D2C877B56AAF991C34D0EA84EAF3716";
static const char* kS =
    "F7CB1C942D657C41D436C7A1B6E29F65F3E900DBB9AFF4064DC4AB2F843ACDA8";
static const char* kLowS =
    "0834E36AD29A83BF2BC9385E491D6099C8FDF9D1ED67AA7EA5F51F93782857A9";

static rfc6979::Signature sample_sig() {
    rfc6979::Signature sig;
    sig.r = from_hex(kR);
    sig.s = from_hex(kS);
    return sig;
}

static bool test_p1363() {
    bool ok = true;
    rfc6979::Signature sig = sample_sig();
    std::vector<uint8_t> raw = rfc6979::to_p1363(sig);
    ok &= check(to_hex(raw) == std::string(kR) + kS, "P1363 is r || s");

    rfc6979::Signature back = rfc6979::from_p1363(raw, 32);
    ok &= check(back.r == sig.r && back.s == sig.s, "P1363 decode");

    bool threw = false;
    try {
        rfc6979::from_p1363(raw, 33);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= check(threw, "P1363 length mismatch must be rejected");
    return ok;
}

static bool test_der() {
    bool ok = true;
    rfc6979::Signature sig = sample_sig();
    std::vector<uint8_t> der = rfc6979::to_der(sig);

    // Both integers have the top bit set, so each gets a 0x00 pad byte:
    // 30 46 02 21 00 <r> 02 21 00 <s>
    ok &= check(der.size() == 72, "DER length: " + std::to_string(der.size()));
    ok &= check(to_hex(der) ==
                    std::string("3046022100") + kR + "022100" + kS,
                "DER layout: " + to_hex(der));

    rfc6979::Signature back = rfc6979::from_der(der, 32);
    ok &= check(back.r == sig.r && back.s == sig.s, "DER decode");

    // Short integers come back left-padded to the scalar width.
    rfc6979::Signature small;
    small.r = from_hex("000001");
    small.s = from_hex("00007F");
    der = rfc6979::to_der(small);
    ok &= check(to_hex(der) == "30060201010201" "7F", "DER of small scalars: " + to_hex(der));
    back = rfc6979::from_der(der, 3);
    ok &= check(to_hex(back.r) == "000001" && to_hex(back.s) == "00007F",
                "DER decode pads to scalar width");

    std::vector<uint8_t> trailing = rfc6979::to_der(sig);
    trailing.push_back(0x00);
    bool threw = false;
    try {
        rfc6979::from_der(trailing, 32);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= check(threw, "DER with trailing bytes must be rejected");

    threw = false;
    try {
        rfc6979::from_der(rfc6979::to_der(sig), 16);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= check(threw, "DER integer wider than the scalar must be rejected");

    threw = false;
    try {
        rfc6979::from_der(from_hex("3003020101"), 32);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= check(threw, "truncated DER must be rejected");
    return ok;
}

static bool test_encoding_names() {
    bool ok = true;
    ok &= check(rfc6979::encoding_from_name("der") == rfc6979::SigEncoding::DER, "der");
    ok &= check(rfc6979::encoding_from_name("p1363") == rfc6979::SigEncoding::P1363, "p1363");
    ok &= check(std::string(rfc6979::encoding_name(rfc6979::SigEncoding::DER)) == "der",
                "encoding_name(DER)");

    bool threw = false;
    try {
        rfc6979::encoding_from_name("pem");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= check(threw, "unknown encoding name must be rejected");

    rfc6979::Signature sig = sample_sig();
    for (auto enc : {rfc6979::SigEncoding::P1363, rfc6979::SigEncoding::DER}) {
        rfc6979::Signature back = rfc6979::decode(rfc6979::encode(sig, enc), enc, 32);
        ok &= check(back.r == sig.r && back.s == sig.s,
                    std::string("encode/decode ") + rfc6979::encoding_name(enc));
    }
    return ok;
}

static bool test_low_s() {
    bool ok = true;
    rfc6979::Curve curve = rfc6979::Curve::named("P-256");
    rfc6979::Signature sig = sample_sig();

    ok &= check(!rfc6979::is_low_s(curve, sig), "sample s is high");
    rfc6979::Signature low = rfc6979::normalize_low_s(curve, sig);
    ok &= check(low.r == sig.r, "normalize_low_s keeps r");
    ok &= check(to_hex(low.s) == kLowS, "normalized s: " + to_hex(low.s));
    ok &= check(rfc6979::is_low_s(curve, low), "normalized s is low");

    rfc6979::Signature again = rfc6979::normalize_low_s(curve, low);
    ok &= check(again.s == low.s, "normalize_low_s is idempotent");

    // Both forms verify under the same key.
    std::vector<uint8_t> x =
        from_hex("C9AFA9D845BA75166B5C215767B1D6934E50C3DB36E89B127B8A622B120F6721");
    std::vector<uint8_t> pub = curve.public_key(x);
    const EVP_MD* md = rfc6979::digest_by_name("SHA-256");
    std::vector<uint8_t> h = rfc6979::digest(md, from_hex("73616D706C65"));
    ok &= check(rfc6979::verify(curve, pub, h, sig), "high-S form verifies");
    ok &= check(rfc6979::verify(curve, pub, h, low), "low-S form verifies");
    return ok;
}

int main() {
    bool ok = true;
    try {
        ok &= test_p1363();
        ok &= test_der();
        ok &= test_encoding_names();
        ok &= test_low_s();
    } catch (const std::exception& e) {
        ok = fail(std::string("unexpected exception: ") + e.what());
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
