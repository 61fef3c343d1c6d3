#include "drbg.hpp"
#include "bits.hpp"
#include "digest.hpp"
#include "test_util.hpp"
#include <iostream>

// RFC 6979 A.1: 163-bit q, SHA-256, message "sample"
static const char* kQ163 = "4000000000000000000020108A2E0CC0D99F8A5EF";
static const char* kX163 = "09A4D6792295A7F730FC3F2B49CBC0F62E862272F";

static const char* kQP256 =
    "FFFFFFFF00000000FFFFFFFFFFFFFFFFBCE6FAADA7179E84F3B9CAC2FC632551";
static const char* kXP256 =
    "C9AFA9D845BA75166B5C215767B1D6934E50C3DB36E89B127B8A622B120F6721";

static bool next_is(rfc6979::NonceGenerator& gen, const std::string& expect_hex,
                    const std::string& label)
{
    TestBn k;
    TestBn want(expect_hex);
    gen.next(k.bn);
    return check(BN_cmp(k.bn, want.bn) == 0,
                 label + ": got " + bn_hex(k.bn) + " expected " + expect_hex);
}

static bool test_a1_trace() {
    bool ok = true;
    const EVP_MD* md = rfc6979::digest_by_name("SHA-256");
    std::vector<uint8_t> h1 = rfc6979::digest(md, from_hex("73616D706C65"));

    TestBn q(kQ163);
    TestBn x(kX163);
    rfc6979::NonceGenerator gen(md, q.bn, x.bn, h1);

    ok &= check(gen.qlen() == 163, "qlen for A.1 order");
    ok &= check(to_hex(gen.state().k) ==
                    "0CF2FE96D5619C9EF53CB7417D49D37EA68A4FFED0D7E623E38689289911BD57",
                "A.1 seeded K: " + to_hex(gen.state().k));
    ok &= check(to_hex(gen.state().v) ==
                    "783457C1CF3148A8F2A9AE73ED472FA98ED9CD925D8E964CE0764DEF3F842B9A",
                "A.1 seeded V: " + to_hex(gen.state().v));

    // The first two candidates exceed q and are handed out unfiltered.
    ok &= next_is(gen, "4982D236F3FFC758838CA6F5E9FEA455106AF3B2B", "A.1 candidate 1");
    ok &= next_is(gen, "63863C30451DADF4944DF4877B740D4F160A8B6AB", "A.1 candidate 2");
    ok &= next_is(gen, "23AF4074C90A02B3FE61D286D5C87F425E6BDD81B", "A.1 candidate 3");
    ok &= next_is(gen, "108F6A59FA76A12FC133DD7B9FAD249CDB6FCA97B", "A.1 candidate 4");
    return ok;
}

static bool test_p256_seed_and_candidates() {
    bool ok = true;
    const EVP_MD* md = rfc6979::digest_by_name("SHA-256");
    TestBn q(kQP256);
    TestBn x(kXP256);

    std::vector<uint8_t> h1 = rfc6979::digest(md, from_hex("73616D706C65"));
    rfc6979::NonceGenerator gen(md, q.bn, x.bn, h1);
    ok &= check(to_hex(gen.state().k) ==
                    "B6D4F98EBAE70AA15A2238ADE4E20AB323FC1E777D22F0C582D8EF2E6BA73569",
                "P-256 seeded K: " + to_hex(gen.state().k));
    ok &= check(to_hex(gen.state().v) ==
                    "BAE57FE256DE2DE806B10635497237E7BAE96754582566384C47C6C3416494D1",
                "P-256 seeded V: " + to_hex(gen.state().v));
    ok &= next_is(gen, "A6E3C57DD01ABE90086538398355DD4C3B17AA873382B0F24D6129493D8AAD60",
                  "P-256 sample candidate 1");
    ok &= next_is(gen, "8E83DC490BC5FC4D5992BD63CD87F254ADFFCB930F8A8011702A88870F638FDB",
                  "P-256 sample candidate 2");

    std::vector<uint8_t> h2 = rfc6979::digest(md, from_hex("74657374"));
    rfc6979::NonceGenerator gen2(md, q.bn, x.bn, h2);
    ok &= next_is(gen2, "D16B6AE827F17175E040871A1C7EC3500192C4C92677336EC2537ACAEE0008E0",
                  "P-256 test candidate 1");
    return ok;
}

// seed_state is a pure function of its inputs.
static bool test_seed_state_direct() {
    bool ok = true;
    const EVP_MD* md = rfc6979::digest_by_name("SHA-256");
    rfc6979::Hmac hmac(md);
    ok &= check(hmac.size() == 32, "HMAC-SHA-256 output length");

    TestBn q(kQ163);
    std::vector<uint8_t> h1 = rfc6979::digest(md, from_hex("73616D706C65"));
    std::vector<uint8_t> x_octets = from_hex("009A4D6792295A7F730FC3F2B49CBC0F62E862272F");
    std::vector<uint8_t> h1_octets = rfc6979::bits2octets(h1, q.bn);

    rfc6979::DrbgState a = rfc6979::seed_state(hmac, x_octets, h1_octets);
    rfc6979::DrbgState b = rfc6979::seed_state(hmac, x_octets, h1_octets);
    ok &= check(a.k == b.k && a.v == b.v, "seed_state must be deterministic");
    ok &= check(to_hex(a.k) ==
                    "0CF2FE96D5619C9EF53CB7417D49D37EA68A4FFED0D7E623E38689289911BD57",
                "seed_state K: " + to_hex(a.k));

    x_octets.back() ^= 0x01;
    rfc6979::DrbgState c = rfc6979::seed_state(hmac, x_octets, h1_octets);
    ok &= check(c.k != a.k && c.v != a.v, "seed_state must depend on x");
    return ok;
}

// A fresh generator over the same inputs replays the same stream.
static bool test_replay() {
    bool ok = true;
    const EVP_MD* md = rfc6979::digest_by_name("SHA-384");
    TestBn q(kQP256);
    TestBn x(kXP256);
    std::vector<uint8_t> h1 = rfc6979::digest(md, from_hex("74657374"));

    rfc6979::NonceGenerator a(md, q.bn, x.bn, h1);
    rfc6979::NonceGenerator b(md, q.bn, x.bn, h1);
    ok &= check(a.state().k.size() == 48, "SHA-384 DRBG key length");

    TestBn ka, kb, first;
    for (int i = 0; i < 5; ++i) {
        a.next(ka.bn);
        b.next(kb.bn);
        ok &= check(BN_cmp(ka.bn, kb.bn) == 0,
                    "replayed candidate " + std::to_string(i) + " differs");
        ok &= check(BN_num_bits(ka.bn) <= 256, "candidate wider than qlen");
        if (i == 0)
            BN_copy(first.bn, ka.bn);
        else
            ok &= check(BN_cmp(ka.bn, first.bn) != 0, "stream repeated its first value");
    }
    return ok;
}

int main() {
    bool ok = true;
    try {
        ok &= test_a1_trace();
        ok &= test_p256_seed_and_candidates();
        ok &= test_seed_state_direct();
        ok &= test_replay();
    } catch (const std::exception& e) {
        ok = fail(std::string("unexpected exception: ") + e.what());
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
