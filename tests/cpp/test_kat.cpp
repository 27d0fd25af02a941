/**
 * ML-KEM Known Answer Tests
 *
 * Deterministic key generation and encapsulation from fixed seeds, checked
 * against SHA3-256 digests of the produced keys and ciphertexts for every
 * parameter set.
 *
 * Seeds: d = 00..1f, z = 20..3f, m = 40..5f
 *
 * A second group replays vectors published in another implementation's
 * test suite (hash roles and a full K-PKE ciphertext).
 */

#include "mlkem/mlkem.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mlkem;

// Simple test framework
static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... " << std::flush; \
    try

#define TEST_END \
    std::cout << "PASSED" << std::endl; \
    ++tests_passed; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << std::endl; \
        ++tests_failed; \
    }

#define ASSERT_TRUE(cond) \
    if (!(cond)) throw std::runtime_error("Assertion failed: " #cond)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw std::runtime_error("Assertion failed: " #a " == " #b)

#define ASSERT_HEX(bytes, hex) \
    if (to_hex(bytes) != std::string(hex)) \
        throw std::runtime_error(std::string("Mismatch: " #bytes " = ") + to_hex(bytes))

struct KatVector {
    const Params* params;
    const char* ek_prefix;      // first 16 bytes of ek
    const char* ek_digest;      // SHA3-256(ek)
    const char* dk_digest;      // SHA3-256(dk)
    const char* ct_digest;      // SHA3-256(c)
    const char* shared_secret;  // K
    const char* rejection;      // K for c with its first byte flipped
};

static const KatVector KAT_VECTORS[] = {
    {
        &MLKEM512_PARAMS,
        "3995815e597d104355cf29aa5333c932",
        "82f101ff648063b376e2bb6c5b7455f655a50c2feadade150efa0e0e6f365aea",
        "0bd3f5df01098ac9c29d687c7f1bd0588a5573feeef8f1e3b4573fa7f6ab57c8",
        "e3fdddb90255869185c07cdf1c1880b2efe08b6f04da4997b693c0dea61503bd",
        "14cace3e48771b316676afad2cfcfe8488daaa4fad954e57236caa3f24a42cf7",
        "32ee1fb3f7bd2915218e9c1b2d0d2da88f0edce6804278bab3a6123c5bb64fc4",
    },
    {
        &MLKEM768_PARAMS,
        "298aa10d423c8dda069d02bc59e6cdf0",
        "a24e16d8f8f9383a95b77050f4d9fd2f5733eec1d63ef3c23ebf9918173669a7",
        "1149f17c3c4ac6ab1e3e2d9d8bd0171355ac0fa31bb8855c48ceade874c0864b",
        "b4cfbd24cef67afd3764276c6980e0f88f8e9ca57f59b7f12fe1a9c1e72f4710",
        "9cddd089ffe70e3996e76f7c8d06746df34d07e8657bc0fcf2bb0e1c3084aea1",
        "dcfc80c6db46ff7028e3a4398651c063ae7a42c107a6dc8cb07141861698ab92",
    },
    {
        &MLKEM1024_PARAMS,
        "4b94c29450111191823b3514c9ac1ea3",
        "61349e5c131a7e116a0463861d7d18663c5627c38c7147ddaadfd48acd7a4535",
        "f0db5d938027fcd9bad87847d52c14cf0c4abcf0703b749793f212111ffb303b",
        "c1579fa02c614f3762b2a799b51e41cebb8f820f34fa736af02c56de2460ce3c",
        "0ad8d1ea1b8dd788979b4379581218df9321bdce5567eca42ae6be7d395f1a54",
        "8f2c880890996c587aa500cf8b6da03372de706a9f96075744bb0956ea6fbaac",
    },
};

template<typename Bytes>
static std::string to_hex(const Bytes& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

static std::vector<uint8_t> counting_bytes(uint8_t start, size_t len) {
    std::vector<uint8_t> out(len);
    for (size_t i = 0; i < len; ++i) {
        out[i] = static_cast<uint8_t>(start + i);
    }
    return out;
}

static void run_vector(const KatVector& kat) {
    const Params& params = *kat.params;
    std::cout << "\n=== " << params.name << " ===" << std::endl;

    MLKEM kem(params);
    const auto seed = counting_bytes(0x00, MLKEM::KEYGEN_SEED_BYTES);
    const auto m = counting_bytes(0x40, MLKEM::ENCAPS_SEED_BYTES);

    auto [ek, dk] = kem.keygen(seed);
    auto [c, K] = kem.encaps(ek, m);

    TEST("key and ciphertext sizes") {
        ASSERT_EQ(ek.size(), params.ek_size());
        ASSERT_EQ(dk.size(), params.dk_size());
        ASSERT_EQ(c.size(), params.ct_size());
    TEST_END

    TEST("encapsulation key") {
        std::vector<uint8_t> prefix(ek.begin(), ek.begin() + 16);
        ASSERT_HEX(prefix, kat.ek_prefix);
        ASSERT_HEX(H({ek}), kat.ek_digest);
    TEST_END

    TEST("decapsulation key") {
        ASSERT_HEX(H({dk}), kat.dk_digest);
        // z occupies the last 32 bytes
        std::vector<uint8_t> z(dk.end() - 32, dk.end());
        ASSERT_TRUE(z == counting_bytes(0x20, 32));
    TEST_END

    TEST("ciphertext") {
        ASSERT_HEX(H({c}), kat.ct_digest);
    TEST_END

    TEST("shared secret from encapsulation") {
        ASSERT_HEX(K, kat.shared_secret);
    TEST_END

    TEST("shared secret from decapsulation") {
        auto K2 = kem.decaps(dk, c);
        ASSERT_HEX(K2, kat.shared_secret);
    TEST_END

    TEST("implicit rejection secret") {
        auto tampered = c;
        tampered[0] ^= 0x01;
        auto K_reject = kem.decaps(dk, tampered);
        ASSERT_HEX(K_reject, kat.rejection);

        auto z = counting_bytes(0x20, 32);
        ASSERT_TRUE(K_reject == J({z, tampered}));
    TEST_END
}

// =============================================================================
// Independently Published Vectors
// =============================================================================

// Hash roles and one ML-KEM-768 K-PKE encryption from a separate FIPS 203
// implementation's unit tests, with ASCII seeds.
static const char* const ASCII_HASH_INPUT = "qjdhfyritoprlkdjfkrjfbdnzyhdjrtr";
static const char* const ASCII_PKE_SEED = "Salut de la part de moi meme lee";
static const char* const ASCII_PKE_MESSAGE = "Ce message est tres confidentiel";

static const char* const PRF_ETA2_NONCE_A =
    "eedb2631fdc3c6748dc567534e90eb016d087e6c088f3de6f815e854e6a78daf"
    "4181a01d80f26c1f9d2816f95e2427b8e261cc45dc2a98f96a81db2235b0f4d0"
    "2c4a6b2ad94e3444dc921fc0ed378bca86a9eec7179c45be3f6b9809a4770012"
    "e7cd143872e45b7bf8f34e6819102d5a55f32a1f9d105a8b3dfe25af75d76f93";

static const char* const KPKE768_CIPHERTEXT =
    "012ac1758bc94772b397ca25074f4a215bdf198f247b7c752570718c8cb34302"
    "6ab5d3d2f3d077b027eadb4f48e5f03b2e6269a526404b2da74b3f37fece1d85"
    "5839434f9d9248bae4d368cf641ec582de41d5844123b0154e9ec72e1bf945c6"
    "5e3b3b07fd838c1b2f810f1ba7b6edc8ff2f8c30cdc5bb962a9cf00376344238"
    "8ff329714fff31d74614572c3d29106a58400e8c0192fe956a48f80b0d9ae070"
    "2b5ab92e3fa21b08185418acd32f7e95f451e5577138bf88c04e792544f325da"
    "cff933cb44bca9ed3c947d4b1af6bed402dd9abefdd752cf835924c1497f3fb0"
    "e8a5fc0af2e4256120f0eeac759194661a6e3fdb21f7b2dd69bc35cecc827fa6"
    "3639dab275a2979b52db602a7bb82bbaeb00ff77e0f2a0c9eb62cc67eb374cf9"
    "30b59afa48b1bffcb4ec35c9050a5b3f3ee1e7602eec383095b3405a5c2a9a34"
    "a1bd65349706ace75e4e5700661a49097bc395e3529cea3dad0a60360166fd6c"
    "39a3e4448b7b9a019810ae1f2788ea4e59c70fc3a86402bce1de829b300c765f"
    "c04fb868ddbfe18415742d87d9c61b04dbb25212a4d0f94cef95b1a0ae14802d"
    "7a2ed594c72744fd8edb3b5042bb097e6b3ee2453ea11f8ec3c605de358ab9e2"
    "0d030c709963084da663a0d9960fe219f565ddd28de3cf55700ca52fefacaeff"
    "1eb4a33acd0e03451f7426cd366d2bc2ec15908fe8df228d18eb895cb02bc588"
    "81dc7d0257212e8a0629ce9e7dfbc1d6e5674ad03ecb856896effefdf4a2e04b"
    "8d2751588d50202e6561c557058bc4987f91e992039a8c113a0ee0526b8bdfe3"
    "794988e7def3d274db03bb44b6641cc1796ebdfac2168d40aa2bbee9676d8f75"
    "26883579f3244c80ba7c052adeaa25e897621c2e723738ab1d3d357be714f1c1"
    "098185e46df87152ab4036da585f5c6c8afe971d9ffefa49bd446e4c625e9e94"
    "55c79d7f8f744c4e6baccb8cb85dfbb06f10348ee605eb6764623175fcfd90ce"
    "b9c62e5969618bf4663650798d96acd35c5840ba5eb9cf01b61f62677648e4f4"
    "087589be566edc9df121f686665b1eb56ab265807125abba488df00d174d6f01"
    "aa9b5c70b83ae18cfced6aad04eebfb41831d65b4169cd36f0d6a18888d1244e"
    "ba5b659a2be54f70ee2d3c4a6431b83f63b676dc636169b8d3f3aa8ac3b28533"
    "9fd657087745a70324a35904c501f9a60d3d89463e063ea9757c381b33bf1aa3"
    "ec6acfef970e54a1369e5d123e357f4b28dedaf0775fe24014414a83a6b603cd"
    "2d0e51aab08238b11f7edc685697328adf7fce4bf05e20de54b4843f163060dc"
    "2848685338584a90660d52fdf9f482f49669fee04bdd9a0c4296de160cf2405e"
    "249844de8ba1ba815bc6ad86146a8798ea723f00601e77f1455872be02cabf47"
    "dde765913ed904b34eb00efee1d7bc3181b4dddb3441b12d5660803a50658a2b"
    "b567ccf50af9ef7e07903902265f43d57270374a30d89bc964ec5a076cc8276c"
    "4788e289957fb0efa5a7d5ea688ff56c55e91488c4b79bc3177fcf2c469b7c9b";

static Seed ascii_seed(const char* text) {
    Seed out{};
    const std::string s(text);
    if (s.size() != out.size()) {
        throw std::runtime_error("ASCII seed must be 32 characters");
    }
    std::copy(s.begin(), s.end(), out.begin());
    return out;
}

static void run_published_vectors() {
    std::cout << "\n=== Published vectors ===" << std::endl;

    const Seed input = ascii_seed(ASCII_HASH_INPUT);

    TEST("H, J and G") {
        ASSERT_HEX(H({input}), "af791f788a6048e5f16b9ee9ef12add7a3fcdf2d615f79960c588bdc9824178f");
        ASSERT_HEX(J({input}), "1ffbe9a12ca007f5e869838bd0ba33284554800575b87b1023bbfe41a7332b7a");
        auto [g_a, g_b] = G({input});
        ASSERT_HEX(g_a, "132f6750e8aafeee8cff75bafdf1cae43307ac23878d5403990b33664bdec268");
        ASSERT_HEX(g_b, "73fe4185b09c291388961a4420b40a44705538502490b755b27e88d723f85192");
    TEST_END

    TEST("PRF with eta 2") {
        std::vector<uint8_t> out(64 * 2);
        prf(input, static_cast<uint8_t>('a'), out);
        ASSERT_HEX(out, PRF_ETA2_NONCE_A);
    TEST_END

    TEST("ML-KEM-768 K-PKE ciphertext") {
        const Seed d = ascii_seed(ASCII_PKE_SEED);
        const Seed m = ascii_seed(ASCII_PKE_MESSAGE);
        auto [pk, sk] = kpke_keygen(d, MLKEM768_PARAMS);

        // The same seed doubles as the encryption coins
        auto c = kpke_encrypt(pk, m, d, MLKEM768_PARAMS);
        auto c_bytes = c.to_bytes(MLKEM768_PARAMS);
        ASSERT_EQ(c_bytes.size(), MLKEM768_PARAMS.ct_size());
        ASSERT_HEX(c_bytes, KPKE768_CIPHERTEXT);

        ASSERT_TRUE(kpke_decrypt(sk, c, MLKEM768_PARAMS) == m);
    TEST_END
}

int main() {
    std::cout << "=== ML-KEM Known Answer Tests ===" << std::endl;

    for (const auto& kat : KAT_VECTORS) {
        run_vector(kat);
    }
    run_published_vectors();

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, " << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
