/**
 * ML-KEM Test Suite
 * Tests for ML-KEM-512, ML-KEM-768, and ML-KEM-1024
 */

#include "mlkem/mlkem.hpp"
#include <algorithm>
#include <iostream>
#include <span>
#include <stdexcept>
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
    } catch (...) { \
        std::cout << "FAILED: Unknown exception" << std::endl; \
        ++tests_failed; \
    }

#define ASSERT_TRUE(cond) \
    if (!(cond)) throw std::runtime_error("Assertion failed: " #cond)

#define ASSERT_FALSE(cond) \
    if (cond) throw std::runtime_error("Assertion failed: NOT " #cond)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw std::runtime_error("Assertion failed: " #a " == " #b)

template<typename KEM>
void test_keygen() {
    KEM kem;

    TEST("keygen generates valid key sizes") {
        auto [ek, dk] = kem.keygen();
        ASSERT_EQ(ek.size(), kem.params().ek_size());
        ASSERT_EQ(dk.size(), kem.params().dk_size());
    TEST_END

    TEST("keygen with seed is deterministic") {
        std::vector<uint8_t> seed(64, 0x42);
        auto [ek1, dk1] = kem.keygen(seed);
        auto [ek2, dk2] = kem.keygen(seed);
        ASSERT_TRUE(ek1 == ek2);
        ASSERT_TRUE(dk1 == dk2);
    TEST_END

    TEST("keygen without seed is random") {
        auto [ek1, dk1] = kem.keygen();
        auto [ek2, dk2] = kem.keygen();
        ASSERT_FALSE(ek1 == ek2);
        ASSERT_FALSE(dk1 == dk2);
    TEST_END

    TEST("decapsulation key embeds ek, H(ek) and z") {
        std::vector<uint8_t> seed(64);
        for (size_t i = 0; i < seed.size(); ++i) seed[i] = static_cast<uint8_t>(i);
        auto [ek, dk] = kem.keygen(seed);

        const size_t dk_pke = kem.params().dk_pke_size();
        std::vector<uint8_t> embedded_ek(dk.begin() + dk_pke, dk.begin() + dk_pke + ek.size());
        ASSERT_TRUE(embedded_ek == ek);

        auto h = H({ek});
        ASSERT_TRUE(std::equal(h.begin(), h.end(), dk.end() - 64));
        ASSERT_TRUE(std::equal(seed.begin() + 32, seed.end(), dk.end() - 32));
    TEST_END

    TEST("generated keys pass the input checks") {
        auto [ek, dk] = kem.keygen();
        ASSERT_TRUE(kem.check_encapsulation_key(ek));
        ASSERT_TRUE(kem.check_decapsulation_key(dk));
    TEST_END
}

template<typename KEM>
void test_encaps_decaps() {
    KEM kem;

    TEST("encaps/decaps basic round-trip") {
        auto [ek, dk] = kem.keygen();
        auto [c, K1] = kem.encaps(ek);

        ASSERT_EQ(K1.size(), kem.params().ss_size());
        ASSERT_EQ(c.size(), kem.params().ct_size());

        auto K2 = kem.decaps(dk, c);
        ASSERT_TRUE(K1 == K2);
    TEST_END

    TEST("encaps with randomness is deterministic") {
        auto [ek, dk] = kem.keygen();
        std::vector<uint8_t> rand(32, 0xAB);

        auto [c1, K1] = kem.encaps(ek, rand);
        auto [c2, K2] = kem.encaps(ek, rand);

        ASSERT_TRUE(K1 == K2);
        ASSERT_TRUE(c1 == c2);
        ASSERT_TRUE(kem.decaps(dk, c1) == K1);
    TEST_END

    TEST("encaps without randomness is random") {
        auto [ek, dk] = kem.keygen();

        auto [c1, K1] = kem.encaps(ek);
        auto [c2, K2] = kem.encaps(ek);

        // Ciphertexts and shared secrets should be different
        ASSERT_FALSE(c1 == c2);
        ASSERT_FALSE(K1 == K2);
    TEST_END

    TEST("round-trip over many key pairs") {
        for (int i = 0; i < 20; ++i) {
            auto [ek, dk] = kem.keygen();
            auto [c, K] = kem.encaps(ek);
            ASSERT_TRUE(kem.decaps(dk, c) == K);
        }
    TEST_END
}

template<typename KEM>
void test_decaps_failures() {
    KEM kem;

    TEST("decaps with wrong dk returns implicit rejection") {
        auto [ek1, dk1] = kem.keygen();
        auto [ek2, dk2] = kem.keygen();

        auto [c, K_expected] = kem.encaps(ek1);

        // Decaps with wrong dk should return a pseudorandom value, not K
        auto K_wrong = kem.decaps(dk2, c);
        ASSERT_FALSE(K_expected == K_wrong);
    TEST_END

    TEST("decaps with tampered ciphertext returns J(z || c)") {
        auto [ek, dk] = kem.keygen();
        auto [c, K_expected] = kem.encaps(ek);

        // Tamper with ciphertext
        std::vector<uint8_t> c_tampered = c;
        c_tampered[0] ^= 0xFF;

        auto K_wrong = kem.decaps(dk, c_tampered);
        ASSERT_FALSE(K_expected == K_wrong);

        std::span<const uint8_t> z = std::span<const uint8_t>(dk).last(32);
        auto K_bar = J({z, c_tampered});
        ASSERT_TRUE(K_wrong == K_bar);
    TEST_END

    TEST("implicit rejection is deterministic") {
        auto [ek, dk] = kem.keygen();
        auto [c, K] = kem.encaps(ek);

        // Tamper with ciphertext
        std::vector<uint8_t> c_tampered = c;
        c_tampered[c_tampered.size() - 1] ^= 0x01;

        // Same tampered ciphertext should give same rejection value
        auto K1 = kem.decaps(dk, c_tampered);
        auto K2 = kem.decaps(dk, c_tampered);

        ASSERT_TRUE(K1 == K2);
        ASSERT_FALSE(K1 == K);
    TEST_END
}

template<typename KEM>
void test_input_validation() {
    KEM kem;

    TEST("keygen rejects wrong seed size") {
        std::vector<uint8_t> bad_seed(32, 0);  // Should be 64 bytes
        bool threw = false;
        try {
            (void)kem.keygen(bad_seed);
        } catch (const InvalidLength& e) {
            threw = e.expected() == 64 && e.actual() == 32;
        }
        ASSERT_TRUE(threw);
    TEST_END

    TEST("encaps rejects wrong ek size") {
        std::vector<uint8_t> bad_ek(100, 0);  // Wrong size
        bool threw = false;
        try {
            (void)kem.encaps(bad_ek);
        } catch (const InvalidLength&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    TEST_END

    TEST("encaps rejects wrong randomness size") {
        auto [ek, dk] = kem.keygen();
        std::vector<uint8_t> bad_rand(31, 0);
        bool threw = false;
        try {
            (void)kem.encaps(ek, bad_rand);
        } catch (const InvalidLength&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    TEST_END

    TEST("decaps rejects wrong dk size") {
        auto [ek, dk] = kem.keygen();
        auto [c, K] = kem.encaps(ek);

        std::vector<uint8_t> bad_dk(100, 0);  // Wrong size
        bool threw = false;
        try {
            (void)kem.decaps(bad_dk, c);
        } catch (const InvalidLength&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    TEST_END

    TEST("decaps rejects wrong ciphertext size") {
        auto [ek, dk] = kem.keygen();

        std::vector<uint8_t> bad_ct(100, 0);  // Wrong size
        bool threw = false;
        try {
            (void)kem.decaps(dk, bad_ct);
        } catch (const InvalidLength&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    TEST_END

    TEST("encapsulation key check rejects unreduced coefficient") {
        auto [ek, dk] = kem.keygen();
        // First coefficient becomes 0xFFF >= q
        ek[0] = 0xFF;
        ek[1] |= 0x0F;
        ASSERT_FALSE(kem.check_encapsulation_key(ek));
    TEST_END

    TEST("decapsulation key check rejects corrupted hash") {
        auto [ek, dk] = kem.keygen();
        dk[dk.size() - 40] ^= 0x01;
        ASSERT_FALSE(kem.check_decapsulation_key(dk));
    TEST_END
}

template<typename KEM>
void test_key_checks() {
    KEM kem;
    const size_t t_len = kem.params().dk_pke_size();

    TEST("ek check accepts q - 1 and rejects q") {
        auto [ek, dk] = kem.keygen();
        // Coefficient 0 is ek[0] | (ek[1] & 0x0F) << 8
        ek[0] = 0x00;
        ek[1] = static_cast<uint8_t>((ek[1] & 0xF0) | 0x0D);   // 0xD00 = q - 1
        ASSERT_TRUE(kem.check_encapsulation_key(ek));
        ek[0] = 0x01;                                           // 0xD01 = q
        ASSERT_FALSE(kem.check_encapsulation_key(ek));
    TEST_END

    TEST("ek check covers the last coefficient") {
        auto [ek, dk] = kem.keygen();
        // Last coefficient is (ek[t_len-2] >> 4) | ek[t_len-1] << 4
        ek[t_len - 2] |= 0xF0;
        ek[t_len - 1] = 0xFF;
        ASSERT_FALSE(kem.check_encapsulation_key(ek));
    TEST_END

    TEST("ek check ignores rho") {
        auto [ek, dk] = kem.keygen();
        for (size_t i = t_len; i < ek.size(); ++i) ek[i] = 0xFF;
        ASSERT_TRUE(kem.check_encapsulation_key(ek));
    TEST_END

    TEST("encaps accepts an unreduced ek") {
        auto [ek, dk] = kem.keygen();
        ek[0] = 0xFF;
        ek[1] |= 0x0F;
        std::vector<uint8_t> m(32, 0x01);
        auto [c, K] = kem.encaps(ek, m);
        ASSERT_EQ(c.size(), kem.params().ct_size());
    TEST_END

    TEST("dk check detects a swapped embedded ek") {
        auto [ek1, dk1] = kem.keygen();
        auto [ek2, dk2] = kem.keygen();
        std::copy(ek2.begin(), ek2.end(), dk1.begin() + static_cast<std::ptrdiff_t>(t_len));
        ASSERT_FALSE(kem.check_decapsulation_key(dk1));
        ASSERT_TRUE(kem.check_decapsulation_key(dk2));
    TEST_END

    TEST("dk check does not depend on z") {
        auto [ek, dk] = kem.keygen();
        dk[dk.size() - 1] ^= 0x80;
        ASSERT_TRUE(kem.check_decapsulation_key(dk));
    TEST_END
}

template<typename KEM>
void test_parameter_binding() {
    KEM kem;

    TEST("instance reports its parameter set") {
        const Params& p = kem.params();
        ASSERT_TRUE(&params_by_name(p.name) == &p);
        ASSERT_EQ(p.ek_size(), static_cast<size_t>(384 * p.k + 32));
        ASSERT_EQ(p.dk_size(), static_cast<size_t>(768 * p.k + 96));
        ASSERT_EQ(p.ct_size(), static_cast<size_t>(32 * (p.du * p.k + p.dv)));
    TEST_END

    TEST("selector-constructed instance interoperates") {
        MLKEM by_name(params_by_name(kem.params().name));
        auto [ek, dk] = kem.keygen();
        auto [c, K] = by_name.encaps(ek);
        ASSERT_TRUE(kem.decaps(dk, c) == K);
    TEST_END
}

int main() {
    std::cout << "=== ML-KEM Test Suite ===" << std::endl << std::endl;

    std::cout << "--- ML-KEM-512 Tests ---" << std::endl;
    test_keygen<MLKEM512>();
    test_encaps_decaps<MLKEM512>();
    test_decaps_failures<MLKEM512>();
    test_input_validation<MLKEM512>();
    test_key_checks<MLKEM512>();
    test_parameter_binding<MLKEM512>();

    std::cout << std::endl << "--- ML-KEM-768 Tests ---" << std::endl;
    test_keygen<MLKEM768>();
    test_encaps_decaps<MLKEM768>();
    test_decaps_failures<MLKEM768>();
    test_input_validation<MLKEM768>();
    test_key_checks<MLKEM768>();
    test_parameter_binding<MLKEM768>();

    std::cout << std::endl << "--- ML-KEM-1024 Tests ---" << std::endl;
    test_keygen<MLKEM1024>();
    test_encaps_decaps<MLKEM1024>();
    test_decaps_failures<MLKEM1024>();
    test_input_validation<MLKEM1024>();
    test_key_checks<MLKEM1024>();
    test_parameter_binding<MLKEM1024>();

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
