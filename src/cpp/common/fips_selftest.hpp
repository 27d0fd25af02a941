/**
 * FIPS 140-3 Self-Test Module
 *
 * Provides Conditional Algorithm Self-Tests (CAST) for ML-KEM.
 * The self-test runs automatically the first time a KEM is created through
 * the algorithm factory.
 *
 * Test Types:
 *   - Known Answer Test (KAT): deterministic ML-KEM-768 key generation,
 *     encapsulation, decapsulation and implicit rejection, checked against
 *     pre-computed digests
 *   - Pairwise Consistency Tests (PCT): a fresh key pair of every parameter
 *     set must decapsulate its own encapsulation
 *
 * Usage:
 *   // Automatic testing on first use (recommended)
 *   auto kem = pqc::create_kem("ML-KEM-768");  // Self-test runs automatically
 *
 *   // Manual testing
 *   pqc::fips::run_mlkem_self_test();
 *
 *   // Query status
 *   if (pqc::fips::get_self_test_state() == pqc::fips::TestState::PASSED) { ... }
 */

#ifndef COMMON_FIPS_SELFTEST_HPP
#define COMMON_FIPS_SELFTEST_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "ct_utils.hpp"
#include "mlkem/mlkem.hpp"

namespace pqc {
namespace fips {

// ============================================================================
// Self-Test Status
// ============================================================================

/**
 * Status of the ML-KEM self-test
 */
enum class TestState {
    NOT_RUN,    // Test has not been executed
    PASSED,     // Test completed successfully
    FAILED      // Test failed - algorithm should not be used
};

// ============================================================================
// Exception Types
// ============================================================================

/**
 * Exception thrown when a FIPS self-test fails
 */
class SelfTestFailure : public std::runtime_error {
public:
    explicit SelfTestFailure(const std::string& algorithm, const std::string& reason)
        : std::runtime_error("FIPS self-test failed for " + algorithm + ": " + reason)
        , algorithm_(algorithm)
        , reason_(reason) {}

    [[nodiscard]] const std::string& algorithm() const { return algorithm_; }
    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    std::string algorithm_;
    std::string reason_;
};

// ============================================================================
// Internal State
// ============================================================================

namespace detail {

// Thread-safe test state tracking
inline std::atomic<int> mlkem_state{0};   // 0=not run, 1=passed, -1=failed

// Mutex for one-time test execution
inline std::mutex mlkem_mutex;

/**
 * Convert hex string to bytes
 */
inline std::vector<uint8_t> hex_to_bytes(const char* hex) {
    std::vector<uint8_t> bytes;
    while (hex[0] && hex[1]) {
        char high = *hex++;
        char low = *hex++;
        uint8_t byte = 0;

        if (high >= '0' && high <= '9') byte = (high - '0') << 4;
        else if (high >= 'A' && high <= 'F') byte = (high - 'A' + 10) << 4;
        else if (high >= 'a' && high <= 'f') byte = (high - 'a' + 10) << 4;

        if (low >= '0' && low <= '9') byte |= (low - '0');
        else if (low >= 'A' && low <= 'F') byte |= (low - 'A' + 10);
        else if (low >= 'a' && low <= 'f') byte |= (low - 'a' + 10);

        bytes.push_back(byte);
    }
    return bytes;
}

/**
 * Constant-time comparison against an expected hex value
 */
inline bool matches_hex(std::span<const uint8_t> actual, const char* expected_hex) {
    return ct::equal(actual, hex_to_bytes(expected_hex));
}

// ============================================================================
// ML-KEM Known Answer Test Vectors
// ============================================================================

// ML-KEM-768 key generation seed d || z = 00 01 02 ... 3F
constexpr const char* MLKEM768_KEYGEN_SEED =
    "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"
    "202122232425262728292a2b2c2d2e2f303132333435363738393a3b3c3d3e3f";

// Encapsulation randomness m = 40 41 ... 5F
constexpr const char* MLKEM768_ENCAPS_SEED =
    "404142434445464748494a4b4c4d4e4f505152535455565758595a5b5c5d5e5f";

// SHA3-256 digests of the generated encapsulation key, decapsulation key
// and ciphertext
constexpr const char* MLKEM768_EK_DIGEST =
    "a24e16d8f8f9383a95b77050f4d9fd2f5733eec1d63ef3c23ebf9918173669a7";
constexpr const char* MLKEM768_DK_DIGEST =
    "1149f17c3c4ac6ab1e3e2d9d8bd0171355ac0fa31bb8855c48ceade874c0864b";
constexpr const char* MLKEM768_CT_DIGEST =
    "b4cfbd24cef67afd3764276c6980e0f88f8e9ca57f59b7f12fe1a9c1e72f4710";

// Shared secret of the encapsulation above
constexpr const char* MLKEM768_SHARED_SECRET =
    "9cddd089ffe70e3996e76f7c8d06746df34d07e8657bc0fcf2bb0e1c3084aea1";

// Implicit-rejection secret J(z || c') for the ciphertext with its first
// byte flipped
constexpr const char* MLKEM768_REJECTION_SECRET =
    "dcfc80c6db46ff7028e3a4398651c063ae7a42c107a6dc8cb07141861698ab92";

/**
 * ML-KEM-768 known answer test
 */
inline void mlkem768_kat() {
    mlkem::MLKEM768 kem;
    auto seed = hex_to_bytes(MLKEM768_KEYGEN_SEED);
    auto m = hex_to_bytes(MLKEM768_ENCAPS_SEED);

    auto keys = kem.keygen(seed);
    if (!matches_hex(mlkem::H({keys.encapsulation_key}), MLKEM768_EK_DIGEST))
        throw SelfTestFailure("ML-KEM-768", "KAT encapsulation key mismatch");
    if (!matches_hex(mlkem::H({keys.decapsulation_key}), MLKEM768_DK_DIGEST))
        throw SelfTestFailure("ML-KEM-768", "KAT decapsulation key mismatch");

    auto encaps = kem.encaps(keys.encapsulation_key, m);
    if (!matches_hex(mlkem::H({encaps.ciphertext}), MLKEM768_CT_DIGEST))
        throw SelfTestFailure("ML-KEM-768", "KAT ciphertext mismatch");
    if (!matches_hex(encaps.shared_secret, MLKEM768_SHARED_SECRET))
        throw SelfTestFailure("ML-KEM-768", "KAT shared secret mismatch");

    auto K = kem.decaps(keys.decapsulation_key, encaps.ciphertext);
    if (!matches_hex(K, MLKEM768_SHARED_SECRET))
        throw SelfTestFailure("ML-KEM-768", "KAT decapsulation mismatch");

    auto tampered = encaps.ciphertext;
    tampered[0] ^= 0x01;
    auto K_reject = kem.decaps(keys.decapsulation_key, tampered);
    if (!matches_hex(K_reject, MLKEM768_REJECTION_SECRET))
        throw SelfTestFailure("ML-KEM-768", "KAT implicit rejection mismatch");
}

/**
 * Pairwise consistency test for one parameter set
 */
inline void mlkem_pct(const mlkem::Params& params) {
    const std::string name(params.name);
    mlkem::MLKEM kem(params);
    auto keys = kem.keygen();

    if (keys.encapsulation_key.size() != params.ek_size())
        throw SelfTestFailure(name, "Invalid encapsulation key size");
    if (keys.decapsulation_key.size() != params.dk_size())
        throw SelfTestFailure(name, "Invalid decapsulation key size");
    if (!kem.check_encapsulation_key(keys.encapsulation_key))
        throw SelfTestFailure(name, "Encapsulation key check failed");
    if (!kem.check_decapsulation_key(keys.decapsulation_key))
        throw SelfTestFailure(name, "Decapsulation key check failed");

    auto encaps = kem.encaps(keys.encapsulation_key);
    if (encaps.ciphertext.size() != params.ct_size())
        throw SelfTestFailure(name, "Invalid ciphertext size");

    auto K = kem.decaps(keys.decapsulation_key, encaps.ciphertext);
    if (!ct::equal(encaps.shared_secret, K))
        throw SelfTestFailure(name, "PCT encaps/decaps mismatch");
}

} // namespace detail

// ============================================================================
// Self-Test Functions
// ============================================================================

/**
 * Run ML-KEM self-tests (KAT + PCT)
 *
 * Runs the ML-KEM-768 known answer test, then pairwise consistency tests
 * for ML-KEM-512, ML-KEM-768 and ML-KEM-1024. A failure is latched: later
 * calls fail immediately until reset_self_test_state().
 *
 * @throws SelfTestFailure if any test fails
 */
inline void run_mlkem_self_test() {
    std::lock_guard<std::mutex> lock(detail::mlkem_mutex);

    int state = detail::mlkem_state.load(std::memory_order_acquire);
    if (state == 1) return;
    if (state == -1) throw SelfTestFailure("ML-KEM", "Previous self-test failed");

    try {
        detail::mlkem768_kat();

        detail::mlkem_pct(mlkem::MLKEM512_PARAMS);
        detail::mlkem_pct(mlkem::MLKEM768_PARAMS);
        detail::mlkem_pct(mlkem::MLKEM1024_PARAMS);

        detail::mlkem_state.store(1, std::memory_order_release);

    } catch (const SelfTestFailure&) {
        detail::mlkem_state.store(-1, std::memory_order_release);
        throw;
    } catch (const std::exception& e) {
        detail::mlkem_state.store(-1, std::memory_order_release);
        throw SelfTestFailure("ML-KEM", e.what());
    }
}

/**
 * Current ML-KEM self-test state
 */
inline TestState get_self_test_state() {
    switch (detail::mlkem_state.load(std::memory_order_acquire)) {
        case 1:  return TestState::PASSED;
        case -1: return TestState::FAILED;
        default: return TestState::NOT_RUN;
    }
}

/**
 * Reset self-test state (for testing purposes only)
 *
 * WARNING: This should only be used in test code, never in production.
 */
inline void reset_self_test_state() {
    std::lock_guard<std::mutex> lock(detail::mlkem_mutex);
    detail::mlkem_state.store(0, std::memory_order_release);
}

/**
 * Check if ML-KEM self-test has passed
 */
inline bool mlkem_self_test_passed() {
    return detail::mlkem_state.load(std::memory_order_acquire) == 1;
}

// ============================================================================
// CAST Guards (for automatic testing on first use)
// ============================================================================

/**
 * Ensure ML-KEM self-test has passed before use
 *
 * @throws SelfTestFailure if self-test fails
 */
inline void ensure_mlkem_tested() {
    if (detail::mlkem_state.load(std::memory_order_acquire) != 1) {
        run_mlkem_self_test();
    }
}

} // namespace fips
} // namespace pqc

#endif // COMMON_FIPS_SELFTEST_HPP
