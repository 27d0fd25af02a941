/**
 * Runtime Algorithm Selection Factory
 *
 * Provides a unified runtime interface for selecting an ML-KEM parameter
 * set by name. Enables configuration-driven algorithm selection without
 * compile-time types.
 *
 * Usage:
 *   auto kem = pqc::create_kem("ML-KEM-768");
 *   auto [ek, dk] = kem->keygen();
 *   auto [ct, K] = kem->encaps(ek);
 *   auto K2 = kem->decaps(dk, ct);
 */

#ifndef COMMON_ALGORITHM_FACTORY_HPP
#define COMMON_ALGORITHM_FACTORY_HPP

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mlkem/mlkem.hpp"
#include "common/fips_selftest.hpp"

namespace pqc {

// ============================================================================
// Abstract Interface
// ============================================================================

/**
 * Abstract interface for key encapsulation mechanisms
 *
 * Provides a uniform API across ML-KEM parameter sets.
 */
class KeyEncapsulation {
public:
    virtual ~KeyEncapsulation() = default;

    /** Algorithm name (e.g., "ML-KEM-768") */
    [[nodiscard]] virtual std::string name() const = 0;

    /** FIPS standard identifier (e.g., "FIPS 203") */
    [[nodiscard]] virtual std::string standard() const = 0;

    /** Parameter set backing this instance */
    [[nodiscard]] virtual const mlkem::Params& params() const = 0;

    /** Generate a key pair from system randomness */
    [[nodiscard]] virtual mlkem::KeyPair keygen() const = 0;

    /** Deterministic key generation from a 64-byte seed d || z */
    [[nodiscard]] virtual mlkem::KeyPair keygen(std::span<const uint8_t> seed) const = 0;

    /** Encapsulate: generate ciphertext and shared secret */
    [[nodiscard]] virtual mlkem::EncapsResult encaps(std::span<const uint8_t> ek) const = 0;

    /** Deterministic encapsulation with 32 bytes of caller randomness */
    [[nodiscard]] virtual mlkem::EncapsResult encaps(
        std::span<const uint8_t> ek,
        std::span<const uint8_t> m) const = 0;

    /** Decapsulate: recover shared secret from ciphertext */
    [[nodiscard]] virtual mlkem::SharedSecret decaps(
        std::span<const uint8_t> dk,
        std::span<const uint8_t> ciphertext) const = 0;

    /** FIPS 203 input checks; false means the key must not be used */
    [[nodiscard]] virtual bool check_encapsulation_key(std::span<const uint8_t> ek) const = 0;
    [[nodiscard]] virtual bool check_decapsulation_key(std::span<const uint8_t> dk) const = 0;

    /** Encapsulation key size in bytes */
    [[nodiscard]] virtual size_t encapsulation_key_size() const = 0;

    /** Decapsulation key size in bytes */
    [[nodiscard]] virtual size_t decapsulation_key_size() const = 0;

    /** Ciphertext size in bytes */
    [[nodiscard]] virtual size_t ciphertext_size() const = 0;

    /** Shared secret size in bytes (always 32 for ML-KEM) */
    [[nodiscard]] virtual size_t shared_secret_size() const = 0;
};

// ============================================================================
// ML-KEM Concrete Implementation
// ============================================================================

namespace detail {

class MLKEMAdapter final : public KeyEncapsulation {
public:
    explicit MLKEMAdapter(const mlkem::Params& params) : impl_(params) {}

    [[nodiscard]] std::string name() const override {
        return std::string(impl_.params().name);
    }

    [[nodiscard]] std::string standard() const override {
        return "FIPS 203";
    }

    [[nodiscard]] const mlkem::Params& params() const override {
        return impl_.params();
    }

    [[nodiscard]] mlkem::KeyPair keygen() const override {
        return impl_.keygen();
    }

    [[nodiscard]] mlkem::KeyPair keygen(std::span<const uint8_t> seed) const override {
        return impl_.keygen(seed);
    }

    [[nodiscard]] mlkem::EncapsResult encaps(std::span<const uint8_t> ek) const override {
        return impl_.encaps(ek);
    }

    [[nodiscard]] mlkem::EncapsResult encaps(
        std::span<const uint8_t> ek,
        std::span<const uint8_t> m) const override {
        return impl_.encaps(ek, m);
    }

    [[nodiscard]] mlkem::SharedSecret decaps(
        std::span<const uint8_t> dk,
        std::span<const uint8_t> ciphertext) const override {
        return impl_.decaps(dk, ciphertext);
    }

    [[nodiscard]] bool check_encapsulation_key(std::span<const uint8_t> ek) const override {
        return impl_.check_encapsulation_key(ek);
    }

    [[nodiscard]] bool check_decapsulation_key(std::span<const uint8_t> dk) const override {
        return impl_.check_decapsulation_key(dk);
    }

    [[nodiscard]] size_t encapsulation_key_size() const override {
        return impl_.params().ek_size();
    }

    [[nodiscard]] size_t decapsulation_key_size() const override {
        return impl_.params().dk_size();
    }

    [[nodiscard]] size_t ciphertext_size() const override {
        return impl_.params().ct_size();
    }

    [[nodiscard]] size_t shared_secret_size() const override {
        return impl_.params().ss_size();
    }

private:
    mlkem::MLKEM impl_;
};

} // namespace detail

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Create a key encapsulation mechanism by name
 *
 * Supported names (case-sensitive):
 *   "ML-KEM-512", "ML-KEM-768", "ML-KEM-1024"
 *
 * Runs the ML-KEM self-test on first use.
 *
 * @param name Algorithm name
 * @return unique_ptr to KeyEncapsulation implementation
 * @throws mlkem::InvalidParameterSet if name is not recognized
 * @throws fips::SelfTestFailure if the self-test fails
 */
inline std::unique_ptr<KeyEncapsulation> create_kem(std::string_view name) {
    const auto& params = mlkem::params_by_name(name);
    fips::ensure_mlkem_tested();
    return std::make_unique<detail::MLKEMAdapter>(params);
}

/**
 * Create a key encapsulation mechanism from a parameter-set selector
 *
 * @throws mlkem::InvalidParameterSet for a selector outside the enumeration
 * @throws fips::SelfTestFailure if the self-test fails
 */
inline std::unique_ptr<KeyEncapsulation> create_kem(mlkem::ParameterSet set) {
    const auto& params = mlkem::params_for(set);
    fips::ensure_mlkem_tested();
    return std::make_unique<detail::MLKEMAdapter>(params);
}

/**
 * List all available KEM algorithm names
 */
inline std::vector<std::string> available_kem_algorithms() {
    return {
        std::string(mlkem::MLKEM512_PARAMS.name),
        std::string(mlkem::MLKEM768_PARAMS.name),
        std::string(mlkem::MLKEM1024_PARAMS.name)
    };
}

/**
 * Check if a KEM algorithm name is supported
 */
inline bool is_kem_algorithm(std::string_view name) {
    for (const auto& a : available_kem_algorithms()) {
        if (a == name) return true;
    }
    return false;
}

} // namespace pqc

#endif // COMMON_ALGORITHM_FACTORY_HPP
