/**
 * ML-KEM Core Implementation
 * Based on FIPS 203 Algorithms 16-21
 *
 * ML-KEM (Module-Lattice-Based Key-Encapsulation Mechanism) is a
 * post-quantum key encapsulation mechanism standardized in NIST FIPS 203.
 *
 * This module implements the main ML-KEM operations:
 * - Key Generation (Algorithms 16, 19)
 * - Encapsulation (Algorithms 17, 20)
 * - Decapsulation (Algorithms 18, 21)
 * - Input checking of encapsulation and decapsulation keys (Section 7)
 *
 * The object is stateless apart from its parameter set and may be shared
 * between threads.
 */

#ifndef MLKEM_MLKEM_HPP
#define MLKEM_MLKEM_HPP

#include "params.hpp"
#include "errors.hpp"
#include "kpke.hpp"
#include "utils.hpp"
#include "../ct_utils.hpp"
#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

namespace mlkem {

/**
 * Output of key generation: ek is public, dk must be kept secret.
 */
struct KeyPair {
    std::vector<uint8_t> encapsulation_key;
    std::vector<uint8_t> decapsulation_key;
};

/**
 * Output of encapsulation: the ciphertext to send and the 32-byte key.
 */
struct EncapsResult {
    std::vector<uint8_t> ciphertext;
    SharedSecret shared_secret{};
};

/**
 * ML-KEM Key Encapsulation Mechanism
 *
 * Provides key generation, encapsulation, and decapsulation operations
 * based on NIST FIPS 203.
 */
class MLKEM {
public:
    static constexpr size_t KEYGEN_SEED_BYTES = 2 * SEED_BYTES;   // d || z
    static constexpr size_t ENCAPS_SEED_BYTES = SEED_BYTES;       // m

    /** @throws InvalidParameterSet if params is outside the supported ranges */
    explicit MLKEM(const Params& params) : params_(validate_params(params)) {}
    explicit MLKEM(ParameterSet set) : params_(params_for(set)) {}

    /**
     * Algorithm 19: ML-KEM.KeyGen
     * Generate encapsulation/decapsulation key pair from system randomness
     */
    [[nodiscard]] KeyPair keygen() const {
        Seed d{};
        Seed z{};
        random_bytes(d);
        random_bytes(z);
        auto keys = keygen_internal(d, z);
        ct::wipe(d);
        ct::wipe(z);
        return keys;
    }

    /**
     * Algorithm 16: ML-KEM.KeyGen_internal
     * Deterministic key generation from a caller-supplied seed
     *
     * @param seed 64-byte seed (d || z)
     * @throws InvalidLength if seed is not 64 bytes
     */
    [[nodiscard]] KeyPair keygen(std::span<const uint8_t> seed) const {
        if (seed.size() != KEYGEN_SEED_BYTES) {
            throw InvalidLength("key generation seed", KEYGEN_SEED_BYTES, seed.size());
        }
        return keygen_internal(seed.first<SEED_BYTES>(), seed.last<SEED_BYTES>());
    }

    /**
     * Algorithm 20: ML-KEM.Encaps
     * Encapsulate to produce shared secret and ciphertext
     *
     * @param ek Encapsulation key
     * @throws InvalidLength if ek has the wrong size
     */
    [[nodiscard]] EncapsResult encaps(std::span<const uint8_t> ek) const {
        check_length(ek, params_.ek_size(), "encapsulation key");

        Seed m{};
        random_bytes(m);
        auto result = encaps_internal(ek, m);
        ct::wipe(m);
        return result;
    }

    /**
     * Algorithm 17: ML-KEM.Encaps_internal
     * Deterministic encapsulation with caller-supplied randomness
     *
     * @param ek Encapsulation key
     * @param m 32 bytes of randomness
     * @throws InvalidLength if ek or m has the wrong size
     */
    [[nodiscard]] EncapsResult encaps(
        std::span<const uint8_t> ek, std::span<const uint8_t> m) const {
        check_length(ek, params_.ek_size(), "encapsulation key");
        check_length(m, ENCAPS_SEED_BYTES, "encapsulation randomness");
        return encaps_internal(ek, m.first<SEED_BYTES>());
    }

    /**
     * Algorithm 21: ML-KEM.Decaps
     * Decapsulate to recover shared secret
     *
     * A ciphertext that fails re-encryption yields the implicit-rejection
     * key J(z || c) instead of an error.
     *
     * @param dk Decapsulation key
     * @param c Ciphertext
     * @throws InvalidLength if dk or c has the wrong size
     */
    [[nodiscard]] SharedSecret decaps(
        std::span<const uint8_t> dk,
        std::span<const uint8_t> c) const {
        check_length(dk, params_.dk_size(), "decapsulation key");
        check_length(c, params_.ct_size(), "ciphertext");
        return decaps_internal(dk, c);
    }

    /**
     * Encapsulation key check (FIPS 203 Section 7.2)
     *
     * Returns true if ek has the right length and every 12-bit coefficient
     * of t_hat is already reduced mod q.
     */
    [[nodiscard]] bool check_encapsulation_key(std::span<const uint8_t> ek) const {
        if (ek.size() != params_.ek_size()) {
            return false;
        }
        auto t_bytes = ek.first(params_.dk_pke_size());
        auto t_hat = decode_vec<Domain::Ntt>(t_bytes, params_.k, 12);
        auto reencoded = encode_vec(t_hat, 12);
        return std::equal(reencoded.begin(), reencoded.end(), t_bytes.begin());
    }

    /**
     * Decapsulation key check (FIPS 203 Section 7.3)
     *
     * Returns true if dk has the right length and its embedded hash
     * matches H(ek) of its embedded encapsulation key.
     */
    [[nodiscard]] bool check_decapsulation_key(std::span<const uint8_t> dk) const {
        if (dk.size() != params_.dk_size()) {
            return false;
        }
        const auto layout = DecapsKeyView::split(dk, params_);
        const Seed h = H({layout.ek});
        return ct::equal(h, layout.h);
    }

    /**
     * Get the parameter set
     */
    [[nodiscard]] const Params& params() const noexcept { return params_; }

private:
    Params params_;

    /**
     * dk = dk_PKE || ek || H(ek) || z
     */
    struct DecapsKeyView {
        std::span<const uint8_t> dk_pke;
        std::span<const uint8_t> ek;
        std::span<const uint8_t, SEED_BYTES> h;
        std::span<const uint8_t, SEED_BYTES> z;

        static DecapsKeyView split(std::span<const uint8_t> dk, const Params& params) {
            const size_t dk_pke_len = params.dk_pke_size();
            const size_t ek_len = params.ek_size();
            return DecapsKeyView{
                .dk_pke = dk.first(dk_pke_len),
                .ek = dk.subspan(dk_pke_len, ek_len),
                .h = dk.subspan(dk_pke_len + ek_len).first<SEED_BYTES>(),
                .z = dk.last<SEED_BYTES>(),
            };
        }
    };

    static void check_length(std::span<const uint8_t> buf, size_t expected, const char* name) {
        if (buf.size() != expected) {
            throw InvalidLength(name, expected, buf.size());
        }
    }

    [[nodiscard]] KeyPair keygen_internal(SeedView d, SeedView z) const {
        // Step 1: Generate K-PKE key pair
        auto [pk, sk] = kpke_keygen(d, params_);

        // Step 2: ek = ek_PKE
        KeyPair keys;
        keys.encapsulation_key = pk.to_bytes();

        // Step 3: dk = dk_PKE || ek || H(ek) || z
        auto dk_pke = sk.to_bytes();
        const Seed h = H({keys.encapsulation_key});

        auto& dk = keys.decapsulation_key;
        dk.reserve(params_.dk_size());
        dk.insert(dk.end(), dk_pke.begin(), dk_pke.end());
        dk.insert(dk.end(), keys.encapsulation_key.begin(), keys.encapsulation_key.end());
        dk.insert(dk.end(), h.begin(), h.end());
        dk.insert(dk.end(), z.begin(), z.end());

        ct::zero(dk_pke);
        ct::wipe(sk);
        return keys;
    }

    [[nodiscard]] EncapsResult encaps_internal(std::span<const uint8_t> ek, SeedView m) const {
        // Step 1: (K, r) = G(m || H(ek))
        const Seed h = H({ek});
        auto [K, r] = G({m, h});

        // Step 2: c = K-PKE.Encrypt(ek, m, r)
        EncapsResult result;
        result.ciphertext = kpke_encrypt(ek, m, r, params_);
        result.shared_secret = K;

        ct::wipe(K);
        ct::wipe(r);
        return result;
    }

    [[nodiscard]] SharedSecret decaps_internal(
        std::span<const uint8_t> dk,
        std::span<const uint8_t> c) const {

        // Step 1: Parse decapsulation key
        const auto layout = DecapsKeyView::split(dk, params_);

        // Step 2: m' = K-PKE.Decrypt(dk_PKE, c)
        auto m_prime = kpke_decrypt(layout.dk_pke, c, params_);

        // Step 3: (K', r') = G(m' || h)
        auto [K_prime, r_prime] = G({m_prime, layout.h});

        // Step 4: K_bar = J(z || c), the implicit-rejection key
        auto K_bar = J({layout.z, c});

        // Step 5: c' = K-PKE.Encrypt(ek, m', r')
        auto c_prime = kpke_encrypt(layout.ek, m_prime, r_prime, params_);

        // Step 6: Constant-time comparison and selection
        const bool valid = ct::equal(c, c_prime);
        SharedSecret K{};
        ct::select_bytes(K, K_prime, K_bar, valid);

        ct::wipe(m_prime);
        ct::wipe(K_prime);
        ct::wipe(r_prime);
        ct::wipe(K_bar);
        return K;
    }
};

/**
 * ML-KEM-512: Security Category 1 (128-bit)
 */
class MLKEM512 : public MLKEM {
public:
    MLKEM512() : MLKEM(MLKEM512_PARAMS) {}
};

/**
 * ML-KEM-768: Security Category 3 (192-bit)
 */
class MLKEM768 : public MLKEM {
public:
    MLKEM768() : MLKEM(MLKEM768_PARAMS) {}
};

/**
 * ML-KEM-1024: Security Category 5 (256-bit)
 */
class MLKEM1024 : public MLKEM {
public:
    MLKEM1024() : MLKEM(MLKEM1024_PARAMS) {}
};

} // namespace mlkem

#endif // MLKEM_MLKEM_HPP
