/**
 * ML-KEM Parameter Sets as defined in FIPS 203
 *
 * This header defines the core constants and the three standardized
 * parameter sets. A single Params value is threaded through every layer;
 * there is no per-level code path.
 */

#ifndef MLKEM_PARAMS_HPP
#define MLKEM_PARAMS_HPP

#include "errors.hpp"
#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>

namespace mlkem {

// Global constants from FIPS 203
inline constexpr uint16_t Q = 3329;          // Modulus q
inline constexpr size_t N = 256;             // Polynomial degree
inline constexpr uint16_t ZETA = 17;         // Primitive 256th root of unity mod q

inline constexpr size_t MAX_K = 4;           // Largest module rank (ML-KEM-1024)
inline constexpr size_t SEED_BYTES = 32;     // d, z, rho, sigma, m, r, H(ek)
inline constexpr size_t SHARED_SECRET_BYTES = 32;
inline constexpr size_t POLY_BYTES = 384;    // ByteEncode_12 of one polynomial

using Seed = std::array<uint8_t, SEED_BYTES>;
using SharedSecret = std::array<uint8_t, SHARED_SECRET_BYTES>;

/**
 * Parameter set for ML-KEM
 * Based on FIPS 203 Table 2
 */
struct Params {
    std::string_view name;
    int k;              // Module rank (matrix dimension)
    int eta1;           // CBD parameter for secret/error in keygen
    int eta2;           // CBD parameter for error in encaps
    int du;             // Compression bits for u
    int dv;             // Compression bits for v

    /**
     * Encapsulation key size (bytes)
     * ek = 384*k + 32
     */
    [[nodiscard]] constexpr size_t ek_size() const noexcept {
        return POLY_BYTES * k + SEED_BYTES;
    }

    /**
     * Decapsulation key size (bytes)
     * dk = 768*k + 96
     */
    [[nodiscard]] constexpr size_t dk_size() const noexcept {
        return 2 * POLY_BYTES * k + 3 * SEED_BYTES;
    }

    /**
     * K-PKE decryption key size (bytes): ByteEncode_12(s_hat)
     */
    [[nodiscard]] constexpr size_t dk_pke_size() const noexcept {
        return POLY_BYTES * k;
    }

    /**
     * Ciphertext size (bytes)
     * ct = 32*(du*k + dv)
     */
    [[nodiscard]] constexpr size_t ct_size() const noexcept {
        return c1_size() + c2_size();
    }

    [[nodiscard]] constexpr size_t c1_size() const noexcept {
        return 32 * du * k;
    }

    [[nodiscard]] constexpr size_t c2_size() const noexcept {
        return 32 * dv;
    }

    /**
     * Shared secret size (bytes)
     * Always 32 bytes
     */
    [[nodiscard]] constexpr size_t ss_size() const noexcept {
        return SHARED_SECRET_BYTES;
    }
};

// ML-KEM-512: Security Category 1 (128-bit)
inline constexpr Params MLKEM512_PARAMS = {
    .name = "ML-KEM-512",
    .k = 2,
    .eta1 = 3,
    .eta2 = 2,
    .du = 10,
    .dv = 4,
};

// ML-KEM-768: Security Category 3 (192-bit)
inline constexpr Params MLKEM768_PARAMS = {
    .name = "ML-KEM-768",
    .k = 3,
    .eta1 = 2,
    .eta2 = 2,
    .du = 10,
    .dv = 4,
};

// ML-KEM-1024: Security Category 5 (256-bit)
inline constexpr Params MLKEM1024_PARAMS = {
    .name = "ML-KEM-1024",
    .k = 4,
    .eta1 = 2,
    .eta2 = 2,
    .du = 11,
    .dv = 5,
};

static_assert(MLKEM512_PARAMS.ek_size() == 800 && MLKEM512_PARAMS.dk_size() == 1632 &&
              MLKEM512_PARAMS.ct_size() == 768);
static_assert(MLKEM768_PARAMS.ek_size() == 1184 && MLKEM768_PARAMS.dk_size() == 2400 &&
              MLKEM768_PARAMS.ct_size() == 1088);
static_assert(MLKEM1024_PARAMS.ek_size() == 1568 && MLKEM1024_PARAMS.dk_size() == 3168 &&
              MLKEM1024_PARAMS.ct_size() == 1568);

/**
 * Security-level selector
 */
enum class ParameterSet {
    MLKEM512,
    MLKEM768,
    MLKEM1024,
};

/**
 * Look up the constants of a parameter set.
 *
 * @throws InvalidParameterSet for a value outside the enumeration
 */
[[nodiscard]] inline const Params& params_for(ParameterSet set) {
    switch (set) {
        case ParameterSet::MLKEM512:  return MLKEM512_PARAMS;
        case ParameterSet::MLKEM768:  return MLKEM768_PARAMS;
        case ParameterSet::MLKEM1024: return MLKEM1024_PARAMS;
    }
    throw InvalidParameterSet(std::to_string(static_cast<int>(set)));
}

/**
 * Look up a parameter set by its FIPS 203 name ("ML-KEM-768", ...).
 *
 * @throws InvalidParameterSet if the name is not recognized
 */
[[nodiscard]] inline const Params& params_by_name(std::string_view name) {
    for (const Params* p : {&MLKEM512_PARAMS, &MLKEM768_PARAMS, &MLKEM1024_PARAMS}) {
        if (p->name == name) {
            return *p;
        }
    }
    throw InvalidParameterSet(std::string(name));
}

/**
 * Reject a parameter set the fixed-capacity vectors, the CBD sampler or
 * Compress_d cannot handle: k in [2, MAX_K], eta in {2, 3}, du and dv in
 * [1, 11].
 *
 * @throws InvalidParameterSet naming the rejected set
 */
[[nodiscard]] inline const Params& validate_params(const Params& params) {
    const bool ok = params.k >= 2 && params.k <= static_cast<int>(MAX_K) &&
                    (params.eta1 == 2 || params.eta1 == 3) &&
                    (params.eta2 == 2 || params.eta2 == 3) &&
                    params.du >= 1 && params.du <= 11 &&
                    params.dv >= 1 && params.dv <= 11;
    if (!ok) {
        throw InvalidParameterSet(std::string(params.name));
    }
    return params;
}

} // namespace mlkem

#endif // MLKEM_PARAMS_HPP
