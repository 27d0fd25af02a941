/**
 * Number Theoretic Transform (NTT) for ML-KEM
 * Based on FIPS 203 Algorithms 9-12
 *
 * The NTT enables efficient polynomial multiplication in R_q = Z_q[X]/(X^256 + 1)
 * where q = 3329. Since q has no primitive 512th root of unity, the transform
 * stops at 128 degree-1 factors X^2 - gamma_i and products are formed per
 * factor (base case multiplication).
 */

#ifndef MLKEM_NTT_HPP
#define MLKEM_NTT_HPP

#include "params.hpp"
#include "field.hpp"
#include "poly.hpp"
#include <array>
#include <cstdint>

namespace mlkem {

/**
 * Compute 7-bit reversal for NTT
 * BitRev7(i) reverses the 7 least significant bits of i
 */
[[nodiscard]] constexpr uint8_t bitrev7(uint8_t x) noexcept {
    uint8_t result = 0;
    for (int i = 0; i < 7; ++i) {
        result = static_cast<uint8_t>((result << 1) | (x & 1));
        x >>= 1;
    }
    return result;
}

/**
 * Precomputed NTT zetas: zeta^BitRev7(k) mod q for k = 0..127
 */
[[nodiscard]] constexpr std::array<uint16_t, 128> compute_ntt_zetas() noexcept {
    std::array<uint16_t, 128> zetas{};
    for (size_t k = 0; k < 128; ++k) {
        zetas[k] = pow_mod(ZETA, bitrev7(static_cast<uint8_t>(k)));
    }
    return zetas;
}

/**
 * Base case moduli: gamma_i = zeta^(2*BitRev7(i) + 1) mod q for i = 0..127
 */
[[nodiscard]] constexpr std::array<uint16_t, 128> compute_base_gammas() noexcept {
    std::array<uint16_t, 128> gammas{};
    for (size_t i = 0; i < 128; ++i) {
        gammas[i] = pow_mod(ZETA, 2u * bitrev7(static_cast<uint8_t>(i)) + 1u);
    }
    return gammas;
}

inline constexpr auto NTT_ZETAS = compute_ntt_zetas();
inline constexpr auto NTT_GAMMAS = compute_base_gammas();

// 128^(-1) mod q
inline constexpr uint16_t NTT_SCALE = 3303;

static_assert(NTT_ZETAS[0] == 1 && NTT_ZETAS[1] == 1729);
static_assert(NTT_GAMMAS[0] == 17 && NTT_GAMMAS[1] == Q - 17);
static_assert((static_cast<uint32_t>(NTT_SCALE) * 128) % Q == 1);

/**
 * Algorithm 9: NTT
 *
 * Converts a polynomial from coefficient representation to NTT representation.
 */
[[nodiscard]] inline NttPoly ntt(const Poly& f) noexcept {
    NttPoly f_hat;
    f_hat.coeffs = f.coeffs;

    size_t k = 1;
    for (size_t len = 128; len >= 2; len >>= 1) {
        for (size_t start = 0; start < N; start += 2 * len) {
            const uint16_t zeta = NTT_ZETAS[k++];
            for (size_t j = start; j < start + len; ++j) {
                const uint16_t t = mul_mod(zeta, f_hat[j + len]);
                f_hat[j + len] = sub_mod(f_hat[j], t);
                f_hat[j] = add_mod(f_hat[j], t);
            }
        }
    }
    return f_hat;
}

/**
 * Algorithm 10: NTT^(-1)
 *
 * Converts a polynomial from NTT representation back to coefficient
 * representation, including the final multiplication by 128^(-1).
 */
[[nodiscard]] inline Poly ntt_inv(const NttPoly& f_hat) noexcept {
    Poly f;
    f.coeffs = f_hat.coeffs;

    size_t k = 127;
    for (size_t len = 2; len <= 128; len <<= 1) {
        for (size_t start = 0; start < N; start += 2 * len) {
            const uint16_t zeta = NTT_ZETAS[k--];
            for (size_t j = start; j < start + len; ++j) {
                const uint16_t t = f[j];
                f[j] = add_mod(t, f[j + len]);
                f[j + len] = mul_mod(zeta, sub_mod(f[j + len], t));
            }
        }
    }

    for (size_t i = 0; i < N; ++i) {
        f[i] = mul_mod(NTT_SCALE, f[i]);
    }
    return f;
}

/**
 * Algorithms 11-12: MultiplyNTTs / BaseCaseMultiply
 *
 * (a0 + a1*X) * (b0 + b1*X) mod (X^2 - gamma_i) for each of the 128 pairs:
 *   c0 = a0*b0 + a1*b1*gamma_i
 *   c1 = a0*b1 + a1*b0
 */
[[nodiscard]] inline NttPoly multiply_ntts(const NttPoly& f_hat, const NttPoly& g_hat) noexcept {
    NttPoly h_hat;

    for (size_t i = 0; i < N / 2; ++i) {
        const uint32_t a0 = f_hat[2 * i];
        const uint32_t a1 = f_hat[2 * i + 1];
        const uint32_t b0 = g_hat[2 * i];
        const uint32_t b1 = g_hat[2 * i + 1];

        const uint32_t a1b1 = barrett_reduce(a1 * b1);
        h_hat[2 * i] = barrett_reduce(a0 * b0 + a1b1 * NTT_GAMMAS[i]);
        h_hat[2 * i + 1] = barrett_reduce(a0 * b1 + a1 * b0);
    }

    return h_hat;
}

/**
 * Apply NTT to each polynomial in vector
 */
[[nodiscard]] inline NttPolyVec vec_ntt(const PolyVec& v) noexcept {
    NttPolyVec result(static_cast<int>(v.size()));
    for (size_t i = 0; i < v.size(); ++i) {
        result[i] = ntt(v[i]);
    }
    return result;
}

/**
 * Apply inverse NTT to each polynomial in vector
 */
[[nodiscard]] inline PolyVec vec_ntt_inv(const NttPolyVec& v_hat) noexcept {
    PolyVec result(static_cast<int>(v_hat.size()));
    for (size_t i = 0; i < v_hat.size(); ++i) {
        result[i] = ntt_inv(v_hat[i]);
    }
    return result;
}

/**
 * Compute inner product of two vectors in NTT domain
 */
[[nodiscard]] inline NttPoly inner_product_ntt(const NttPolyVec& a_hat, const NttPolyVec& b_hat) noexcept {
    NttPoly acc;
    for (size_t i = 0; i < a_hat.size(); ++i) {
        acc = poly_add(acc, multiply_ntts(a_hat[i], b_hat[i]));
    }
    return acc;
}

/**
 * Multiply matrix by vector in NTT domain
 *
 * Computes A_hat * v_hat, or A_hat^T * v_hat when transpose is set.
 */
[[nodiscard]] inline NttPolyVec mat_vec_mul_ntt(
    const NttMatrix& A_hat, const NttPolyVec& v_hat, bool transpose = false) noexcept {

    const size_t k = A_hat.size();
    NttPolyVec result(static_cast<int>(k));

    for (size_t i = 0; i < k; ++i) {
        NttPoly acc;
        for (size_t j = 0; j < k; ++j) {
            const NttPoly& a = transpose ? A_hat.at(j, i) : A_hat.at(i, j);
            acc = poly_add(acc, multiply_ntts(a, v_hat[j]));
        }
        result[i] = acc;
    }
    return result;
}

} // namespace mlkem

#endif // MLKEM_NTT_HPP
