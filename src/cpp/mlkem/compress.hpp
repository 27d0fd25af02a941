/**
 * Compression Functions for ML-KEM
 * Based on FIPS 203 Section 4.2.1, Equations 4.7-4.8
 *
 * Compress_d is lossy. For every x in [0, q):
 *   |Decompress_d(Compress_d(x)) - x| mod+- q <= round(q / 2^(d+1))
 */

#ifndef MLKEM_COMPRESS_HPP
#define MLKEM_COMPRESS_HPP

#include "params.hpp"
#include "field.hpp"
#include "poly.hpp"
#include "../ct_utils.hpp"
#include <cstdint>

namespace mlkem {

/**
 * Compress_d(x) = round((2^d / q) * x) mod 2^d
 *
 * The division by q is a Barrett estimate followed by two constant-time
 * rounding corrections; no hardware divide is used on coefficient data.
 */
[[nodiscard]] inline uint16_t compress(uint16_t x, int d) noexcept {
    const uint32_t shifted = static_cast<uint32_t>(x) << d;
    const uint64_t product = static_cast<uint64_t>(shifted) * BARRETT_MULTIPLIER;
    uint32_t quotient = static_cast<uint32_t>(product >> BARRETT_SHIFT);
    const uint32_t remainder = shifted - quotient * Q;

    // remainder is in [0, 2q): round up past q/2, and again past 3q/2
    quotient += ct::lt_u32(HALF_Q, remainder);
    quotient += ct::lt_u32(Q + HALF_Q, remainder);

    return static_cast<uint16_t>(quotient & ((1u << d) - 1));
}

/**
 * Decompress_d(y) = round((q / 2^d) * y)
 */
[[nodiscard]] inline uint16_t decompress(uint16_t y, int d) noexcept {
    const uint32_t product = static_cast<uint32_t>(y) * Q;
    return static_cast<uint16_t>((product + (1u << (d - 1))) >> d);
}

/**
 * Compress all coefficients of a polynomial
 */
[[nodiscard]] inline CompressedPoly poly_compress(const Poly& a, int d) noexcept {
    CompressedPoly c;
    for (size_t i = 0; i < N; ++i) {
        c[i] = compress(a[i], d);
    }
    return c;
}

/**
 * Decompress all coefficients of a polynomial
 */
[[nodiscard]] inline Poly poly_decompress(const CompressedPoly& a, int d) noexcept {
    Poly c;
    for (size_t i = 0; i < N; ++i) {
        c[i] = decompress(a[i], d);
    }
    return c;
}

/**
 * Compress vector of polynomials
 */
[[nodiscard]] inline CompressedPolyVec vec_compress(const PolyVec& v, int d) noexcept {
    CompressedPolyVec result(static_cast<int>(v.size()));
    for (size_t i = 0; i < v.size(); ++i) {
        result[i] = poly_compress(v[i], d);
    }
    return result;
}

/**
 * Decompress vector of polynomials
 */
[[nodiscard]] inline PolyVec vec_decompress(const CompressedPolyVec& v, int d) noexcept {
    PolyVec result(static_cast<int>(v.size()));
    for (size_t i = 0; i < v.size(); ++i) {
        result[i] = poly_decompress(v[i], d);
    }
    return result;
}

} // namespace mlkem

#endif // MLKEM_COMPRESS_HPP
