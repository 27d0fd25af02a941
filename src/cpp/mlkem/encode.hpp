/**
 * Byte Encoding and Decoding for ML-KEM
 * Based on FIPS 203 Algorithms 5-6
 *
 * Coefficients are packed as d-bit little-endian fields, least significant
 * bit first, 32*d bytes per polynomial. ByteDecode_12 reduces mod q so
 * that a decoded key is always a valid ring element.
 */

#ifndef MLKEM_ENCODE_HPP
#define MLKEM_ENCODE_HPP

#include "params.hpp"
#include "field.hpp"
#include "poly.hpp"
#include "errors.hpp"
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace mlkem {

/**
 * Encoded size of one polynomial at d bits per coefficient
 */
[[nodiscard]] constexpr size_t encoded_size(int d) noexcept {
    return 32 * static_cast<size_t>(d);
}

inline void check_bit_width(int d) {
    if (d < 1 || d > 12) {
        throw std::invalid_argument("Unsupported bit width d=" + std::to_string(d));
    }
}

/**
 * Algorithm 5: ByteEncode_d
 * Encode polynomial coefficients into out (exactly 32*d bytes)
 */
template <Domain D>
inline void byte_encode(const Polynomial<D>& f, int d, std::span<uint8_t> out) {
    check_bit_width(d);
    if (out.size() != encoded_size(d)) {
        throw InvalidLength("encoding buffer", encoded_size(d), out.size());
    }

    const uint32_t mask = (1u << d) - 1;
    uint32_t acc = 0;
    int acc_bits = 0;
    size_t pos = 0;

    for (size_t i = 0; i < N; ++i) {
        acc |= (static_cast<uint32_t>(f[i]) & mask) << acc_bits;
        acc_bits += d;
        while (acc_bits >= 8) {
            out[pos++] = static_cast<uint8_t>(acc);
            acc >>= 8;
            acc_bits -= 8;
        }
    }
}

template <Domain D>
[[nodiscard]] inline std::vector<uint8_t> byte_encode(const Polynomial<D>& f, int d) {
    check_bit_width(d);
    std::vector<uint8_t> result(encoded_size(d));
    byte_encode(f, d, result);
    return result;
}

/**
 * Algorithm 6: ByteDecode_d
 * Decode 32*d bytes into polynomial coefficients
 */
template <Domain D>
[[nodiscard]] inline Polynomial<D> byte_decode(std::span<const uint8_t> b, int d) {
    check_bit_width(d);
    if (b.size() != encoded_size(d)) {
        throw InvalidLength("encoded polynomial", encoded_size(d), b.size());
    }

    Polynomial<D> f;
    const uint32_t mask = (1u << d) - 1;
    uint32_t acc = 0;
    int acc_bits = 0;
    size_t pos = 0;

    for (size_t i = 0; i < N; ++i) {
        while (acc_bits < d) {
            acc |= static_cast<uint32_t>(b[pos++]) << acc_bits;
            acc_bits += 8;
        }
        const uint16_t value = static_cast<uint16_t>(acc & mask);
        // 12-bit fields may hold values in [q, 4096); m = q for d = 12
        f[i] = (d == 12) ? reduce_once(value) : value;
        acc >>= d;
        acc_bits -= d;
    }

    return f;
}

/**
 * Encode vector of polynomials
 */
template <Domain D>
[[nodiscard]] inline std::vector<uint8_t> encode_vec(const PolyVector<D>& v, int d) {
    check_bit_width(d);
    std::vector<uint8_t> result(v.size() * encoded_size(d));
    auto out = std::span<uint8_t>(result);
    for (size_t i = 0; i < v.size(); ++i) {
        byte_encode(v[i], d, out.subspan(i * encoded_size(d), encoded_size(d)));
    }
    return result;
}

/**
 * Decode bytes to vector of polynomials
 */
template <Domain D>
[[nodiscard]] inline PolyVector<D> decode_vec(std::span<const uint8_t> b, int k, int d) {
    check_bit_width(d);
    const size_t poly_bytes = encoded_size(d);
    if (b.size() != static_cast<size_t>(k) * poly_bytes) {
        throw InvalidLength("encoded vector", static_cast<size_t>(k) * poly_bytes, b.size());
    }

    PolyVector<D> result(k);
    for (size_t i = 0; i < static_cast<size_t>(k); ++i) {
        result[i] = byte_decode<D>(b.subspan(i * poly_bytes, poly_bytes), d);
    }
    return result;
}

} // namespace mlkem

#endif // MLKEM_ENCODE_HPP
