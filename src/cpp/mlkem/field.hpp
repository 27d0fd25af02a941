/**
 * Arithmetic in Z_q, q = 3329
 *
 * Coefficients are held as uint16_t in [0, q). Products are formed in 32
 * bits and reduced with a Barrett reduction; the final correction is a
 * masked subtraction, so no function here branches on its operands.
 */

#ifndef MLKEM_FIELD_HPP
#define MLKEM_FIELD_HPP

#include "params.hpp"
#include <cstdint>

namespace mlkem {

// Barrett constants: floor(2^24 / q)
inline constexpr uint64_t BARRETT_MULTIPLIER = 5039;
inline constexpr unsigned BARRETT_SHIFT = 24;
inline constexpr uint16_t HALF_Q = (Q - 1) / 2;

/**
 * Conditional subtraction of q
 * Maps x in [0, 2q) to [0, q)
 */
[[nodiscard]] inline constexpr uint16_t reduce_once(uint16_t x) noexcept {
    const uint16_t subtracted = static_cast<uint16_t>(x - Q);
    const uint16_t mask = static_cast<uint16_t>(0u - (subtracted >> 15));
    return static_cast<uint16_t>((mask & x) | (~mask & subtracted));
}

/**
 * Barrett reduction
 * Returns x mod q for x < q + 2*q^2
 */
[[nodiscard]] inline constexpr uint16_t barrett_reduce(uint32_t x) noexcept {
    const uint64_t product = static_cast<uint64_t>(x) * BARRETT_MULTIPLIER;
    const uint32_t quotient = static_cast<uint32_t>(product >> BARRETT_SHIFT);
    const uint32_t remainder = x - quotient * Q;
    return reduce_once(static_cast<uint16_t>(remainder));
}

[[nodiscard]] inline constexpr uint16_t add_mod(uint16_t a, uint16_t b) noexcept {
    return reduce_once(static_cast<uint16_t>(a + b));
}

[[nodiscard]] inline constexpr uint16_t sub_mod(uint16_t a, uint16_t b) noexcept {
    return reduce_once(static_cast<uint16_t>(a + Q - b));
}

[[nodiscard]] inline constexpr uint16_t mul_mod(uint16_t a, uint16_t b) noexcept {
    return barrett_reduce(static_cast<uint32_t>(a) * b);
}

/**
 * Modular exponentiation, used to build the NTT tables at compile time
 */
[[nodiscard]] constexpr uint16_t pow_mod(uint16_t base, unsigned exp) noexcept {
    uint32_t result = 1;
    uint32_t b = base % Q;
    while (exp > 0) {
        if (exp & 1) {
            result = (result * b) % Q;
        }
        exp >>= 1;
        b = (b * b) % Q;
    }
    return static_cast<uint16_t>(result);
}

} // namespace mlkem

#endif // MLKEM_FIELD_HPP
