/**
 * Constant-Time Utilities for Side-Channel Resistance
 *
 * These functions execute in time independent of the values they operate
 * on. They are used wherever ML-KEM touches secret material: coefficient
 * reduction, ciphertext comparison during decapsulation, selection of the
 * shared secret and zeroization of intermediates.
 *
 * IMPORTANT: These implementations use volatile and compiler barriers to
 * keep the optimizer from reintroducing branches. Verification with tools
 * like ctgrind or dudect is still recommended for production builds.
 */

#ifndef CT_UTILS_HPP
#define CT_UTILS_HPP

#include <cstdint>
#include <cstddef>
#include <span>
#include <type_traits>

namespace ct {

/**
 * Compiler memory barrier to prevent reordering.
 */
inline void barrier() noexcept {
#if defined(__GNUC__) || defined(__clang__)
    __asm__ __volatile__("" ::: "memory");
#elif defined(_MSC_VER)
    _ReadWriteBarrier();
#endif
}

/**
 * Expand a boolean into an all-ones (true) or all-zeros (false) byte mask.
 */
[[nodiscard]] inline uint8_t mask_u8(bool condition) noexcept {
    volatile uint8_t mask = static_cast<uint8_t>(-static_cast<int8_t>(condition));
    barrier();
    return mask;
}

/**
 * Constant-time byte array comparison.
 *
 * Returns true if arrays are equal, false otherwise.
 * Always examines all bytes regardless of where differences occur.
 */
[[nodiscard]] inline bool equal(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    // Sizes are public; only the contents are compared in constant time
    size_t size_diff = a.size() ^ b.size();

    volatile uint8_t diff = 0;
    size_t len = (a.size() < b.size()) ? a.size() : b.size();

    for (size_t i = 0; i < len; ++i) {
        diff |= static_cast<uint8_t>(a[i] ^ b[i]);
    }

    barrier();

    return (size_diff == 0) && (diff == 0);
}

/**
 * Constant-time conditional copy.
 *
 * Writes a into out if condition is true, b otherwise. All three spans
 * must have the same size.
 */
inline void select_bytes(
    std::span<uint8_t> out,
    std::span<const uint8_t> a,
    std::span<const uint8_t> b,
    bool condition) noexcept {

    uint8_t mask = mask_u8(condition);

    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>((a[i] & mask) | (b[i] & ~mask));
    }

    barrier();
}

/**
 * Constant-time memory zeroing.
 *
 * Securely zeros memory, preventing compiler from optimizing it away.
 */
inline void zero(std::span<uint8_t> data) noexcept {
    volatile uint8_t* ptr = data.data();
    for (size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
    }
    barrier();
}

/**
 * Zero any trivially copyable object in place (polynomials, vectors of
 * polynomials, fixed-size seeds).
 */
template <typename T>
inline void wipe(T& object) noexcept {
    static_assert(std::is_trivially_copyable_v<T>,
                  "wipe() requires a trivially copyable object");
    volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(&object);
    for (size_t i = 0; i < sizeof(T); ++i) {
        ptr[i] = 0;
    }
    barrier();
}

/**
 * Constant-time less-than comparison for unsigned integers below 2^31.
 *
 * Returns 1 if a < b, 0 otherwise.
 */
[[nodiscard]] inline uint32_t lt_u32(uint32_t a, uint32_t b) noexcept {
    return (a - b) >> 31;
}

} // namespace ct

#endif // CT_UTILS_HPP
