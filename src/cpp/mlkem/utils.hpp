/**
 * Hash, XOF and randomness collaborators for ML-KEM
 * Based on FIPS 203 Section 4.1
 *
 *   H   = SHA3-256
 *   G   = SHA3-512, split into two 32-byte halves
 *   J   = SHAKE256(., 32)
 *   PRF = SHAKE256(s || b, 64*eta)
 *   XOF = SHAKE128(rho || j || i), read incrementally
 *
 * All functions take their input as a list of byte strings that are
 * absorbed in order, so callers never build concatenated copies of secret
 * material.
 */

#ifndef MLKEM_UTILS_HPP
#define MLKEM_UTILS_HPP

#include "params.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace mlkem {

using ByteParts = std::initializer_list<std::span<const uint8_t>>;

/**
 * SHA3-256 hash function (H in FIPS 203)
 */
[[nodiscard]] std::array<uint8_t, 32> sha3_256(ByteParts parts);

/**
 * SHA3-512 hash function (G in FIPS 203)
 */
[[nodiscard]] std::array<uint8_t, 64> sha3_512(ByteParts parts);

/**
 * SHAKE256 with caller-sized output (J and PRF in FIPS 203)
 */
void shake256(ByteParts parts, std::span<uint8_t> out);

/**
 * SHAKE128 XOF stream (XOF in FIPS 203)
 *
 * OpenSSL 3.0 can only finalize an XOF once, so the stream squeezes a
 * batch of blocks up front and re-derives a longer output from the
 * absorbed seed if the reader runs past it.
 */
class SHAKE128Stream {
public:
    static constexpr size_t BLOCK_BYTES = 168;   // SHAKE128 rate

    explicit SHAKE128Stream(ByteParts parts);

    SHAKE128Stream(const SHAKE128Stream&) = delete;
    SHAKE128Stream& operator=(const SHAKE128Stream&) = delete;
    SHAKE128Stream(SHAKE128Stream&&) noexcept = default;
    SHAKE128Stream& operator=(SHAKE128Stream&&) noexcept = default;

    /**
     * Copy the next out.size() bytes of the stream into out.
     */
    void read(std::span<uint8_t> out);

private:
    void squeeze(size_t total_len);

    std::vector<uint8_t> seed_;
    std::vector<uint8_t> buffer_;
    size_t buffer_pos_ = 0;
};

/**
 * Fill out with cryptographically secure random bytes (OpenSSL RAND_bytes)
 *
 * @throws std::runtime_error if the entropy source fails
 */
void random_bytes(std::span<uint8_t> out);

/**
 * H function: SHA3-256
 */
[[nodiscard]] inline Seed H(ByteParts parts) {
    return sha3_256(parts);
}

/**
 * G function: SHA3-512, returned as two 32-byte halves
 */
[[nodiscard]] inline std::pair<Seed, Seed> G(ByteParts parts) {
    auto hash = sha3_512(parts);
    std::pair<Seed, Seed> halves;
    std::copy(hash.begin(), hash.begin() + 32, halves.first.begin());
    std::copy(hash.begin() + 32, hash.end(), halves.second.begin());
    std::fill(hash.begin(), hash.end(), 0);
    return halves;
}

/**
 * J function: SHAKE256(s, 32)
 * Used for implicit rejection
 */
[[nodiscard]] inline SharedSecret J(ByteParts parts) {
    SharedSecret out{};
    shake256(parts, out);
    return out;
}

/**
 * PRF function: SHAKE256(s || b, out.size())
 * out.size() is 64*eta; used for sampling secret and error polynomials
 */
inline void prf(std::span<const uint8_t> s, uint8_t b, std::span<uint8_t> out) {
    const uint8_t nonce[1] = {b};
    shake256({s, nonce}, out);
}

/**
 * XOF function: SHAKE128(rho || j || i)
 * Used for generating entry (i, j) of matrix A
 */
[[nodiscard]] inline SHAKE128Stream xof(
    std::span<const uint8_t> rho, uint8_t j, uint8_t i) {
    const uint8_t indices[2] = {j, i};
    return SHAKE128Stream(ByteParts{rho, indices});
}

} // namespace mlkem

#endif // MLKEM_UTILS_HPP
