/**
 * Sampling Functions for ML-KEM
 * Based on FIPS 203 Algorithms 7-8
 *
 * SampleNTT is a rejection sampler over public seed material; its running
 * time depends on rho only and varies from call to call. SamplePolyCBD
 * works on secret PRF output and is branch-free.
 */

#ifndef MLKEM_SAMPLING_HPP
#define MLKEM_SAMPLING_HPP

#include "params.hpp"
#include "field.hpp"
#include "poly.hpp"
#include "utils.hpp"
#include "../ct_utils.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace mlkem {

/**
 * Algorithm 7: SampleNTT
 * Sample polynomial uniformly in NTT domain from XOF stream
 *
 * Each 3-byte group yields two 12-bit candidates; candidates >= q are
 * discarded until 256 coefficients have been accepted.
 */
[[nodiscard]] inline NttPoly sample_ntt(SHAKE128Stream& stream) {
    NttPoly a_hat;
    std::array<uint8_t, SHAKE128Stream::BLOCK_BYTES> block{};
    size_t j = 0;

    while (j < N) {
        stream.read(block);
        for (size_t pos = 0; pos + 3 <= block.size() && j < N; pos += 3) {
            const uint16_t d1 = static_cast<uint16_t>(
                block[pos] | ((block[pos + 1] & 0x0F) << 8));
            const uint16_t d2 = static_cast<uint16_t>(
                (block[pos + 1] >> 4) | (block[pos + 2] << 4));

            if (d1 < Q) {
                a_hat[j++] = d1;
            }
            if (d2 < Q && j < N) {
                a_hat[j++] = d2;
            }
        }
    }

    return a_hat;
}

/**
 * Algorithm 8: SamplePolyCBD_eta
 * Sample polynomial from centered binomial distribution
 *
 * Input is 64*eta bytes. Coefficient i is x - y where x and y are the
 * popcounts of two consecutive eta-bit fields; the result lies in
 * [-eta, eta] and is stored mod q.
 */
[[nodiscard]] inline Poly sample_poly_cbd(std::span<const uint8_t> b, int eta) {
    if (eta != 2 && eta != 3) {
        throw std::invalid_argument("Unsupported CBD parameter eta=" + std::to_string(eta));
    }
    if (b.size() != static_cast<size_t>(64 * eta)) {
        throw InvalidLength("CBD input", static_cast<size_t>(64 * eta), b.size());
    }

    Poly f;

    if (eta == 2) {
        // 4 bytes -> 8 coefficients of 4 bits each
        for (size_t i = 0; i < N / 8; ++i) {
            const uint32_t t = static_cast<uint32_t>(b[4 * i]) |
                               (static_cast<uint32_t>(b[4 * i + 1]) << 8) |
                               (static_cast<uint32_t>(b[4 * i + 2]) << 16) |
                               (static_cast<uint32_t>(b[4 * i + 3]) << 24);
            const uint32_t d = (t & 0x55555555u) + ((t >> 1) & 0x55555555u);

            for (size_t j = 0; j < 8; ++j) {
                const uint16_t x = static_cast<uint16_t>((d >> (4 * j)) & 0x3);
                const uint16_t y = static_cast<uint16_t>((d >> (4 * j + 2)) & 0x3);
                f[8 * i + j] = reduce_once(static_cast<uint16_t>(x + Q - y));
            }
        }
    } else {
        // 3 bytes -> 4 coefficients of 6 bits each
        for (size_t i = 0; i < N / 4; ++i) {
            const uint32_t t = static_cast<uint32_t>(b[3 * i]) |
                               (static_cast<uint32_t>(b[3 * i + 1]) << 8) |
                               (static_cast<uint32_t>(b[3 * i + 2]) << 16);
            const uint32_t d = (t & 0x00249249u) + ((t >> 1) & 0x00249249u) +
                               ((t >> 2) & 0x00249249u);

            for (size_t j = 0; j < 4; ++j) {
                const uint16_t x = static_cast<uint16_t>((d >> (6 * j)) & 0x7);
                const uint16_t y = static_cast<uint16_t>((d >> (6 * j + 3)) & 0x7);
                f[4 * i + j] = reduce_once(static_cast<uint16_t>(x + Q - y));
            }
        }
    }

    return f;
}

/**
 * Sample one CBD polynomial from PRF_eta(seed, counter) and advance the
 * counter.
 */
[[nodiscard]] inline Poly sample_cbd_poly(
    std::span<const uint8_t> seed, int eta, uint8_t& counter) {

    std::array<uint8_t, 64 * 3> buf{};
    auto bytes = std::span<uint8_t>(buf).first(static_cast<size_t>(64 * eta));
    prf(seed, counter++, bytes);
    Poly f = sample_poly_cbd(bytes, eta);
    ct::zero(buf);
    return f;
}

/**
 * Sample a length-k vector of CBD polynomials, advancing the counter once
 * per entry (secret s, errors e and e1, ephemeral y).
 */
[[nodiscard]] inline PolyVec sample_cbd_vec(
    std::span<const uint8_t> seed, int k, int eta, uint8_t& counter) {

    PolyVec v(k);
    for (int i = 0; i < k; ++i) {
        v[static_cast<size_t>(i)] = sample_cbd_poly(seed, eta, counter);
    }
    return v;
}

/**
 * Expand matrix A from seed rho
 * A_hat[i][j] = SampleNTT(XOF(rho || j || i))
 */
[[nodiscard]] inline NttMatrix expand_a(std::span<const uint8_t> rho, int k) {
    NttMatrix A_hat(k);

    for (int i = 0; i < k; ++i) {
        for (int j = 0; j < k; ++j) {
            auto stream = xof(rho, static_cast<uint8_t>(j), static_cast<uint8_t>(i));
            A_hat.at(static_cast<size_t>(i), static_cast<size_t>(j)) = sample_ntt(stream);
        }
    }

    return A_hat;
}

} // namespace mlkem

#endif // MLKEM_SAMPLING_HPP
