/**
 * K-PKE: Internal Public-Key Encryption for ML-KEM
 * Based on FIPS 203 Algorithms 13-15
 *
 * K-PKE is the internal IND-CPA secure PKE scheme used by ML-KEM.
 * It is NOT approved for standalone use - only as part of ML-KEM.
 *
 * Encrypt is a deterministic function of (ek, m, r); ML-KEM relies on this
 * to re-encrypt during decapsulation.
 */

#ifndef MLKEM_KPKE_HPP
#define MLKEM_KPKE_HPP

#include "params.hpp"
#include "errors.hpp"
#include "poly.hpp"
#include "ntt.hpp"
#include "encode.hpp"
#include "sampling.hpp"
#include "compress.hpp"
#include "utils.hpp"
#include "../ct_utils.hpp"
#include <algorithm>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace mlkem {

using SeedView = std::span<const uint8_t, SEED_BYTES>;

/**
 * Encryption key ek_PKE = ByteEncode_12(t_hat) || rho
 */
struct PkePublicKey {
    NttPolyVec t_hat;
    Seed rho{};

    [[nodiscard]] std::vector<uint8_t> to_bytes() const {
        auto bytes = encode_vec(t_hat, 12);
        bytes.insert(bytes.end(), rho.begin(), rho.end());
        return bytes;
    }

    /**
     * @throws InvalidLength if ek.size() != 384*k + 32
     */
    [[nodiscard]] static PkePublicKey from_bytes(std::span<const uint8_t> ek, const Params& params) {
        if (ek.size() != params.ek_size()) {
            throw InvalidLength("encapsulation key", params.ek_size(), ek.size());
        }
        const size_t t_len = POLY_BYTES * params.k;
        PkePublicKey pk;
        pk.t_hat = decode_vec<Domain::Ntt>(ek.first(t_len), params.k, 12);
        std::copy(ek.begin() + static_cast<std::ptrdiff_t>(t_len), ek.end(), pk.rho.begin());
        return pk;
    }
};

/**
 * Decryption key dk_PKE = ByteEncode_12(s_hat)
 */
struct PkeSecretKey {
    NttPolyVec s_hat;

    [[nodiscard]] std::vector<uint8_t> to_bytes() const {
        return encode_vec(s_hat, 12);
    }

    /**
     * @throws InvalidLength if dk.size() != 384*k
     */
    [[nodiscard]] static PkeSecretKey from_bytes(std::span<const uint8_t> dk, const Params& params) {
        if (dk.size() != params.dk_pke_size()) {
            throw InvalidLength("K-PKE decryption key", params.dk_pke_size(), dk.size());
        }
        PkeSecretKey sk;
        sk.s_hat = decode_vec<Domain::Ntt>(dk, params.k, 12);
        return sk;
    }
};

/**
 * Ciphertext c = ByteEncode_du(u) || ByteEncode_dv(v), with u and v
 * already compressed.
 */
struct PkeCiphertext {
    CompressedPolyVec u;
    CompressedPoly v;

    [[nodiscard]] std::vector<uint8_t> to_bytes(const Params& params) const {
        auto bytes = encode_vec(u, params.du);
        auto c2 = byte_encode(v, params.dv);
        bytes.insert(bytes.end(), c2.begin(), c2.end());
        return bytes;
    }

    /**
     * @throws InvalidLength if c.size() != 32*(du*k + dv)
     */
    [[nodiscard]] static PkeCiphertext from_bytes(std::span<const uint8_t> c, const Params& params) {
        if (c.size() != params.ct_size()) {
            throw InvalidLength("ciphertext", params.ct_size(), c.size());
        }
        PkeCiphertext ct;
        ct.u = decode_vec<Domain::Compressed>(c.first(params.c1_size()), params.k, params.du);
        ct.v = byte_decode<Domain::Compressed>(c.subspan(params.c1_size()), params.dv);
        return ct;
    }
};

/**
 * Algorithm 13: K-PKE.KeyGen
 *
 * Input: d - 32-byte seed
 * Output: (ek_PKE, dk_PKE)
 */
[[nodiscard]] inline std::pair<PkePublicKey, PkeSecretKey>
kpke_keygen(SeedView d, const Params& params) {
    const int k = params.k;

    // Step 1: (rho, sigma) = G(d || k), k as a domain separator
    const uint8_t rank[1] = {static_cast<uint8_t>(k)};
    auto [rho, sigma] = G({d, rank});

    // Step 2: Generate matrix A in NTT domain
    auto A_hat = expand_a(rho, k);

    // Steps 3-4: Sample secret s and error e with a shared counter
    uint8_t counter = 0;
    auto s = sample_cbd_vec(sigma, k, params.eta1, counter);
    auto e = sample_cbd_vec(sigma, k, params.eta1, counter);

    // Step 5: t_hat = A_hat * s_hat + e_hat
    std::pair<PkePublicKey, PkeSecretKey> keys;
    keys.second.s_hat = vec_ntt(s);
    auto e_hat = vec_ntt(e);
    keys.first.t_hat = vec_add(mat_vec_mul_ntt(A_hat, keys.second.s_hat), e_hat);
    keys.first.rho = rho;

    ct::wipe(s);
    ct::wipe(e);
    ct::wipe(e_hat);
    ct::wipe(sigma);

    return keys;
}

/**
 * Algorithm 14: K-PKE.Encrypt
 *
 * Input: ek_PKE - encryption key
 *        m - 32-byte message
 *        r - 32-byte randomness
 * Output: ciphertext (u, v), compressed
 */
[[nodiscard]] inline PkeCiphertext kpke_encrypt(
    const PkePublicKey& ek, SeedView m, SeedView r, const Params& params) {

    const int k = params.k;

    // Step 1: Regenerate A_hat from rho
    auto A_hat = expand_a(ek.rho, k);

    // Step 2: Sample y, e1, e2 from r with a shared counter
    uint8_t counter = 0;
    auto y = sample_cbd_vec(r, k, params.eta1, counter);
    auto e1 = sample_cbd_vec(r, k, params.eta2, counter);
    auto e2 = sample_cbd_poly(r, params.eta2, counter);

    auto y_hat = vec_ntt(y);

    // Step 3: u = NTT^-1(A_hat^T * y_hat) + e1
    auto u = vec_add(vec_ntt_inv(mat_vec_mul_ntt(A_hat, y_hat, /*transpose=*/true)), e1);

    // Step 4: mu = Decompress_1(ByteDecode_1(m))
    auto mu = poly_decompress(byte_decode<Domain::Compressed>(m, 1), 1);

    // Step 5: v = NTT^-1(t_hat^T * y_hat) + e2 + mu
    auto v = poly_add(poly_add(ntt_inv(inner_product_ntt(ek.t_hat, y_hat)), e2), mu);

    // Step 6: Compress
    PkeCiphertext c;
    c.u = vec_compress(u, params.du);
    c.v = poly_compress(v, params.dv);

    ct::wipe(y);
    ct::wipe(y_hat);
    ct::wipe(e1);
    ct::wipe(e2);
    ct::wipe(mu);
    ct::wipe(u);
    ct::wipe(v);

    return c;
}

/**
 * Algorithm 15: K-PKE.Decrypt
 *
 * Never fails: a ciphertext that was not produced for this key decrypts to
 * an unrelated 32-byte value.
 */
[[nodiscard]] inline Seed kpke_decrypt(
    const PkeSecretKey& dk, const PkeCiphertext& c, const Params& params) {

    // Step 1: u' = Decompress_du(u), v' = Decompress_dv(v)
    auto u = vec_decompress(c.u, params.du);
    auto v = poly_decompress(c.v, params.dv);

    // Step 2: w = v' - NTT^-1(s_hat^T * NTT(u'))
    auto w = poly_sub(v, ntt_inv(inner_product_ntt(dk.s_hat, vec_ntt(u))));

    // Step 3: m = ByteEncode_1(Compress_1(w))
    Seed m{};
    byte_encode(poly_compress(w, 1), 1, m);

    ct::wipe(w);
    return m;
}

/**
 * Byte-level K-PKE.Encrypt: decodes ek, encrypts, encodes the ciphertext.
 *
 * @throws InvalidLength if ek has the wrong size
 */
[[nodiscard]] inline std::vector<uint8_t> kpke_encrypt(
    std::span<const uint8_t> ek_pke, SeedView m, SeedView r, const Params& params) {
    return kpke_encrypt(PkePublicKey::from_bytes(ek_pke, params), m, r, params).to_bytes(params);
}

/**
 * Byte-level K-PKE.Decrypt
 *
 * @throws InvalidLength if dk_pke or c has the wrong size
 */
[[nodiscard]] inline Seed kpke_decrypt(
    std::span<const uint8_t> dk_pke, std::span<const uint8_t> c, const Params& params) {
    auto sk = PkeSecretKey::from_bytes(dk_pke, params);
    auto m = kpke_decrypt(sk, PkeCiphertext::from_bytes(c, params), params);
    ct::wipe(sk);
    return m;
}

} // namespace mlkem

#endif // MLKEM_KPKE_HPP
