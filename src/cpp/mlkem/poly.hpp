/**
 * Ring elements of R_q = Z_q[X]/(X^256 + 1) and modules over R_q
 *
 * The representation domain is a template tag, so a normal-domain
 * polynomial cannot be added to an NTT-domain one by accident:
 *
 *   Domain::Normal      coefficient representation
 *   Domain::Ntt         NTT representation (T_q)
 *   Domain::Compressed  d-bit values produced by Compress_d
 *
 * All storage is fixed size; a PolyVector always has room for MAX_K
 * entries and records how many are in use.
 */

#ifndef MLKEM_POLY_HPP
#define MLKEM_POLY_HPP

#include "params.hpp"
#include "field.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace mlkem {

enum class Domain {
    Normal,
    Ntt,
    Compressed,
};

template <Domain D>
struct Polynomial {
    std::array<uint16_t, N> coeffs{};

    [[nodiscard]] uint16_t& operator[](size_t i) noexcept { return coeffs[i]; }
    [[nodiscard]] uint16_t operator[](size_t i) const noexcept { return coeffs[i]; }

    friend bool operator==(const Polynomial&, const Polynomial&) = default;
};

using Poly = Polynomial<Domain::Normal>;
using NttPoly = Polynomial<Domain::Ntt>;
using CompressedPoly = Polynomial<Domain::Compressed>;

template <Domain D>
class PolyVector {
public:
    PolyVector() = default;
    explicit PolyVector(int k) noexcept : k_(static_cast<size_t>(k)) {}

    [[nodiscard]] size_t size() const noexcept { return k_; }

    [[nodiscard]] Polynomial<D>& operator[](size_t i) noexcept { return polys_[i]; }
    [[nodiscard]] const Polynomial<D>& operator[](size_t i) const noexcept { return polys_[i]; }

    [[nodiscard]] Polynomial<D>* begin() noexcept { return polys_.data(); }
    [[nodiscard]] Polynomial<D>* end() noexcept { return polys_.data() + k_; }
    [[nodiscard]] const Polynomial<D>* begin() const noexcept { return polys_.data(); }
    [[nodiscard]] const Polynomial<D>* end() const noexcept { return polys_.data() + k_; }

    friend bool operator==(const PolyVector& a, const PolyVector& b) noexcept {
        if (a.k_ != b.k_) return false;
        for (size_t i = 0; i < a.k_; ++i) {
            if (!(a.polys_[i] == b.polys_[i])) return false;
        }
        return true;
    }

private:
    std::array<Polynomial<D>, MAX_K> polys_{};
    size_t k_ = 0;
};

using PolyVec = PolyVector<Domain::Normal>;
using NttPolyVec = PolyVector<Domain::Ntt>;
using CompressedPolyVec = PolyVector<Domain::Compressed>;

/**
 * k x k matrix over T_q. Only ever held in the NTT domain; it is expanded
 * from rho whenever it is needed and never serialized.
 */
class NttMatrix {
public:
    explicit NttMatrix(int k) noexcept : k_(static_cast<size_t>(k)) {}

    [[nodiscard]] size_t size() const noexcept { return k_; }

    [[nodiscard]] NttPoly& at(size_t i, size_t j) noexcept { return entries_[i][j]; }
    [[nodiscard]] const NttPoly& at(size_t i, size_t j) const noexcept { return entries_[i][j]; }

private:
    std::array<std::array<NttPoly, MAX_K>, MAX_K> entries_{};
    size_t k_;
};

/**
 * Add two polynomials coefficient-wise
 */
template <Domain D>
[[nodiscard]] inline Polynomial<D> poly_add(const Polynomial<D>& a, const Polynomial<D>& b) noexcept {
    static_assert(D != Domain::Compressed, "compressed values are not ring elements");
    Polynomial<D> c;
    for (size_t i = 0; i < N; ++i) {
        c[i] = add_mod(a[i], b[i]);
    }
    return c;
}

/**
 * Subtract two polynomials coefficient-wise
 */
template <Domain D>
[[nodiscard]] inline Polynomial<D> poly_sub(const Polynomial<D>& a, const Polynomial<D>& b) noexcept {
    static_assert(D != Domain::Compressed, "compressed values are not ring elements");
    Polynomial<D> c;
    for (size_t i = 0; i < N; ++i) {
        c[i] = sub_mod(a[i], b[i]);
    }
    return c;
}

/**
 * Add two vectors of polynomials
 */
template <Domain D>
[[nodiscard]] inline PolyVector<D> vec_add(const PolyVector<D>& a, const PolyVector<D>& b) noexcept {
    PolyVector<D> c(static_cast<int>(a.size()));
    for (size_t i = 0; i < a.size(); ++i) {
        c[i] = poly_add(a[i], b[i]);
    }
    return c;
}

} // namespace mlkem

#endif // MLKEM_POLY_HPP
