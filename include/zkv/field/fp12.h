/**
 * @file fp12.h
 * @brief Quadratic extension Fp12 = Fp6[w] / (w^2 - v)
 *
 * Top of the BN254 tower; GT is the order-r subgroup of Fp12*.
 * Seen over Fp2, an element is sum_{k=0..5} a_k w^k with
 * a_{2j} = c0.cj and a_{2j+1} = c1.cj, since w^2 = v and w^6 = xi.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_FIELD_FP12_H
#define ZKV_FIELD_FP12_H

#include "zkv/field/fp6.h"

#include <array>

namespace zkv {

/**
 * @brief Frobenius constants gamma_k = xi^(k (p^n - 1) / 6), k = 0..5
 */
using FrobeniusCoeffs = std::array<Fp2, 6>;

class Fp12 {
public:
    Fp6 c0;
    Fp6 c1;

    Fp12() = default;
    Fp12(const Fp6& a, const Fp6& b) : c0(a), c1(b) {}

    static Fp12 zero() { return Fp12(); }
    static Fp12 one() { return Fp12(Fp6::one(), Fp6::zero()); }

    bool is_zero() const { return c0.is_zero() && c1.is_zero(); }
    bool is_one() const { return c0.is_one() && c1.is_zero(); }

    Fp12 operator+(const Fp12& o) const { return Fp12(c0 + o.c0, c1 + o.c1); }
    Fp12 operator-(const Fp12& o) const { return Fp12(c0 - o.c0, c1 - o.c1); }
    Fp12 operator*(const Fp12& o) const;
    Fp12& operator*=(const Fp12& o) { return *this = *this * o; }

    Fp12 square() const;

    /**
     * @brief c0 - c1 w, equal to this^(p^6)
     */
    Fp12 conjugate() const { return Fp12(c0, -c1); }

    /**
     * @throws std::domain_error for zero
     */
    Fp12 inverse() const;

    /**
     * @brief this^(p^n) given the constants for n
     *
     * @param gamma Coefficients xi^(k (p^n - 1) / 6)
     * @param odd_power True when n is odd (conjugate the Fp2 coefficients)
     */
    Fp12 frobenius(const FrobeniusCoeffs& gamma, bool odd_power) const;

    Fp12 pow(const ExpLimbs& exp) const;

    /**
     * @brief Coefficient a_k of w^k over Fp2 (k in 0..5)
     */
    const Fp2& coeff(size_t k) const;
    Fp2& coeff(size_t k);

    /**
     * @brief 12 base-field coefficients, 32 bytes each, ordered a_0..a_5
     *        with the real part first
     */
    void to_bytes(uint8_t out[384]) const;

    bool operator==(const Fp12& o) const { return c0 == o.c0 && c1 == o.c1; }
    bool operator!=(const Fp12& o) const { return !(*this == o); }
};

} // namespace zkv

#endif // ZKV_FIELD_FP12_H
