/**
 * @file fp2.h
 * @brief Quadratic extension Fp2 = Fp[u] / (u^2 + 1)
 *
 * Coordinate field of G2 and the base of the Fp6/Fp12 tower.
 * Element a = c0 + c1 * u.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_FIELD_FP2_H
#define ZKV_FIELD_FP2_H

#include "zkv/field/fp.h"

namespace zkv {

class Fp2 {
public:
    Fp c0;  ///< Real part
    Fp c1;  ///< Coefficient of u

    Fp2() = default;
    Fp2(const Fp& a, const Fp& b) : c0(a), c1(b) {}

    static Fp2 zero() { return Fp2(); }
    static Fp2 one() { return Fp2(Fp::one(), Fp::zero()); }

    /**
     * @brief Non-residue xi = 9 + u defining the Fp6 extension and the twist
     */
    static const Fp2& xi();

    bool is_zero() const { return c0.is_zero() && c1.is_zero(); }
    bool is_one() const { return c0.is_one() && c1.is_zero(); }

    Fp2 operator+(const Fp2& o) const { return Fp2(c0 + o.c0, c1 + o.c1); }
    Fp2 operator-(const Fp2& o) const { return Fp2(c0 - o.c0, c1 - o.c1); }
    Fp2 operator-() const { return Fp2(-c0, -c1); }
    Fp2 operator*(const Fp2& o) const;

    Fp2& operator+=(const Fp2& o) { return *this = *this + o; }
    Fp2& operator-=(const Fp2& o) { return *this = *this - o; }
    Fp2& operator*=(const Fp2& o) { return *this = *this * o; }

    Fp2 square() const;
    Fp2 dbl() const { return Fp2(c0.dbl(), c1.dbl()); }

    /**
     * @brief Multiply by a base-field scalar
     */
    Fp2 scale(const Fp& s) const { return Fp2(c0 * s, c1 * s); }

    /**
     * @brief Multiply by xi = 9 + u
     */
    Fp2 mul_by_xi() const;

    /**
     * @brief Complex conjugate c0 - c1 * u (the p-power Frobenius on Fp2)
     */
    Fp2 conjugate() const { return Fp2(c0, -c1); }

    /**
     * @throws std::domain_error for zero
     */
    Fp2 inverse() const;

    /**
     * @brief this^exp, exp as little-endian limbs of any length
     */
    Fp2 pow(const ExpLimbs& exp) const;

    bool operator==(const Fp2& o) const { return c0 == o.c0 && c1 == o.c1; }
    bool operator!=(const Fp2& o) const { return !(*this == o); }
};

} // namespace zkv

#endif // ZKV_FIELD_FP2_H
