/**
 * @file fp6.h
 * @brief Cubic extension Fp6 = Fp2[v] / (v^3 - xi), xi = 9 + u
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_FIELD_FP6_H
#define ZKV_FIELD_FP6_H

#include "zkv/field/fp2.h"

namespace zkv {

/**
 * @brief a = c0 + c1 v + c2 v^2
 */
class Fp6 {
public:
    Fp2 c0;
    Fp2 c1;
    Fp2 c2;

    Fp6() = default;
    Fp6(const Fp2& a, const Fp2& b, const Fp2& c) : c0(a), c1(b), c2(c) {}

    static Fp6 zero() { return Fp6(); }
    static Fp6 one() { return Fp6(Fp2::one(), Fp2::zero(), Fp2::zero()); }

    bool is_zero() const { return c0.is_zero() && c1.is_zero() && c2.is_zero(); }
    bool is_one() const { return c0.is_one() && c1.is_zero() && c2.is_zero(); }

    Fp6 operator+(const Fp6& o) const { return Fp6(c0 + o.c0, c1 + o.c1, c2 + o.c2); }
    Fp6 operator-(const Fp6& o) const { return Fp6(c0 - o.c0, c1 - o.c1, c2 - o.c2); }
    Fp6 operator-() const { return Fp6(-c0, -c1, -c2); }
    Fp6 operator*(const Fp6& o) const;

    Fp6 square() const { return *this * *this; }

    /**
     * @brief Multiply by v: (c0, c1, c2) -> (xi c2, c0, c1)
     */
    Fp6 mul_by_v() const { return Fp6(c2.mul_by_xi(), c0, c1); }

    /**
     * @throws std::domain_error for zero
     */
    Fp6 inverse() const;

    bool operator==(const Fp6& o) const { return c0 == o.c0 && c1 == o.c1 && c2 == o.c2; }
    bool operator!=(const Fp6& o) const { return !(*this == o); }
};

} // namespace zkv

#endif // ZKV_FIELD_FP6_H
