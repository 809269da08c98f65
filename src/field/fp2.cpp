/**
 * @file fp2.cpp
 * @brief Fp2 arithmetic
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/field/fp2.h"

namespace zkv {

const Fp2& Fp2::xi() {
    static const Fp2 value(Fp::from_u64(9), Fp::one());
    return value;
}

Fp2 Fp2::operator*(const Fp2& o) const {
    // Karatsuba: 3 base-field multiplications
    Fp t0 = c0 * o.c0;
    Fp t1 = c1 * o.c1;
    Fp t2 = (c0 + c1) * (o.c0 + o.c1);
    return Fp2(t0 - t1, t2 - t0 - t1);
}

Fp2 Fp2::square() const {
    // (c0 + c1 u)^2 = (c0 + c1)(c0 - c1) + 2 c0 c1 u
    Fp t = c0 * c1;
    return Fp2((c0 + c1) * (c0 - c1), t.dbl());
}

Fp2 Fp2::mul_by_xi() const {
    // (9 + u)(c0 + c1 u) = (9 c0 - c1) + (9 c1 + c0) u
    Fp c0_8 = c0.dbl().dbl().dbl();
    Fp c1_8 = c1.dbl().dbl().dbl();
    return Fp2(c0_8 + c0 - c1, c1_8 + c1 + c0);
}

Fp2 Fp2::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Fp2: inverse of zero");
    }
    // 1 / (c0 + c1 u) = (c0 - c1 u) / (c0^2 + c1^2)
    Fp norm_inv = (c0.square() + c1.square()).inverse();
    return Fp2(c0 * norm_inv, -(c1 * norm_inv));
}

Fp2 Fp2::pow(const ExpLimbs& exp) const {
    Fp2 acc = one();
    for (size_t i = exp.size() * 64; i-- > 0;) {
        acc = acc.square();
        if ((exp[i / 64] >> (i % 64)) & 1) {
            acc = acc * *this;
        }
    }
    return acc;
}

} // namespace zkv
