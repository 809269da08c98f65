/**
 * @file fp6.cpp
 * @brief Fp6 arithmetic
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/field/fp6.h"

namespace zkv {

Fp6 Fp6::operator*(const Fp6& o) const {
    // Karatsuba-style interpolation, 6 Fp2 multiplications
    Fp2 t0 = c0 * o.c0;
    Fp2 t1 = c1 * o.c1;
    Fp2 t2 = c2 * o.c2;

    Fp2 r0 = ((c1 + c2) * (o.c1 + o.c2) - t1 - t2).mul_by_xi() + t0;
    Fp2 r1 = (c0 + c1) * (o.c0 + o.c1) - t0 - t1 + t2.mul_by_xi();
    Fp2 r2 = (c0 + c2) * (o.c0 + o.c2) - t0 - t2 + t1;
    return Fp6(r0, r1, r2);
}

Fp6 Fp6::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Fp6: inverse of zero");
    }
    Fp2 t0 = c0.square() - (c1 * c2).mul_by_xi();
    Fp2 t1 = c2.square().mul_by_xi() - c0 * c1;
    Fp2 t2 = c1.square() - c0 * c2;

    // Norm down to Fp2; nonzero for nonzero input since Fp6 is a field
    Fp2 det = c0 * t0 + (c2 * t1 + c1 * t2).mul_by_xi();
    Fp2 det_inv = det.inverse();
    return Fp6(t0 * det_inv, t1 * det_inv, t2 * det_inv);
}

} // namespace zkv
