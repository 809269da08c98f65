/**
 * @file fp12.cpp
 * @brief Fp12 arithmetic and Frobenius map
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/field/fp12.h"

namespace zkv {

Fp12 Fp12::operator*(const Fp12& o) const {
    Fp6 t0 = c0 * o.c0;
    Fp6 t1 = c1 * o.c1;
    return Fp12(t0 + t1.mul_by_v(), (c0 + c1) * (o.c0 + o.c1) - t0 - t1);
}

Fp12 Fp12::square() const {
    // Complex squaring: (c0 + c1 w)^2 = (c0^2 + c1^2 v) + 2 c0 c1 w
    Fp6 t = c0 * c1;
    Fp6 r0 = (c0 + c1) * (c0 + c1.mul_by_v()) - t - t.mul_by_v();
    return Fp12(r0, t + t);
}

Fp12 Fp12::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Fp12: inverse of zero");
    }
    // 1 / (c0 + c1 w) = (c0 - c1 w) / (c0^2 - c1^2 v)
    Fp6 det_inv = (c0.square() - c1.square().mul_by_v()).inverse();
    return Fp12(c0 * det_inv, -(c1 * det_inv));
}

const Fp2& Fp12::coeff(size_t k) const {
    const Fp6& half = (k % 2 == 0) ? c0 : c1;
    switch (k / 2) {
        case 0: return half.c0;
        case 1: return half.c1;
        default: return half.c2;
    }
}

Fp2& Fp12::coeff(size_t k) {
    Fp6& half = (k % 2 == 0) ? c0 : c1;
    switch (k / 2) {
        case 0: return half.c0;
        case 1: return half.c1;
        default: return half.c2;
    }
}

Fp12 Fp12::frobenius(const FrobeniusCoeffs& gamma, bool odd_power) const {
    // (a_k w^k)^(p^n) = conj^n(a_k) * gamma_k * w^k
    Fp12 r;
    for (size_t k = 0; k < 6; ++k) {
        const Fp2& a = coeff(k);
        r.coeff(k) = (odd_power ? a.conjugate() : a) * gamma[k];
    }
    return r;
}

Fp12 Fp12::pow(const ExpLimbs& exp) const {
    Fp12 acc = one();
    for (size_t i = exp.size() * 64; i-- > 0;) {
        acc = acc.square();
        if ((exp[i / 64] >> (i % 64)) & 1) {
            acc = acc * *this;
        }
    }
    return acc;
}

void Fp12::to_bytes(uint8_t out[384]) const {
    for (size_t k = 0; k < 6; ++k) {
        coeff(k).c0.to_bytes_be(out + k * 64);
        coeff(k).c1.to_bytes_be(out + k * 64 + 32);
    }
}

} // namespace zkv
