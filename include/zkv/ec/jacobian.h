/**
 * @file jacobian.h
 * @brief Jacobian point arithmetic for short Weierstrass curves with a = 0
 *
 * Represents point (x, y) as (X/Z^2, Y/Z^3); point at infinity: Z = 0.
 * Instantiated over Fp (G1) and Fp2 (G2). No inversion happens here:
 * the degenerate cases are detected on H = U2 - U1 before they matter.
 *
 * Formulas from Explicit-Formulas Database (EFD):
 * https://hyperelliptic.org/EFD/g1p/auto-shortw-jacobian-0.html
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ZKV_EC_JACOBIAN_H
#define ZKV_EC_JACOBIAN_H

#include "zkv/core/fe256.h"

#include <array>
#include <cstring>

namespace zkv {

template <typename Field>
struct JacobianPoint {
    Field X;
    Field Y;
    Field Z;

    /**
     * @brief Point at infinity (0 : 1 : 0)
     */
    JacobianPoint() : X(), Y(Field::one()), Z() {}

    static JacobianPoint from_affine(const Field& x, const Field& y) {
        JacobianPoint p;
        p.X = x;
        p.Y = y;
        p.Z = Field::one();
        return p;
    }

    bool is_infinity() const { return Z.is_zero(); }

    JacobianPoint operator-() const {
        JacobianPoint r = *this;
        r.Y = -Y;
        return r;
    }

    /**
     * @brief dbl-2009-l: 2M + 5S
     */
    JacobianPoint dbl() const {
        if (is_infinity()) {
            return JacobianPoint();
        }
        // A = X1^2, B = Y1^2, C = B^2
        Field A = X.square();
        Field B = Y.square();
        Field C = B.square();

        // D = 2*((X1+B)^2 - A - C)
        Field D = ((X + B).square() - A - C).dbl();

        // E = 3*A, F = E^2
        Field E = A.dbl() + A;
        Field F = E.square();

        JacobianPoint r;
        // X3 = F - 2*D
        r.X = F - D.dbl();
        // Y3 = E*(D - X3) - 8*C
        r.Y = E * (D - r.X) - C.dbl().dbl().dbl();
        // Z3 = 2*Y1*Z1 (zero when Y1 = 0: 2-torsion doubles to infinity)
        r.Z = (Y * Z).dbl();
        return r;
    }

    /**
     * @brief add-2007-bl with explicit equal / opposite point handling
     */
    JacobianPoint operator+(const JacobianPoint& q) const {
        if (is_infinity()) {
            return q;
        }
        if (q.is_infinity()) {
            return *this;
        }

        Field Z1Z1 = Z.square();
        Field Z2Z2 = q.Z.square();
        Field U1 = X * Z2Z2;
        Field U2 = q.X * Z1Z1;
        Field S1 = Y * q.Z * Z2Z2;
        Field S2 = q.Y * Z * Z1Z1;

        // H = U2 - U1
        Field H = U2 - U1;
        if (H.is_zero()) {
            if ((S2 - S1).is_zero()) {
                // P == Q, do doubling
                return dbl();
            }
            // P == -Q
            return JacobianPoint();
        }

        // I = (2*H)^2, J = H*I
        Field I = H.dbl().square();
        Field J = H * I;
        // rr = 2*(S2 - S1)
        Field rr = (S2 - S1).dbl();
        // V = U1*I
        Field V = U1 * I;

        JacobianPoint r;
        // X3 = rr^2 - J - 2*V
        r.X = rr.square() - J - V.dbl();
        // Y3 = rr*(V - X3) - 2*S1*J
        r.Y = rr * (V - r.X) - (S1 * J).dbl();
        // Z3 = ((Z1+Z2)^2 - Z1Z1 - Z2Z2)*H
        r.Z = ((Z + q.Z).square() - Z1Z1 - Z2Z2) * H;
        return r;
    }

    /**
     * @brief Affine coordinates; returns false (outputs untouched) at infinity
     */
    bool to_affine(Field& x, Field& y) const {
        if (is_infinity()) {
            return false;
        }
        Field z_inv = Z.inverse();
        Field z_inv_sq = z_inv.square();
        x = X * z_inv_sq;
        y = Y * z_inv_sq * z_inv;
        return true;
    }
};

// ============================================================================
// wNAF Scalar Multiplication
// ============================================================================

namespace jacobian_detail {

constexpr int kWnafWidth = 5;
constexpr size_t kWnafTableSize = 1 << (kWnafWidth - 1);  // 16
constexpr size_t kMaxWnafDigits = 258;

/**
 * @brief Width-5 NAF of k, least significant digit first
 * @return Number of digits written
 */
inline size_t compute_wnaf(const Fe256& k, int8_t* wnaf) {
    std::memset(wnaf, 0, kMaxWnafDigits);

    uint64_t val[5] = {k.limb[0], k.limb[1], k.limb[2], k.limb[3], 0};
    const int mask = (1 << kWnafWidth) - 1;
    const int half = 1 << (kWnafWidth - 1);

    size_t i = 0;
    while ((val[0] | val[1] | val[2] | val[3] | val[4]) != 0) {
        if (val[0] & 1) {
            int digit = static_cast<int>(val[0] & static_cast<uint64_t>(mask));
            if (digit >= half) {
                digit -= (1 << kWnafWidth);
            }
            wnaf[i] = static_cast<int8_t>(digit);

            if (digit >= 0) {
                // Low bits equal digit, no borrow
                val[0] -= static_cast<uint64_t>(digit);
            } else {
                uint64_t carry = 0;
                val[0] = fe256_ops::adc64(val[0], static_cast<uint64_t>(-digit), 0, &carry);
                for (int j = 1; j < 5; j++) {
                    val[j] = fe256_ops::adc64(val[j], 0, carry, &carry);
                }
            }
        }

        // val >>= 1
        for (int j = 0; j < 4; j++) {
            val[j] = (val[j] >> 1) | (val[j + 1] << 63);
        }
        val[4] >>= 1;
        i++;
    }
    return i;
}

} // namespace jacobian_detail

/**
 * @brief k * P for a plain (non-Montgomery) 256-bit integer k
 *
 * Scalars handled here are public (verification inputs and the group
 * order), so the digit-dependent control flow is acceptable.
 */
template <typename Field>
JacobianPoint<Field> scalar_mul(const JacobianPoint<Field>& p, const Fe256& k) {
    using namespace jacobian_detail;

    if (k.is_zero() || p.is_infinity()) {
        return JacobianPoint<Field>();
    }

    int8_t wnaf[kMaxWnafDigits];
    size_t wnaf_len = compute_wnaf(k, wnaf);

    // table[i] = (2*i + 1) * P
    std::array<JacobianPoint<Field>, kWnafTableSize> table;
    table[0] = p;
    JacobianPoint<Field> p2 = p.dbl();
    for (size_t i = 1; i < kWnafTableSize; i++) {
        table[i] = table[i - 1] + p2;
    }

    JacobianPoint<Field> r;
    for (size_t i = wnaf_len; i-- > 0;) {
        r = r.dbl();
        int8_t digit = wnaf[i];
        if (digit > 0) {
            r = r + table[static_cast<size_t>((digit - 1) / 2)];
        } else if (digit < 0) {
            r = r + (-table[static_cast<size_t>((-digit - 1) / 2)]);
        }
    }
    return r;
}

} // namespace zkv

#endif // ZKV_EC_JACOBIAN_H
