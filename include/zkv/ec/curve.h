/**
 * @file curve.h
 * @brief BN254 curve parameters for G1 and G2
 *
 * G1: y^2 = x^3 + 3 over Fp, cofactor 1.
 * G2: y^2 = x^3 + 3/xi over Fp2 (D-type sextic twist, xi = 9 + u),
 *     prime-order subgroup of order r inside a larger group.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_EC_CURVE_H
#define ZKV_EC_CURVE_H

#include "zkv/field/fp2.h"

namespace zkv {

struct G1Curve {
    using Field = Fp;

    static constexpr size_t kEncodedSize = 64;
    static constexpr bool kCofactorOne = true;

    static const char* name() { return "G1"; }
    static const Fp& b();
    static const Fp& generator_x();
    static const Fp& generator_y();

    /**
     * @brief Coordinate as 32 big-endian bytes
     */
    static void encode(const Fp& v, uint8_t* out) { v.to_bytes_be(out); }
    static Fp decode(const uint8_t* in) { return Fp::from_bytes_be(in); }
};

struct G2Curve {
    using Field = Fp2;

    static constexpr size_t kEncodedSize = 128;
    static constexpr bool kCofactorOne = false;

    static const char* name() { return "G2"; }
    static const Fp2& b();
    static const Fp2& generator_x();
    static const Fp2& generator_y();

    /**
     * @brief Coordinate as imaginary part then real part, 32 bytes each
     */
    static void encode(const Fp2& v, uint8_t* out) {
        v.c1.to_bytes_be(out);
        v.c0.to_bytes_be(out + 32);
    }
    static Fp2 decode(const uint8_t* in) {
        Fp im = Fp::from_bytes_be(in);
        Fp re = Fp::from_bytes_be(in + 32);
        return Fp2(re, im);
    }
};

} // namespace zkv

#endif // ZKV_EC_CURVE_H
