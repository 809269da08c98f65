/**
 * @file curve.cpp
 * @brief BN254 G1/G2 constants
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/ec/curve.h"

namespace zkv {

// ============================================================================
// G1
// ============================================================================

const Fp& G1Curve::b() {
    static const Fp value = Fp::from_u64(3);
    return value;
}

const Fp& G1Curve::generator_x() {
    static const Fp value = Fp::one();
    return value;
}

const Fp& G1Curve::generator_y() {
    static const Fp value = Fp::from_u64(2);
    return value;
}

// ============================================================================
// G2
// ============================================================================

const Fp2& G2Curve::b() {
    // b' = 3 / (9 + u)
    static const Fp2 value = Fp2(Fp::from_u64(3), Fp::zero()) * Fp2::xi().inverse();
    return value;
}

const Fp2& G2Curve::generator_x() {
    static const Fp2 value(
        Fp::from_hex("1800deef121f1e76426a00665e5c4479674322d4f75edadd46debd5cd992f6ed"),
        Fp::from_hex("198e9393920d483a7260bfb731fb5d25f1aa493335a9e71297e485b7aef312c2"));
    return value;
}

const Fp2& G2Curve::generator_y() {
    static const Fp2 value(
        Fp::from_hex("12c85ea5db8c6deb4aab71808dcb408fe3d1e7690c43d37b4ce6cc0166fa7daa"),
        Fp::from_hex("090689d0585ff075ec9e99ad690c3395bc4b313370b38ef355acdadcd122975b"));
    return value;
}

} // namespace zkv
