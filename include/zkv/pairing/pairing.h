/**
 * @file pairing.h
 * @brief BN254 optimal ate pairing e: G1 x G2 -> GT
 *
 * Miller loop over the ate loop count 6x + 2 with two Frobenius-twisted
 * correction lines, followed by the final exponentiation
 * f^((p^12 - 1) / r) split into the easy part (p^6 - 1)(p^2 + 1) and
 * the hard part (p^4 - p^2 + 1) / r.
 *
 * All entry points require PairingContext::init() (or pairing_init())
 * to have completed.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_PAIRING_PAIRING_H
#define ZKV_PAIRING_PAIRING_H

#include "zkv/ec/point.h"
#include "zkv/field/fp12.h"

#include <utility>
#include <vector>

namespace zkv {

// ============================================================================
// GT Element
// ============================================================================

/**
 * @brief Element of the target group (order-r subgroup of Fp12*)
 *
 * Written multiplicatively. Default-constructed value is the identity.
 */
class GTElement {
public:
    GTElement() : value_(Fp12::one()) {}
    explicit GTElement(const Fp12& v) : value_(v) {}

    static GTElement one() { return GTElement(); }

    bool is_one() const { return value_.is_one(); }

    GTElement operator*(const GTElement& o) const { return GTElement(value_ * o.value_); }
    GTElement& operator*=(const GTElement& o) {
        value_ = value_ * o.value_;
        return *this;
    }

    bool operator==(const GTElement& o) const { return value_ == o.value_; }
    bool operator!=(const GTElement& o) const { return !(value_ == o.value_); }

    const Fp12& value() const { return value_; }

    /**
     * @brief 384-byte canonical encoding (see Fp12::to_bytes)
     */
    void to_bytes(uint8_t out[384]) const { value_.to_bytes(out); }

private:
    Fp12 value_;
};

using PairingInput = std::pair<G1Point, G2Point>;

// ============================================================================
// Engine State
// ============================================================================

/**
 * @brief Initialize the pairing engine (idempotent, thread-safe)
 */
bool pairing_init();

bool pairing_is_initialized();

// ============================================================================
// Pairing Computation
// ============================================================================

/**
 * @brief Miller loop output f_{6x+2,Q}(P) times the correction lines
 *
 * Returns one when P or Q is the point at infinity.
 * @throws std::logic_error if the engine is not initialized
 */
Fp12 miller_loop(const G1Point& p, const G2Point& q);

/**
 * @brief f^((p^12 - 1) / r)
 * @throws std::logic_error if the engine is not initialized
 * @throws std::domain_error if f is zero
 */
GTElement final_exponentiation(const Fp12& f);

/**
 * @brief e(P, Q); points are assumed valid
 * @throws std::logic_error if the engine is not initialized
 */
GTElement pairing(const G1Point& p, const G2Point& q);

/**
 * @brief prod_i e(P_i, Q_i) with one shared final exponentiation
 * @throws std::logic_error if the engine is not initialized
 */
GTElement multi_pairing(const std::vector<PairingInput>& inputs);

/**
 * @brief Non-throwing e(P, Q)
 *
 * Fails (returns false, out untouched) when the engine is not initialized
 * or when either point is off its curve or outside the order-r subgroup.
 * A result equal to the identity
 * is a success.
 */
bool pairing_compute(GTElement& out, const G1Point& p, const G2Point& q);

/**
 * @brief Non-throwing multi-pairing with the same failure rules
 */
bool pairing_multi(GTElement& out, const std::vector<PairingInput>& inputs);

} // namespace zkv

#endif // ZKV_PAIRING_PAIRING_H
