/**
 * @file pairing_context.h
 * @brief Process-wide pairing engine state for the BN254 optimal ate pairing
 *
 * Holds the derived constants the Miller loop and final exponentiation
 * read: Frobenius coefficients for p, p^2, p^3, the twist Frobenius
 * factors, the ate loop count 6x + 2 and the hard-part exponent
 * (p^4 - p^2 + 1) / r.
 *
 * Lifecycle:
 * - init() derives everything exactly once (std::call_once); later calls
 *   return true without touching the constants
 * - after init() the context is immutable and safe to read concurrently
 * - no teardown, the context owns no external resources
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_PAIRING_PAIRING_CONTEXT_H
#define ZKV_PAIRING_PAIRING_CONTEXT_H

#include "zkv/field/fp12.h"

#include <atomic>
#include <mutex>

namespace zkv {

class PairingContext {
public:
    /**
     * @brief BN254 curve parameter x
     */
    static constexpr uint64_t kBnParameter = 0x44E992B44A6909F1ULL;

    static PairingContext& instance();

    /**
     * @brief Derive all constants; idempotent and thread-safe
     * @return true once the context is ready
     */
    bool init();

    bool is_initialized() const { return ready_.load(std::memory_order_acquire); }

    /**
     * @brief Coefficients for f -> f^(p^n), n in {1, 2, 3}
     * @throws std::out_of_range for other n
     */
    const FrobeniusCoeffs& frobenius(int n) const;

    /**
     * @brief xi^((p-1)/3): x-factor of the Frobenius endomorphism on the twist
     */
    const Fp2& twist_frobenius_x() const { return frobenius_[0][2]; }

    /**
     * @brief xi^((p-1)/2): y-factor of the Frobenius endomorphism on the twist
     */
    const Fp2& twist_frobenius_y() const { return frobenius_[0][3]; }

    /**
     * @brief 6x + 2 (65 bits)
     */
    const Fe256& ate_loop_count() const { return ate_loop_count_; }

    /**
     * @brief (p^4 - p^2 + 1) / r
     */
    const ExpLimbs& final_exp_hard() const { return final_exp_hard_; }

    PairingContext(const PairingContext&) = delete;
    PairingContext& operator=(const PairingContext&) = delete;

private:
    PairingContext() = default;

    void derive();

    std::once_flag once_;
    std::atomic<bool> ready_{false};

    FrobeniusCoeffs frobenius_[3];
    Fe256 ate_loop_count_;
    ExpLimbs final_exp_hard_;
};

} // namespace zkv

#endif // ZKV_PAIRING_PAIRING_CONTEXT_H
