/**
 * @file pairing_context.cpp
 * @brief Derivation of the pairing constants
 *
 * Exponents wider than 256 bits are formed with GMP once at init;
 * the field tower then raises xi to them.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/pairing/pairing_context.h"
#include "zkv/ec/curve.h"
#include "zkv/internal/gmp_bridge.h"

#include <stdexcept>

namespace zkv {

using internal::wrapped_mpz;

PairingContext& PairingContext::instance() {
    static PairingContext ctx;
    return ctx;
}

bool PairingContext::init() {
    try {
        std::call_once(once_, [this] {
            derive();
            ready_.store(true, std::memory_order_release);
        });
    } catch (const std::runtime_error&) {
        // call_once leaves the flag unset, a later init() retries
        return false;
    } catch (const std::domain_error&) {
        return false;
    }
    return is_initialized();
}

const FrobeniusCoeffs& PairingContext::frobenius(int n) const {
    if (n < 1 || n > 3) {
        throw std::out_of_range("Frobenius power must be 1, 2 or 3");
    }
    return frobenius_[n - 1];
}

void PairingContext::derive() {
    wrapped_mpz p, r, x, e, pn, tmp;
    internal::mpz_set_fe256(p.body, bn254_p());
    internal::mpz_set_fe256(r.body, bn254_r());
    internal::mpz_set_fe256(x.body, Fe256(kBnParameter));

    // gamma_{n,k} = xi^(k (p^n - 1) / 6) = gamma_{n,1}^k
    mpz_set(pn.body, p.body);
    for (int n = 0; n < 3; ++n) {
        mpz_sub_ui(e.body, pn.body, 1);
        if (!mpz_divisible_ui_p(e.body, 6)) {
            throw std::runtime_error("p^n - 1 not divisible by 6");
        }
        mpz_divexact_ui(e.body, e.body, 6);

        Fp2 g1 = Fp2::xi().pow(internal::limbs_from_mpz(e.body));
        FrobeniusCoeffs& coeffs = frobenius_[n];
        coeffs[0] = Fp2::one();
        for (size_t k = 1; k < 6; ++k) {
            coeffs[k] = coeffs[k - 1] * g1;
        }
        mpz_mul(pn.body, pn.body, p.body);
    }

    // 6x + 2
    mpz_mul_ui(tmp.body, x.body, 6);
    mpz_add_ui(tmp.body, tmp.body, 2);
    ate_loop_count_ = internal::fe256_from_mpz(tmp.body);

    // (p^4 - p^2 + 1) / r
    mpz_pow_ui(e.body, p.body, 4);
    mpz_pow_ui(tmp.body, p.body, 2);
    mpz_sub(e.body, e.body, tmp.body);
    mpz_add_ui(e.body, e.body, 1);
    if (!mpz_divisible_p(e.body, r.body)) {
        throw std::runtime_error("r does not divide p^4 - p^2 + 1");
    }
    mpz_divexact(e.body, e.body, r.body);
    final_exp_hard_ = internal::limbs_from_mpz(e.body);

    // Build the twist constants up front so later reads never construct them
    (void)G2Curve::b();
    (void)G2Curve::generator_x();
}

} // namespace zkv
