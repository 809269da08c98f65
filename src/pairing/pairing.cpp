/**
 * @file pairing.cpp
 * @brief Optimal ate pairing implementation
 *
 * Points on the twist E'(Fp2) map into E(Fp12) by
 * psi(x', y') = (x' w^2, y' w^3). Line functions are evaluated directly
 * in that untwisted form, so every line value is sparse:
 *
 *   chord/tangent: yP - lambda xP w + (lambda x'T - y'T) w^3
 *   vertical:      xP - x'T w^2
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/pairing/pairing.h"
#include "zkv/pairing/pairing_context.h"

#include <stdexcept>

namespace zkv {

namespace {

const PairingContext& ready_context() {
    const PairingContext& ctx = PairingContext::instance();
    if (!ctx.is_initialized()) {
        throw std::logic_error("pairing engine not initialized");
    }
    return ctx;
}

/**
 * @brief Line through T and Q (tangent at T when T == Q) evaluated at P
 */
Fp12 line_eval(const G2Point& t, const G2Point& q, const G1Point& p) {
    if (t.is_infinity() || q.is_infinity()) {
        return Fp12::one();
    }
    const Fp& xp = p.x();
    const Fp& yp = p.y();

    Fp2 lambda;
    if (t.x() == q.x()) {
        if (t.y() != q.y() || t.y().is_zero()) {
            // Vertical line x = x'T
            return Fp12(Fp6(Fp2(xp, Fp::zero()), -t.x(), Fp2::zero()), Fp6::zero());
        }
        // Tangent: 3 x'^2 / 2 y', denominator checked nonzero above
        Fp2 x_sq = t.x().square();
        lambda = (x_sq.dbl() + x_sq) * t.y().dbl().inverse();
    } else {
        lambda = (q.y() - t.y()) * (q.x() - t.x()).inverse();
    }

    Fp6 c0(Fp2(yp, Fp::zero()), Fp2::zero(), Fp2::zero());
    Fp6 c1(-lambda.scale(xp), lambda * t.x() - t.y(), Fp2::zero());
    return Fp12(c0, c1);
}

/**
 * @brief Frobenius endomorphism on the twist: (conj(x) xi^((p-1)/3), conj(y) xi^((p-1)/2))
 */
G2Point twist_frobenius(const G2Point& q, const PairingContext& ctx) {
    if (q.is_infinity()) {
        return q;
    }
    return G2Point(q.x().conjugate() * ctx.twist_frobenius_x(),
                   q.y().conjugate() * ctx.twist_frobenius_y());
}

} // namespace

// ============================================================================
// Engine State
// ============================================================================

bool pairing_init() {
    return PairingContext::instance().init();
}

bool pairing_is_initialized() {
    return PairingContext::instance().is_initialized();
}

// ============================================================================
// Miller Loop
// ============================================================================

Fp12 miller_loop(const G1Point& p, const G2Point& q) {
    const PairingContext& ctx = ready_context();

    if (p.is_infinity() || q.is_infinity()) {
        return Fp12::one();
    }

    const Fe256& n = ctx.ate_loop_count();
    G2Point r = q;
    Fp12 f = Fp12::one();

    // Top bit consumed by r = q
    for (size_t i = n.bit_length() - 1; i-- > 0;) {
        f = f.square() * line_eval(r, r, p);
        r = r.dbl();
        if (n.bit(i)) {
            f = f * line_eval(r, q, p);
            r = r + q;
        }
    }

    // Correction steps with Q1 = pi(Q) and -Q2 = -pi^2(Q)
    G2Point q1 = twist_frobenius(q, ctx);
    G2Point neg_q2 = -twist_frobenius(q1, ctx);

    f = f * line_eval(r, q1, p);
    r = r + q1;
    f = f * line_eval(r, neg_q2, p);
    return f;
}

// ============================================================================
// Final Exponentiation
// ============================================================================

GTElement final_exponentiation(const Fp12& f) {
    const PairingContext& ctx = ready_context();

    // Easy part: f^(p^6 - 1), then ^(p^2 + 1)
    Fp12 t = f.conjugate() * f.inverse();
    t = t.frobenius(ctx.frobenius(2), false) * t;

    // Hard part: (p^4 - p^2 + 1) / r
    return GTElement(t.pow(ctx.final_exp_hard()));
}

GTElement pairing(const G1Point& p, const G2Point& q) {
    return final_exponentiation(miller_loop(p, q));
}

GTElement multi_pairing(const std::vector<PairingInput>& inputs) {
    Fp12 f = Fp12::one();
    for (const PairingInput& in : inputs) {
        f = f * miller_loop(in.first, in.second);
    }
    return final_exponentiation(f);
}

// ============================================================================
// Non-throwing Entry Points
// ============================================================================

bool pairing_compute(GTElement& out, const G1Point& p, const G2Point& q) {
    if (!pairing_is_initialized() || !p.is_valid() || !q.is_valid()) {
        return false;
    }
    try {
        out = pairing(p, q);
    } catch (const std::logic_error&) {
        return false;
    }
    return true;
}

bool pairing_multi(GTElement& out, const std::vector<PairingInput>& inputs) {
    if (!pairing_is_initialized()) {
        return false;
    }
    for (const PairingInput& in : inputs) {
        if (!in.first.is_valid() || !in.second.is_valid()) {
            return false;
        }
    }
    try {
        out = multi_pairing(inputs);
    } catch (const std::logic_error&) {
        return false;
    }
    return true;
}

} // namespace zkv
