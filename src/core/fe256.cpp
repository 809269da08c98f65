/**
 * @file fe256.cpp
 * @brief 256-bit Integer and Montgomery Arithmetic Implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/core/fe256.h"

namespace zkv {

using namespace fe256_ops;

bool Fe256::ct_less_than(const Fe256& other) const {
    Fe256 tmp;
    return fe256_sub(&tmp, this, &other) != 0;
}

namespace {

/**
 * @brief r = (hi:t) - p if (hi:t) >= p, else t. Requires (hi:t) < 2p.
 */
inline void select_reduced(Fe256* r, const Fe256& t, uint64_t hi, const Fe256& p) {
    Fe256 d;
    uint64_t borrow = fe256_sub(&d, &t, &p);
    // Keep t only when the subtraction borrowed and there is no high word
    bool keep = (borrow & ~hi & 1) != 0;
    d.ct_cmov(t, keep);
    *r = d;
}

} // namespace

// ============================================================================
// Montgomery Context
// ============================================================================

Fe256MontContext::Fe256MontContext(const Fe256& prime) : p(prime) {
    // Newton iteration for p^(-1) mod 2^64: p0 * p0 = 1 mod 8 for odd p0,
    // each step doubles the number of correct low bits.
    uint64_t inv = p.limb[0];
    for (int i = 0; i < 5; ++i) {
        inv *= 2 - p.limb[0] * inv;
    }
    n0 = 0 - inv;

    // R mod p and R^2 mod p by repeated modular doubling of 1
    Fe256 x(1);
    for (int i = 0; i < 512; ++i) {
        Fe256 sum;
        uint64_t carry = fe256_add(&sum, &x, &x);
        select_reduced(&x, sum, carry, p);
        if (i == 255) {
            r1 = x;
        }
    }
    r2 = x;
}

void Fe256MontContext::to_montgomery(Fe256* r, const Fe256* a) const {
    // r = a * R^2 * R^(-1) = a * R
    mul(r, a, &r2);
}

void Fe256MontContext::from_montgomery(Fe256* r, const Fe256* a) const {
    // r = a * 1 * R^(-1) = a / R
    Fe256 one(1);
    mul(r, a, &one);
}

void Fe256MontContext::mul(Fe256* r, const Fe256* a, const Fe256* b) const {
    // CIOS (Coarsely Integrated Operand Scanning)
    uint64_t t[6] = {0, 0, 0, 0, 0, 0};

    for (int i = 0; i < 4; ++i) {
        // Multiply step: t += a * b[i]
        uint64_t c = 0;
        for (int j = 0; j < 4; ++j) {
            t[j] = mac64(a->limb[j], b->limb[i], t[j], c, &c);
        }
        uint64_t carry;
        t[4] = adc64(t[4], c, 0, &carry);
        t[5] = carry;

        // Reduce step: m = t[0] * n0 mod 2^64, t = (t + m * p) / 2^64
        uint64_t m = t[0] * n0;
        mac64(m, p.limb[0], t[0], 0, &c);
        for (int j = 1; j < 4; ++j) {
            t[j - 1] = mac64(m, p.limb[j], t[j], c, &c);
        }
        t[3] = adc64(t[4], c, 0, &carry);
        t[4] = t[5] + carry;
    }

    Fe256 res(t[0], t[1], t[2], t[3]);
    select_reduced(r, res, t[4], p);
}

void Fe256MontContext::add_mod(Fe256* r, const Fe256* a, const Fe256* b) const {
    Fe256 sum;
    uint64_t carry = fe256_add(&sum, a, b);
    select_reduced(r, sum, carry, p);
}

void Fe256MontContext::sub_mod(Fe256* r, const Fe256* a, const Fe256* b) const {
    Fe256 diff;
    uint64_t borrow = fe256_sub(&diff, a, b);
    // Add p back under a mask when the subtraction wrapped
    uint64_t mask = 0 - borrow;
    Fe256 corr(p.limb[0] & mask, p.limb[1] & mask, p.limb[2] & mask, p.limb[3] & mask);
    fe256_add(r, &diff, &corr);
}

void Fe256MontContext::neg_mod(Fe256* r, const Fe256* a) const {
    Fe256 zero;
    sub_mod(r, &zero, a);
}

void Fe256MontContext::reduce(Fe256* r, const Fe256* a) const {
    // 2^256 < 6p for the BN254 primes: five subtractions bring any value below p
    Fe256 x = *a;
    for (int i = 0; i < 5; ++i) {
        select_reduced(&x, x, 0, p);
    }
    *r = x;
}

void Fe256MontContext::pow(Fe256* r, const Fe256* base, const Fe256* exp) const {
    Fe256 acc = r1;
    for (int i = 255; i >= 0; --i) {
        sqr(&acc, &acc);
        Fe256 prod;
        mul(&prod, &acc, base);
        acc.ct_cmov(prod, exp->bit(static_cast<size_t>(i)));
    }
    *r = acc;
}

void Fe256MontContext::inv(Fe256* r, const Fe256* a) const {
    // a^(-1) = a^(p-2) mod p
    Fe256 two(2);
    Fe256 p_minus_2;
    fe256_sub(&p_minus_2, &p, &two);
    pow(r, a, &p_minus_2);
}

} // namespace zkv
