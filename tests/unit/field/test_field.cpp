/**
 * @file test_field.cpp
 * @brief Prime field unit tests (Fp, Fr, Montgomery core)
 *
 * Products and inverses are checked against GMP on random operands.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <gmp.h>

#include <random>
#include <vector>

#include "zkv/field/fp.h"
#include "zkv/internal/gmp_bridge.h"

using namespace zkv;
using zkv::internal::wrapped_mpz;

namespace {

const char* kPHex = "30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47";
const char* kRHex = "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001";

class FieldTest : public ::testing::Test {
protected:
    std::mt19937_64 rng{0x5eed2026};

    // Uniform below 2^252, hence below both p and r
    Fe256 random_int() {
        Fe256 v(rng(), rng(), rng(), rng() & 0x0fffffffffffffffULL);
        return v;
    }

    Fp random_fp() { return Fp::from_integer(random_int()); }
};

void mpz_from(mpz_t out, const Fe256& v) {
    internal::mpz_set_fe256(out, v);
}

} // namespace

// ============================================================================
// Montgomery Core
// ============================================================================

TEST_F(FieldTest, ConstantsMatchKnownModuli) {
    EXPECT_EQ(Fp::modulus(), bn254_p());
    EXPECT_EQ(Fr::modulus(), bn254_r());

    Fp minus_one = -Fp::one();
    Fe256 p_minus_1 = bn254_p();
    p_minus_1.limb[0] -= 1;
    EXPECT_EQ(minus_one.to_integer(), p_minus_1);
}

TEST_F(FieldTest, MulMatchesGmp) {
    wrapped_mpz p, a, b, prod;
    mpz_from(p.body, bn254_p());

    for (int i = 0; i < 200; ++i) {
        Fe256 x = random_int();
        Fe256 y = random_int();
        Fp fx = Fp::from_integer(x);
        Fp fy = Fp::from_integer(y);

        mpz_from(a.body, x);
        mpz_from(b.body, y);
        mpz_mul(prod.body, a.body, b.body);
        mpz_mod(prod.body, prod.body, p.body);

        EXPECT_EQ((fx * fy).to_integer(), internal::fe256_from_mpz(prod.body))
            << "mismatch at iteration " << i;
    }
}

TEST_F(FieldTest, AddSubMatchGmp) {
    wrapped_mpz p, a, b, sum, diff;
    mpz_from(p.body, bn254_p());

    for (int i = 0; i < 100; ++i) {
        Fe256 x = random_int();
        Fe256 y = random_int();
        mpz_from(a.body, x);
        mpz_from(b.body, y);

        mpz_add(sum.body, a.body, b.body);
        mpz_mod(sum.body, sum.body, p.body);
        mpz_sub(diff.body, a.body, b.body);
        mpz_mod(diff.body, diff.body, p.body);

        Fp fx = Fp::from_integer(x);
        Fp fy = Fp::from_integer(y);
        EXPECT_EQ((fx + fy).to_integer(), internal::fe256_from_mpz(sum.body));
        EXPECT_EQ((fx - fy).to_integer(), internal::fe256_from_mpz(diff.body));
    }
}

TEST_F(FieldTest, EdgeValues) {
    Fp zero = Fp::zero();
    Fp one = Fp::one();
    Fp minus_one = -one;

    EXPECT_TRUE(zero.is_zero());
    EXPECT_TRUE(one.is_one());
    EXPECT_TRUE((minus_one + one).is_zero());
    EXPECT_TRUE((minus_one * minus_one).is_one());
    EXPECT_TRUE((-zero).is_zero());
    EXPECT_TRUE((zero * minus_one).is_zero());
    EXPECT_EQ(minus_one.inverse(), minus_one);
    EXPECT_EQ(one.inverse(), one);
}

TEST_F(FieldTest, SquareEqualsSelfProduct) {
    for (int i = 0; i < 50; ++i) {
        Fp a = random_fp();
        EXPECT_EQ(a.square(), a * a);
        EXPECT_EQ(a.dbl(), a + a);
    }
}

// ============================================================================
// Inversion
// ============================================================================

TEST_F(FieldTest, InverseIdentity) {
    for (int i = 0; i < 100; ++i) {
        Fp a = random_fp();
        if (a.is_zero()) {
            continue;
        }
        EXPECT_TRUE((a * a.inverse()).is_one()) << "a * a^-1 != 1 for " << a.to_hex();
    }
}

TEST_F(FieldTest, InverseMatchesGmp) {
    wrapped_mpz p, a, inv;
    mpz_from(p.body, bn254_p());
    for (int i = 0; i < 20; ++i) {
        Fe256 x = random_int();
        if (x.is_zero()) {
            continue;
        }
        mpz_from(a.body, x);
        ASSERT_NE(mpz_invert(inv.body, a.body, p.body), 0);
        EXPECT_EQ(Fp::from_integer(x).inverse().to_integer(), internal::fe256_from_mpz(inv.body));
    }
}

TEST_F(FieldTest, InverseOfZeroThrows) {
    EXPECT_THROW(Fp::zero().inverse(), std::domain_error);
    EXPECT_THROW(Fr::zero().inverse(), std::domain_error);
}

TEST_F(FieldTest, PowFermat) {
    // a^(p-1) == 1
    Fe256 e = bn254_p();
    e.limb[0] -= 1;
    for (int i = 0; i < 5; ++i) {
        Fp a = random_fp();
        EXPECT_TRUE(a.pow(e).is_one());
    }
    EXPECT_TRUE(random_fp().pow(Fe256()).is_one());
}

TEST_F(FieldTest, BatchInvert) {
    std::vector<Fp> elems;
    for (int i = 0; i < 17; ++i) {
        elems.push_back(Fp::from_u64(static_cast<uint64_t>(i) + 1) * random_fp() + Fp::one());
    }
    std::vector<Fp> original = elems;
    batch_invert(elems);
    for (size_t i = 0; i < elems.size(); ++i) {
        EXPECT_EQ(elems[i], original[i].inverse());
    }

    std::vector<Fp> with_zero = {Fp::one(), Fp::zero(), Fp::from_u64(5)};
    EXPECT_THROW(batch_invert(with_zero), std::domain_error);

    std::vector<Fp> empty;
    EXPECT_NO_THROW(batch_invert(empty));
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(FieldTest, CanonicalRoundTrip) {
    for (int i = 0; i < 50; ++i) {
        Fp a = random_fp();
        FieldBytes bytes = a.to_bytes();
        EXPECT_EQ(Fp::from_bytes_be(bytes.data()), a);
        EXPECT_EQ(Fp::from_integer(a.to_integer()), a);
        EXPECT_EQ(Fp::from_hex(a.to_hex()), a);
    }
}

TEST_F(FieldTest, NonCanonicalRejected) {
    EXPECT_THROW(Fp::from_hex(kPHex), std::invalid_argument);
    EXPECT_THROW(Fr::from_hex(kRHex), std::invalid_argument);
    EXPECT_THROW(Fp::from_integer(bn254_p()), std::invalid_argument);

    // r < p, so r is a valid Fp element but not a valid Fr element
    EXPECT_NO_THROW(Fp::from_hex(kRHex));

    uint8_t all_ff[32];
    std::memset(all_ff, 0xff, sizeof(all_ff));
    EXPECT_THROW(Fp::from_bytes_be(all_ff), std::invalid_argument);

    EXPECT_THROW(Fp::from_hex("0xzz"), std::invalid_argument);
}

TEST_F(FieldTest, ReduceWrapsModulus) {
    Fe256 p_plus_5 = bn254_p();
    p_plus_5.limb[0] += 5;
    EXPECT_EQ(Fp::reduce(p_plus_5), Fp::from_u64(5));

    Fe256 max(~0ULL, ~0ULL, ~0ULL, ~0ULL);
    wrapped_mpz m, p, rem;
    mpz_from(m.body, max);
    mpz_from(p.body, bn254_p());
    mpz_mod(rem.body, m.body, p.body);
    EXPECT_EQ(Fp::reduce(max).to_integer(), internal::fe256_from_mpz(rem.body));
}

TEST_F(FieldTest, ReduceKeepsCanonicalValues) {
    EXPECT_EQ(Fp::reduce(Fe256(7)), Fp::from_u64(7));
    EXPECT_EQ(Fp::reduce(Fe256()), Fp::zero());
    EXPECT_EQ(Fr::reduce(Fe256(7)), Fr::from_u64(7));

    Fe256 p_minus_1 = bn254_p();
    p_minus_1.limb[0] -= 1;
    EXPECT_EQ(Fp::reduce(p_minus_1).to_integer(), p_minus_1);
    EXPECT_TRUE(Fp::reduce(bn254_p()).is_zero());

    wrapped_mpz m, p, rem;
    mpz_from(p.body, bn254_p());
    for (int i = 0; i < 64; ++i) {
        Fe256 v(rng(), rng(), rng(), rng());
        mpz_from(m.body, v);
        mpz_mod(rem.body, m.body, p.body);
        EXPECT_EQ(Fp::reduce(v).to_integer(), internal::fe256_from_mpz(rem.body));
    }
}

TEST_F(FieldTest, HexShortForm) {
    EXPECT_EQ(Fp::from_hex("0x9"), Fp::from_u64(9));
    EXPECT_EQ(Fp::from_hex("123"), Fp::from_u64(0x123));
    EXPECT_EQ(Fp::from_u64(0xab).to_hex(),
              "00000000000000000000000000000000000000000000000000000000000000ab");
}

// ============================================================================
// Scalar Field
// ============================================================================

TEST_F(FieldTest, ScalarFieldArithmetic) {
    wrapped_mpz r, a, b, prod;
    mpz_from(r.body, bn254_r());

    for (int i = 0; i < 50; ++i) {
        Fe256 x = random_int();
        Fe256 y = random_int();
        mpz_from(a.body, x);
        mpz_from(b.body, y);
        mpz_mul(prod.body, a.body, b.body);
        mpz_mod(prod.body, prod.body, r.body);
        EXPECT_EQ((Fr::from_integer(x) * Fr::from_integer(y)).to_integer(),
                  internal::fe256_from_mpz(prod.body));
    }

    Fr minus_one = -Fr::one();
    EXPECT_TRUE((minus_one + Fr::one()).is_zero());
}
