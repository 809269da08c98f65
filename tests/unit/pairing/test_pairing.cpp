/**
 * @file test_pairing.cpp
 * @brief Optimal ate pairing tests: initialization, degeneracy, bilinearity
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>

#include <random>
#include <thread>
#include <vector>

#include "zkv/pairing/pairing.h"
#include "zkv/pairing/pairing_context.h"

using namespace zkv;

class PairingTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ASSERT_TRUE(pairing_init());
    }

    std::mt19937_64 rng{0xbeef};

    uint64_t small_scalar() { return 2 + rng() % 7; }
};

// ============================================================================
// Engine State
// ============================================================================

TEST_F(PairingTest, InitIsIdempotent) {
    EXPECT_TRUE(pairing_is_initialized());
    EXPECT_TRUE(pairing_init());
    EXPECT_TRUE(pairing_init());
    EXPECT_TRUE(pairing_is_initialized());
}

TEST_F(PairingTest, ConcurrentInit) {
    std::vector<std::thread> workers;
    std::vector<int> results(8, 0);
    for (size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&results, i]() { results[i] = pairing_init() ? 1 : 0; });
    }
    for (std::thread& t : workers) {
        t.join();
    }
    for (int r : results) {
        EXPECT_EQ(r, 1);
    }
}

TEST_F(PairingTest, DerivedConstants) {
    const PairingContext& ctx = PairingContext::instance();

    // 6x + 2 = 0x19d797039be763ba8
    Fe256 expected(0x9d797039be763ba8ULL, 0x1ULL, 0, 0);
    EXPECT_EQ(ctx.ate_loop_count(), expected);
    EXPECT_EQ(ctx.ate_loop_count().bit_length(), 65u);

    // gamma_{n,0} = xi^0 = 1
    for (int n = 1; n <= 3; ++n) {
        EXPECT_TRUE(ctx.frobenius(n)[0].is_one());
    }
    EXPECT_EQ(ctx.twist_frobenius_x(), ctx.frobenius(1)[2]);
    EXPECT_EQ(ctx.twist_frobenius_y(), ctx.frobenius(1)[3]);
}

// ============================================================================
// Degeneracy
// ============================================================================

TEST_F(PairingTest, InfinityGivesIdentity) {
    GTElement e;

    ASSERT_TRUE(pairing_compute(e, G1Point::infinity(), G2Point::generator()));
    EXPECT_TRUE(e.is_one()) << "e(O, Q) must be 1";

    ASSERT_TRUE(pairing_compute(e, G1Point::generator(), G2Point::infinity()));
    EXPECT_TRUE(e.is_one()) << "e(P, O) must be 1";

    ASSERT_TRUE(pairing_compute(e, G1Point::infinity(), G2Point::infinity()));
    EXPECT_TRUE(e.is_one());
}

TEST_F(PairingTest, NonDegenerate) {
    GTElement e = pairing(G1Point::generator(), G2Point::generator());
    EXPECT_FALSE(e.is_one());
}

TEST_F(PairingTest, ResultHasOrderR) {
    GTElement e = pairing(G1Point::generator(), G2Point::generator());
    EXPECT_TRUE(e.value().pow({bn254_r().limb[0], bn254_r().limb[1],
                               bn254_r().limb[2], bn254_r().limb[3]}).is_one());
}

TEST_F(PairingTest, OffCurveInputRejected) {
    GTElement e;
    G1Point bad(Fp::from_u64(1), Fp::from_u64(3));
    EXPECT_FALSE(pairing_compute(e, bad, G2Point::generator()));

    G2Point g = G2Point::generator();
    G2Point bad2(g.x(), g.y() + Fp2::one());
    EXPECT_FALSE(pairing_compute(e, G1Point::generator(), bad2));
}

TEST_F(PairingTest, PointOutsideSubgroupRejected) {
    G2Point q(Fp2(Fp::from_u64(1), Fp::zero()),
              Fp2(Fp::from_hex("2869111d5381f072f8e2728fdb825a51aadd70e52c9830e9ab4b871c0531f1bb"),
                  Fp::from_hex("0d1271953ed9ea0836846e70a1934187998c7f790cb4d7511b7f8da82de048a4")));
    ASSERT_TRUE(q.is_on_curve());

    GTElement e;
    EXPECT_FALSE(pairing_compute(e, G1Point::generator(), q));

    std::vector<PairingInput> inputs = {
        {G1Point::generator(), G2Point::generator()},
        {G1Point::generator(), q},
    };
    EXPECT_FALSE(pairing_multi(e, inputs));
}

// ============================================================================
// Bilinearity
// ============================================================================

TEST_F(PairingTest, BilinearInFirstArgument) {
    G1Point p = G1Point::generator();
    G2Point q = G2Point::generator();
    GTElement base = pairing(p, q);

    uint64_t a = small_scalar();
    GTElement expected;
    for (uint64_t i = 0; i < a; ++i) {
        expected *= base;
    }
    EXPECT_EQ(pairing(p.mul(Fe256(a)), q), expected) << "a = " << a;
}

TEST_F(PairingTest, BilinearInSecondArgument) {
    G1Point p = G1Point::generator();
    G2Point q = G2Point::generator();
    GTElement base = pairing(p, q);

    uint64_t b = small_scalar();
    GTElement expected;
    for (uint64_t i = 0; i < b; ++i) {
        expected *= base;
    }
    EXPECT_EQ(pairing(p, q.mul(Fe256(b))), expected) << "b = " << b;
}

TEST_F(PairingTest, BilinearSpotCheck) {
    // e(aP, bQ) == e(P, Q)^(ab) by repeated GT multiplication
    G1Point p = G1Point::generator().mul(Fe256(rng()));
    G2Point q = G2Point::generator().mul(Fe256(rng()));
    uint64_t a = small_scalar();
    uint64_t b = small_scalar();

    GTElement base = pairing(p, q);
    GTElement expected;
    for (uint64_t i = 0; i < a * b; ++i) {
        expected *= base;
    }
    EXPECT_EQ(pairing(p.mul(Fe256(a)), q.mul(Fe256(b))), expected);
}

TEST_F(PairingTest, LargeScalarsSwap) {
    // e(kP, Q) == e(P, kQ) for a full-width k
    Fr k = Fr::from_integer(Fe256(rng(), rng(), rng(), rng() & 0x0fffffffffffffffULL));
    G1Point p = G1Point::generator();
    G2Point q = G2Point::generator();
    EXPECT_EQ(pairing(p * k, q), pairing(p, q * k));
}

TEST_F(PairingTest, NegationInverts) {
    G1Point p = G1Point::generator();
    G2Point q = G2Point::generator();
    EXPECT_TRUE((pairing(p, q) * pairing(-p, q)).is_one());
    EXPECT_EQ(pairing(-p, q), pairing(p, -q));
}

// ============================================================================
// Multi-pairing
// ============================================================================

TEST_F(PairingTest, MultiPairingMatchesProduct) {
    G1Point p1 = G1Point::generator().mul(Fe256(5));
    G1Point p2 = G1Point::generator().mul(Fe256(11));
    G2Point q1 = G2Point::generator();
    G2Point q2 = G2Point::generator().mul(Fe256(3));

    GTElement product = pairing(p1, q1) * pairing(p2, q2);
    GTElement combined = multi_pairing({{p1, q1}, {p2, q2}});
    EXPECT_EQ(combined, product);

    GTElement checked;
    ASSERT_TRUE(pairing_multi(checked, {{p1, q1}, {p2, q2}}));
    EXPECT_EQ(checked, product);
}

TEST_F(PairingTest, MultiPairingCancels) {
    // e(3P, Q) * e(-P, 3Q) == 1
    G1Point p = G1Point::generator();
    G2Point q = G2Point::generator();
    EXPECT_TRUE(multi_pairing({{p.mul(Fe256(3)), q}, {-p, q.mul(Fe256(3))}}).is_one());
}

TEST_F(PairingTest, EmptyMultiPairingIsIdentity) {
    EXPECT_TRUE(multi_pairing({}).is_one());
}

TEST_F(PairingTest, GTEncodingSize) {
    uint8_t out[384];
    GTElement::one().to_bytes(out);
    EXPECT_EQ(out[31], 1);
    for (size_t i = 32; i < 384; ++i) {
        EXPECT_EQ(out[i], 0) << "byte " << i;
    }
}
