/**
 * @file test_curve.cpp
 * @brief G1 / G2 group law, validation and serialization tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "zkv/ec/point.h"

using namespace zkv;

// Typed over both groups
template <typename Point>
class CurveGroupTest : public ::testing::Test {
protected:
    std::mt19937_64 rng{0xc0ffee};

    Fr random_scalar() {
        return Fr::from_integer(Fe256(rng(), rng(), rng(), rng() & 0x0fffffffffffffffULL));
    }
    Point random_point() { return Point::generator() * random_scalar(); }
};

using GroupTypes = ::testing::Types<G1Point, G2Point>;
TYPED_TEST_SUITE(CurveGroupTest, GroupTypes);

// ============================================================================
// Group Law
// ============================================================================

TYPED_TEST(CurveGroupTest, GeneratorIsValid) {
    TypeParam g = TypeParam::generator();
    EXPECT_TRUE(g.is_on_curve());
    EXPECT_TRUE(g.is_in_subgroup());
    EXPECT_FALSE(g.is_infinity());
}

TYPED_TEST(CurveGroupTest, IdentityLaws) {
    TypeParam o = TypeParam::infinity();
    TypeParam p = this->random_point();

    EXPECT_EQ(p + o, p) << "P + O != P";
    EXPECT_EQ(o + p, p) << "O + P != P";
    EXPECT_TRUE((o + o).is_infinity());
    EXPECT_TRUE((p - p).is_infinity());
    EXPECT_TRUE((p + (-p)).is_infinity());
    EXPECT_TRUE(o.is_on_curve());
    EXPECT_TRUE((-o).is_infinity());
}

TYPED_TEST(CurveGroupTest, ScalarEdgeCases) {
    TypeParam g = TypeParam::generator();

    EXPECT_TRUE(g.mul(Fe256()).is_infinity()) << "0 * G should be O";
    EXPECT_EQ(g.mul(Fe256(1)), g);
    EXPECT_EQ(g.mul(Fe256(2)), g.dbl());
    EXPECT_EQ(g.mul(Fe256(3)), g.dbl() + g);
    EXPECT_TRUE(TypeParam::infinity().mul(Fe256(7)).is_infinity());

    // r * G == O and (r - 1) * G == -G
    EXPECT_TRUE(g.mul(bn254_r()).is_infinity());
    Fe256 r_minus_1 = bn254_r();
    r_minus_1.limb[0] -= 1;
    EXPECT_EQ(g.mul(r_minus_1), -g);
}

TYPED_TEST(CurveGroupTest, DoubleMatchesAdd) {
    TypeParam p = this->random_point();
    EXPECT_EQ(p.dbl(), p + p);
    EXPECT_TRUE(p.dbl().is_on_curve());
}

TYPED_TEST(CurveGroupTest, ScalarMulIsLinear) {
    TypeParam g = TypeParam::generator();
    for (int i = 0; i < 5; ++i) {
        Fr a = this->random_scalar();
        Fr b = this->random_scalar();
        EXPECT_EQ(g * a + g * b, g * (a + b));
        EXPECT_EQ((g * a) * b, g * (a * b));
    }
}

TYPED_TEST(CurveGroupTest, AdditionAssociativeAndCommutative) {
    TypeParam p = this->random_point();
    TypeParam q = this->random_point();
    TypeParam s = this->random_point();
    EXPECT_EQ(p + q, q + p);
    EXPECT_EQ((p + q) + s, p + (q + s));
}

TYPED_TEST(CurveGroupTest, SmallMultiplesSequential) {
    TypeParam g = TypeParam::generator();
    TypeParam acc = TypeParam::infinity();
    for (uint64_t k = 1; k <= 40; ++k) {
        acc += g;
        EXPECT_EQ(g.mul(Fe256(k)), acc) << "k = " << k;
    }
}

TYPED_TEST(CurveGroupTest, BatchNormalization) {
    using Jac = typename TypeParam::Jacobian;
    std::vector<Jac> jac;
    std::vector<TypeParam> expected;
    for (int i = 0; i < 6; ++i) {
        Fr k = this->random_scalar();
        jac.push_back(scalar_mul(TypeParam::generator().to_jacobian(), k.to_integer()));
        expected.push_back(TypeParam::from_jacobian(jac.back()));
    }
    jac.push_back(Jac());
    expected.push_back(TypeParam::infinity());

    std::vector<TypeParam> out = TypeParam::batch_from_jacobian(jac);
    ASSERT_EQ(out.size(), expected.size());
    for (size_t i = 0; i < out.size(); ++i) {
        EXPECT_EQ(out[i], expected[i]);
    }
}

// ============================================================================
// Serialization
// ============================================================================

TYPED_TEST(CurveGroupTest, BytesRoundTrip) {
    TypeParam p = this->random_point();
    ByteVec bytes = p.to_bytes();
    EXPECT_EQ(bytes.size(), TypeParam::kEncodedSize);
    EXPECT_EQ(TypeParam::from_bytes(bytes), p);

    ByteVec zeros = TypeParam::infinity().to_bytes();
    for (uint8_t b : zeros) {
        EXPECT_EQ(b, 0);
    }
    EXPECT_TRUE(TypeParam::from_bytes(zeros).is_infinity());
}

TYPED_TEST(CurveGroupTest, BytesLengthChecked) {
    ByteVec short_data(TypeParam::kEncodedSize - 1, 0);
    EXPECT_THROW(TypeParam::from_bytes(short_data), std::invalid_argument);
}

// ============================================================================
// G1 Specific
// ============================================================================

TEST(G1Test, GeneratorEncoding) {
    ByteVec bytes = G1Point::generator().to_bytes();
    EXPECT_EQ(bytes[31], 1);
    EXPECT_EQ(bytes[63], 2);
}

TEST(G1Test, OffCurvePointRejected) {
    G1Point bad(Fp::from_u64(1), Fp::from_u64(3));
    EXPECT_FALSE(bad.is_on_curve());
    EXPECT_FALSE(bad.is_valid());
}

TEST(G1Test, NonCanonicalCoordinateRejected) {
    ByteVec data(64, 0xff);
    EXPECT_THROW(G1Point::from_bytes(data), std::invalid_argument);
}

TEST(G1Test, DecodeDoesNotCheckCurve) {
    ByteVec data(64, 0);
    data[31] = 1;
    data[63] = 3;
    G1Point p = G1Point::from_bytes(data);
    EXPECT_FALSE(p.is_infinity());
    EXPECT_FALSE(p.is_on_curve());
}

// ============================================================================
// G2 Specific
// ============================================================================

TEST(G2Test, TwistCoefficient) {
    // b' = 3 / (9 + u)
    EXPECT_EQ(G2Curve::b() * Fp2::xi(), Fp2(Fp::from_u64(3), Fp::zero()));
}

TEST(G2Test, EncodingPutsImaginaryPartFirst) {
    G2Point g = G2Point::generator();
    ByteVec bytes = g.to_bytes();
    FieldBytes x_im = g.x().c1.to_bytes();
    FieldBytes x_re = g.x().c0.to_bytes();
    EXPECT_TRUE(std::equal(x_im.begin(), x_im.end(), bytes.begin()));
    EXPECT_TRUE(std::equal(x_re.begin(), x_re.end(), bytes.begin() + 32));
}

TEST(G2Test, PointOutsideSubgroupRejected) {
    // (1, y) lies on the twist but outside the order-r subgroup
    G2Point q(Fp2(Fp::from_u64(1), Fp::zero()),
              Fp2(Fp::from_hex("2869111d5381f072f8e2728fdb825a51aadd70e52c9830e9ab4b871c0531f1bb"),
                  Fp::from_hex("0d1271953ed9ea0836846e70a1934187998c7f790cb4d7511b7f8da82de048a4")));
    EXPECT_TRUE(q.is_on_curve());
    EXPECT_FALSE(q.is_in_subgroup());
    EXPECT_FALSE(q.is_valid());
}

TEST(G2Test, OffCurvePointRejected) {
    G2Point g = G2Point::generator();
    G2Point bad(g.x() + Fp2::one(), g.y());
    EXPECT_FALSE(bad.is_on_curve());
    EXPECT_FALSE(bad.is_valid());
}
