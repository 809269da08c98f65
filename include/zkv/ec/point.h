/**
 * @file point.h
 * @brief Affine G1/G2 points with an explicit point at infinity
 *
 * AffinePoint<Curve> is the value type exchanged between the group,
 * pairing and Groth16 layers. The same algorithms serve G1 (over Fp)
 * and G2 (over Fp2); scalar multiplication runs internally in Jacobian
 * coordinates.
 *
 * Invariant: a point constructed from outside the engine is NOT trusted.
 * Callers must check is_on_curve() and is_in_subgroup() (or is_valid())
 * before the point enters a pairing.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_EC_POINT_H
#define ZKV_EC_POINT_H

#include "zkv/ec/curve.h"
#include "zkv/ec/jacobian.h"

#include <cstring>
#include <string>
#include <vector>

namespace zkv {

template <typename Curve>
class AffinePoint {
public:
    using Field = typename Curve::Field;
    using Jacobian = JacobianPoint<Field>;

    static constexpr size_t kEncodedSize = Curve::kEncodedSize;

    /**
     * @brief Point at infinity
     */
    AffinePoint() : x_(), y_(), infinity_(true) {}

    /**
     * @brief Point from coordinates; no curve membership check
     */
    AffinePoint(const Field& x, const Field& y) : x_(x), y_(y), infinity_(false) {}

    static AffinePoint infinity() { return AffinePoint(); }

    static AffinePoint generator() {
        return AffinePoint(Curve::generator_x(), Curve::generator_y());
    }

    void set_infinity() {
        x_ = Field();
        y_ = Field();
        infinity_ = true;
    }

    bool is_infinity() const { return infinity_; }

    const Field& x() const { return x_; }
    const Field& y() const { return y_; }

    // ========================================================================
    // Validity
    // ========================================================================

    /**
     * @brief y^2 == x^3 + b (infinity is on the curve)
     */
    bool is_on_curve() const {
        if (infinity_) {
            return true;
        }
        return y_.square() == x_.square() * x_ + Curve::b();
    }

    /**
     * @brief Membership in the order-r subgroup, assuming is_on_curve()
     *
     * G1 has cofactor 1, so every curve point qualifies. For G2 the check
     * is r * Q == O.
     */
    bool is_in_subgroup() const {
        if (infinity_) {
            return true;
        }
        if (Curve::kCofactorOne) {
            return is_on_curve();
        }
        return mul(bn254_r()).is_infinity();
    }

    bool is_valid() const { return is_on_curve() && is_in_subgroup(); }

    // ========================================================================
    // Group Law
    // ========================================================================

    AffinePoint operator+(const AffinePoint& o) const {
        if (infinity_) {
            return o;
        }
        if (o.infinity_) {
            return *this;
        }
        if (x_ == o.x_) {
            // Same x: either P == Q (tangent) or P == -Q (vertical)
            if (y_ == o.y_) {
                return dbl();
            }
            return AffinePoint();
        }
        Field lambda = (o.y_ - y_) * (o.x_ - x_).inverse();
        Field x3 = lambda.square() - x_ - o.x_;
        Field y3 = lambda * (x_ - x3) - y_;
        return AffinePoint(x3, y3);
    }

    AffinePoint operator-() const {
        if (infinity_) {
            return AffinePoint();
        }
        return AffinePoint(x_, -y_);
    }

    AffinePoint operator-(const AffinePoint& o) const { return *this + (-o); }

    AffinePoint& operator+=(const AffinePoint& o) { return *this = *this + o; }

    AffinePoint dbl() const {
        // 2-torsion (y = 0) has a vertical tangent
        if (infinity_ || y_.is_zero()) {
            return AffinePoint();
        }
        Field x_sq = x_.square();
        Field lambda = (x_sq.dbl() + x_sq) * y_.dbl().inverse();
        Field x3 = lambda.square() - x_.dbl();
        Field y3 = lambda * (x_ - x3) - y_;
        return AffinePoint(x3, y3);
    }

    /**
     * @brief k * P for a plain 256-bit integer k
     */
    AffinePoint mul(const Fe256& k) const {
        if (infinity_) {
            return AffinePoint();
        }
        return from_jacobian(scalar_mul(to_jacobian(), k));
    }

    AffinePoint operator*(const Fr& k) const { return mul(k.to_integer()); }

    bool operator==(const AffinePoint& o) const {
        if (infinity_ || o.infinity_) {
            return infinity_ == o.infinity_;
        }
        return x_ == o.x_ && y_ == o.y_;
    }

    bool operator!=(const AffinePoint& o) const { return !(*this == o); }

    // ========================================================================
    // Jacobian Conversion
    // ========================================================================

    Jacobian to_jacobian() const {
        if (infinity_) {
            return Jacobian();
        }
        return Jacobian::from_affine(x_, y_);
    }

    static AffinePoint from_jacobian(const Jacobian& p) {
        Field x, y;
        if (!p.to_affine(x, y)) {
            return AffinePoint();
        }
        return AffinePoint(x, y);
    }

    /**
     * @brief Normalize many points with one field inversion
     */
    static std::vector<AffinePoint> batch_from_jacobian(const std::vector<Jacobian>& pts) {
        std::vector<Field> zs;
        zs.reserve(pts.size());
        for (const Jacobian& p : pts) {
            if (!p.is_infinity()) {
                zs.push_back(p.Z);
            }
        }
        batch_invert(zs);

        std::vector<AffinePoint> out;
        out.reserve(pts.size());
        size_t next = 0;
        for (const Jacobian& p : pts) {
            if (p.is_infinity()) {
                out.push_back(AffinePoint());
                continue;
            }
            const Field& z_inv = zs[next++];
            Field z_inv_sq = z_inv.square();
            out.push_back(AffinePoint(p.X * z_inv_sq, p.Y * z_inv_sq * z_inv));
        }
        return out;
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /**
     * @brief Uncompressed big-endian x || y; infinity encodes as all zeros
     */
    void to_bytes(uint8_t* out) const {
        if (infinity_) {
            std::memset(out, 0, kEncodedSize);
            return;
        }
        Curve::encode(x_, out);
        Curve::encode(y_, out + kEncodedSize / 2);
    }

    ByteVec to_bytes() const {
        ByteVec out(kEncodedSize);
        to_bytes(out.data());
        return out;
    }

    /**
     * @brief Decode kEncodedSize bytes; curve membership is NOT checked
     * @throws std::invalid_argument for non-canonical coordinates
     */
    static AffinePoint from_bytes(const uint8_t* in) {
        bool all_zero = true;
        for (size_t i = 0; i < kEncodedSize; ++i) {
            all_zero = all_zero && in[i] == 0;
        }
        if (all_zero) {
            return AffinePoint();
        }
        return AffinePoint(Curve::decode(in), Curve::decode(in + kEncodedSize / 2));
    }

    /**
     * @throws std::invalid_argument on wrong length or non-canonical coordinates
     */
    static AffinePoint from_bytes(const ByteVec& data) {
        if (data.size() != kEncodedSize) {
            throw std::invalid_argument(std::string("Invalid ") + Curve::name() +
                                        " point data length");
        }
        return from_bytes(data.data());
    }

private:
    Field x_;
    Field y_;
    bool infinity_;
};

using G1Point = AffinePoint<G1Curve>;
using G2Point = AffinePoint<G2Curve>;

} // namespace zkv

#endif // ZKV_EC_POINT_H
