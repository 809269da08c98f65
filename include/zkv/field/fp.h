/**
 * @file fp.h
 * @brief Prime Field Elements for BN254 (base field Fp, scalar field Fr)
 *
 * PrimeField<Tag> is a value type holding one fully reduced residue in
 * Montgomery form. The limb layout never leaks through the interface:
 * conversion goes through canonical big-endian bytes or Fe256 integers.
 *
 * Contracts:
 * - Every operation accepts and returns elements in [0, modulus)
 * - inverse() of zero throws std::domain_error
 * - Non-canonical encodings (value >= modulus) throw std::invalid_argument
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_FIELD_FP_H
#define ZKV_FIELD_FP_H

#include "zkv/core/fe256.h"
#include "zkv/core/types.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace zkv {

// ============================================================================
// Field Tags
// ============================================================================

/**
 * @brief BN254 base field, modulus p
 */
struct FpTag {
    static const Fe256MontContext& context();
    static const char* name() { return "Fp"; }
};

/**
 * @brief BN254 scalar field, modulus r (order of G1, G2 and GT)
 */
struct FrTag {
    static const Fe256MontContext& context();
    static const char* name() { return "Fr"; }
};

// ============================================================================
// PrimeField
// ============================================================================

template <typename Tag>
class PrimeField {
public:
    /**
     * @brief Zero element
     */
    PrimeField() : mont_() {}

    static PrimeField zero() { return PrimeField(); }

    static PrimeField one() {
        PrimeField r;
        r.mont_ = ctx().r1;
        return r;
    }

    static PrimeField from_u64(uint64_t v) {
        return from_integer_unchecked(Fe256(v));
    }

    /**
     * @brief Canonical integer to field element
     * @throws std::invalid_argument if v >= modulus
     */
    static PrimeField from_integer(const Fe256& v) {
        if (!(v < ctx().p)) {
            throw std::invalid_argument(std::string(Tag::name()) + ": integer not below modulus");
        }
        return from_integer_unchecked(v);
    }

    /**
     * @brief Arbitrary 256-bit integer reduced into [0, modulus)
     */
    static PrimeField reduce(const Fe256& v) {
        Fe256 t;
        ctx().reduce(&t, &v);
        return from_integer_unchecked(t);
    }

    /**
     * @brief Decode 32 big-endian bytes
     * @throws std::invalid_argument if the encoded value is not canonical
     */
    static PrimeField from_bytes_be(const uint8_t in[32]) {
        Fe256 v;
        v.from_bytes_be(in);
        return from_integer(v);
    }

    /**
     * @brief Decode a big-endian hex string (optional 0x prefix, at most 64 digits)
     * @throws std::invalid_argument on malformed or non-canonical input
     */
    static PrimeField from_hex(const std::string& hex);

    static const Fe256& modulus() { return ctx().p; }

    /**
     * @brief Canonical integer value in [0, modulus)
     */
    Fe256 to_integer() const {
        Fe256 v;
        ctx().from_montgomery(&v, &mont_);
        return v;
    }

    void to_bytes_be(uint8_t out[32]) const { to_integer().to_bytes_be(out); }

    FieldBytes to_bytes() const {
        FieldBytes out;
        to_bytes_be(out.data());
        return out;
    }

    std::string to_hex() const;

    bool is_zero() const { return mont_.is_zero(); }
    bool is_one() const { return mont_ == ctx().r1; }

    // ========================================================================
    // Arithmetic
    // ========================================================================

    PrimeField operator+(const PrimeField& o) const {
        PrimeField r;
        ctx().add_mod(&r.mont_, &mont_, &o.mont_);
        return r;
    }

    PrimeField operator-(const PrimeField& o) const {
        PrimeField r;
        ctx().sub_mod(&r.mont_, &mont_, &o.mont_);
        return r;
    }

    PrimeField operator-() const {
        PrimeField r;
        ctx().neg_mod(&r.mont_, &mont_);
        return r;
    }

    PrimeField operator*(const PrimeField& o) const {
        PrimeField r;
        ctx().mul(&r.mont_, &mont_, &o.mont_);
        return r;
    }

    PrimeField& operator+=(const PrimeField& o) { return *this = *this + o; }
    PrimeField& operator-=(const PrimeField& o) { return *this = *this - o; }
    PrimeField& operator*=(const PrimeField& o) { return *this = *this * o; }

    PrimeField square() const {
        PrimeField r;
        ctx().sqr(&r.mont_, &mont_);
        return r;
    }

    PrimeField dbl() const { return *this + *this; }

    /**
     * @brief Multiplicative inverse
     * @throws std::domain_error for zero
     */
    PrimeField inverse() const {
        if (is_zero()) {
            throw std::domain_error(std::string(Tag::name()) + ": inverse of zero");
        }
        PrimeField r;
        ctx().inv(&r.mont_, &mont_);
        return r;
    }

    PrimeField pow(const Fe256& exp) const {
        PrimeField r;
        ctx().pow(&r.mont_, &mont_, &exp);
        return r;
    }

    bool operator==(const PrimeField& o) const { return mont_ == o.mont_; }
    bool operator!=(const PrimeField& o) const { return !(mont_ == o.mont_); }

private:
    static const Fe256MontContext& ctx() { return Tag::context(); }

    static PrimeField from_integer_unchecked(const Fe256& v) {
        PrimeField r;
        ctx().to_montgomery(&r.mont_, &v);
        return r;
    }

    Fe256 mont_;  ///< a * R mod modulus
};

extern template class PrimeField<FpTag>;
extern template class PrimeField<FrTag>;

using Fp = PrimeField<FpTag>;
using Fr = PrimeField<FrTag>;

// ============================================================================
// Batch Inversion
// ============================================================================

/**
 * @brief Invert every element in place with a single field inversion
 *
 * Montgomery's trick: prefix products, one inverse, then a backward sweep.
 * Works for any field type providing *, inverse() and is_zero().
 *
 * @throws std::domain_error if any element is zero (elems left unchanged)
 */
template <typename Field>
void batch_invert(std::vector<Field>& elems) {
    if (elems.empty()) {
        return;
    }
    std::vector<Field> prefix(elems.size());
    Field acc = Field::one();
    for (size_t i = 0; i < elems.size(); ++i) {
        if (elems[i].is_zero()) {
            throw std::domain_error("batch_invert: zero element");
        }
        prefix[i] = acc;
        acc = acc * elems[i];
    }
    Field inv = acc.inverse();
    for (size_t i = elems.size(); i-- > 0;) {
        Field next = inv * elems[i];
        elems[i] = inv * prefix[i];
        inv = next;
    }
}

} // namespace zkv

#endif // ZKV_FIELD_FP_H
