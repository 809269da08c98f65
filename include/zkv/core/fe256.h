/**
 * @file fe256.h
 * @brief 256-bit Fixed-Width Integer and Montgomery Arithmetic for zkv
 *
 * Opaque 4 x 64-bit limb integer used as the storage type of every prime
 * field in the engine (BN254 base field Fp and scalar field Fr).
 *
 * Features:
 * - CIOS Montgomery multiplication with a final masked subtraction
 * - Montgomery constants (n0, R, R^2) derived at context construction
 * - Constant-time comparison, selection and modular add/sub
 * - 4-limb representation (4 x 64-bit), little-endian limb order
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_CORE_FE256_H
#define ZKV_CORE_FE256_H

#include <cstddef>
#include <cstdint>
#include <cstring>

// Platform detection
#if defined(__SIZEOF_INT128__)
    #define ZKV_HAS_INT128 1
    typedef unsigned __int128 uint128_t;
#elif defined(_MSC_VER) && defined(_M_X64)
    #define ZKV_HAS_UMUL128 1
    #include <intrin.h>
#else
    #define ZKV_NO_INT128 1
#endif

namespace zkv {

// ============================================================================
// Fe256: 256-bit Integer
// ============================================================================

/**
 * @brief 256-bit unsigned integer in 4-limb representation
 *
 * Little-endian: limb[0] contains the least significant 64 bits.
 * Carries no modulus; reduction is the job of Fe256MontContext.
 */
struct Fe256 {
    uint64_t limb[4];  ///< Four 64-bit limbs (256 bits total)

    Fe256() : limb{0, 0, 0, 0} {}

    explicit Fe256(uint64_t val) : limb{val, 0, 0, 0} {}

    Fe256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limb{l0, l1, l2, l3} {}

    uint64_t& operator[](size_t i) { return limb[i]; }
    const uint64_t& operator[](size_t i) const { return limb[i]; }

    // ========================================================================
    // Byte Conversion
    // ========================================================================

    /**
     * @brief Load from a 32-byte big-endian buffer
     */
    void from_bytes_be(const uint8_t bytes[32]) {
        for (int i = 0; i < 4; ++i) {
            uint64_t w = 0;
            for (int j = 0; j < 8; ++j) {
                w = (w << 8) | bytes[(3 - i) * 8 + j];
            }
            limb[i] = w;
        }
    }

    /**
     * @brief Store into a 32-byte big-endian buffer
     */
    void to_bytes_be(uint8_t bytes[32]) const {
        for (int i = 0; i < 4; ++i) {
            uint64_t w = limb[i];
            for (int j = 7; j >= 0; --j) {
                bytes[(3 - i) * 8 + j] = static_cast<uint8_t>(w);
                w >>= 8;
            }
        }
    }

    // ========================================================================
    // Basic Queries
    // ========================================================================

    bool is_zero() const {
        return (limb[0] | limb[1] | limb[2] | limb[3]) == 0;
    }

    bool is_odd() const {
        return (limb[0] & 1) != 0;
    }

    /**
     * @brief Bit i (0 = least significant)
     */
    bool bit(size_t i) const {
        return ((limb[i / 64] >> (i % 64)) & 1) != 0;
    }

    /**
     * @brief Index of the highest set bit plus one (0 for zero)
     */
    size_t bit_length() const {
        for (int i = 3; i >= 0; --i) {
            if (limb[i] != 0) {
                size_t n = 64;
                uint64_t w = limb[i];
                while ((w >> 63) == 0) {
                    w <<= 1;
                    --n;
                }
                return static_cast<size_t>(i) * 64 + n;
            }
        }
        return 0;
    }

    /**
     * @brief Secure zero (not optimized away)
     */
    void secure_zero() {
        volatile uint64_t* p = limb;
        p[0] = p[1] = p[2] = p[3] = 0;
    }

    // ========================================================================
    // Comparison (constant-time)
    // ========================================================================

    bool ct_equal(const Fe256& other) const {
        uint64_t diff = 0;
        diff |= limb[0] ^ other.limb[0];
        diff |= limb[1] ^ other.limb[1];
        diff |= limb[2] ^ other.limb[2];
        diff |= limb[3] ^ other.limb[3];
        return (((diff | (~diff + 1)) >> 63) ^ 1) != 0;
    }

    bool ct_less_than(const Fe256& other) const;

    bool operator==(const Fe256& other) const { return ct_equal(other); }
    bool operator!=(const Fe256& other) const { return !ct_equal(other); }
    bool operator<(const Fe256& other) const { return ct_less_than(other); }
    bool operator>=(const Fe256& other) const { return !ct_less_than(other); }

    // ========================================================================
    // Conditional Operations (constant-time)
    // ========================================================================

    /**
     * @brief Constant-time conditional move
     * If cond is true, set this = src
     */
    void ct_cmov(const Fe256& src, bool cond) {
        uint64_t mask = ~(static_cast<uint64_t>(cond) - 1);
        for (int i = 0; i < 4; ++i) {
            limb[i] ^= mask & (limb[i] ^ src.limb[i]);
        }
    }
};

// ============================================================================
// 128-bit Arithmetic Helpers
// ============================================================================

namespace fe256_ops {

#ifdef ZKV_HAS_INT128

/**
 * @brief 64x64 -> 128 bit multiplication
 */
inline void mul64x64(uint64_t a, uint64_t b, uint64_t* hi, uint64_t* lo) {
    uint128_t product = static_cast<uint128_t>(a) * b;
    *lo = static_cast<uint64_t>(product);
    *hi = static_cast<uint64_t>(product >> 64);
}

inline uint64_t adc64(uint64_t a, uint64_t b, uint64_t carry_in, uint64_t* carry_out) {
    uint128_t sum = static_cast<uint128_t>(a) + b + carry_in;
    *carry_out = static_cast<uint64_t>(sum >> 64);
    return static_cast<uint64_t>(sum);
}

inline uint64_t sbb64(uint64_t a, uint64_t b, uint64_t borrow_in, uint64_t* borrow_out) {
    uint128_t diff = static_cast<uint128_t>(a) - b - borrow_in;
    *borrow_out = static_cast<uint64_t>(diff >> 64) & 1;
    return static_cast<uint64_t>(diff);
}

/**
 * @brief Multiply-accumulate: a * b + c + d, returns low word, high word in *hi
 *
 * Cannot overflow: (2^64-1)^2 + 2(2^64-1) = 2^128 - 1.
 */
inline uint64_t mac64(uint64_t a, uint64_t b, uint64_t c, uint64_t d, uint64_t* hi) {
    uint128_t t = static_cast<uint128_t>(a) * b + c + d;
    *hi = static_cast<uint64_t>(t >> 64);
    return static_cast<uint64_t>(t);
}

#elif defined(ZKV_HAS_UMUL128)

inline void mul64x64(uint64_t a, uint64_t b, uint64_t* hi, uint64_t* lo) {
    *lo = _umul128(a, b, hi);
}

inline uint64_t adc64(uint64_t a, uint64_t b, uint64_t carry_in, uint64_t* carry_out) {
    unsigned char c;
    uint64_t sum;
    c = _addcarry_u64(static_cast<unsigned char>(carry_in), a, b,
                      reinterpret_cast<unsigned long long*>(&sum));
    *carry_out = c;
    return sum;
}

inline uint64_t sbb64(uint64_t a, uint64_t b, uint64_t borrow_in, uint64_t* borrow_out) {
    unsigned char c;
    uint64_t diff;
    c = _subborrow_u64(static_cast<unsigned char>(borrow_in), a, b,
                       reinterpret_cast<unsigned long long*>(&diff));
    *borrow_out = c;
    return diff;
}

inline uint64_t mac64(uint64_t a, uint64_t b, uint64_t c, uint64_t d, uint64_t* hi) {
    uint64_t h, l, carry;
    l = _umul128(a, b, &h);
    l = adc64(l, c, 0, &carry);
    h += carry;
    l = adc64(l, d, 0, &carry);
    h += carry;
    *hi = h;
    return l;
}

#else

// Portable fallback
inline void mul64x64(uint64_t a, uint64_t b, uint64_t* hi, uint64_t* lo) {
    uint32_t a0 = static_cast<uint32_t>(a);
    uint32_t a1 = static_cast<uint32_t>(a >> 32);
    uint32_t b0 = static_cast<uint32_t>(b);
    uint32_t b1 = static_cast<uint32_t>(b >> 32);

    uint64_t p00 = static_cast<uint64_t>(a0) * b0;
    uint64_t p01 = static_cast<uint64_t>(a0) * b1;
    uint64_t p10 = static_cast<uint64_t>(a1) * b0;
    uint64_t p11 = static_cast<uint64_t>(a1) * b1;

    uint64_t mid = (p00 >> 32) + (p01 & 0xFFFFFFFF) + (p10 & 0xFFFFFFFF);
    *lo = (p00 & 0xFFFFFFFF) | (mid << 32);
    *hi = p11 + (p01 >> 32) + (p10 >> 32) + (mid >> 32);
}

inline uint64_t adc64(uint64_t a, uint64_t b, uint64_t carry_in, uint64_t* carry_out) {
    uint64_t sum = a + b;
    uint64_t c1 = sum < a ? 1 : 0;
    uint64_t out = sum + carry_in;
    uint64_t c2 = out < sum ? 1 : 0;
    *carry_out = c1 | c2;
    return out;
}

inline uint64_t sbb64(uint64_t a, uint64_t b, uint64_t borrow_in, uint64_t* borrow_out) {
    uint64_t diff = a - b - borrow_in;
    *borrow_out = (a < b) || (borrow_in && a == b) ? 1 : 0;
    return diff;
}

inline uint64_t mac64(uint64_t a, uint64_t b, uint64_t c, uint64_t d, uint64_t* hi) {
    uint64_t h, l, carry;
    mul64x64(a, b, &h, &l);
    l = adc64(l, c, 0, &carry);
    h += carry;
    l = adc64(l, d, 0, &carry);
    h += carry;
    *hi = h;
    return l;
}

#endif

/**
 * @brief Addition: r = a + b (no reduction)
 * @return carry out
 */
inline uint64_t fe256_add(Fe256* r, const Fe256* a, const Fe256* b) {
    uint64_t carry = 0;
    r->limb[0] = adc64(a->limb[0], b->limb[0], 0, &carry);
    r->limb[1] = adc64(a->limb[1], b->limb[1], carry, &carry);
    r->limb[2] = adc64(a->limb[2], b->limb[2], carry, &carry);
    r->limb[3] = adc64(a->limb[3], b->limb[3], carry, &carry);
    return carry;
}

/**
 * @brief Subtraction: r = a - b (no reduction)
 * @return borrow out
 */
inline uint64_t fe256_sub(Fe256* r, const Fe256* a, const Fe256* b) {
    uint64_t borrow = 0;
    r->limb[0] = sbb64(a->limb[0], b->limb[0], 0, &borrow);
    r->limb[1] = sbb64(a->limb[1], b->limb[1], borrow, &borrow);
    r->limb[2] = sbb64(a->limb[2], b->limb[2], borrow, &borrow);
    r->limb[3] = sbb64(a->limb[3], b->limb[3], borrow, &borrow);
    return borrow;
}

} // namespace fe256_ops

// ============================================================================
// Curve-Specific Constants
// ============================================================================

/**
 * @brief BN254 (alt_bn128) base field prime
 *
 * p = 36x^4 + 36x^3 + 24x^2 + 6x + 1, x = 4965661367192848881
 */
inline const Fe256& bn254_p() {
    static const Fe256 p(
        0x3C208C16D87CFD47ULL, 0x97816A916871CA8DULL,
        0xB85045B68181585DULL, 0x30644E72E131A029ULL
    );
    return p;
}

/**
 * @brief BN254 group order r (scalar field prime)
 */
inline const Fe256& bn254_r() {
    static const Fe256 r(
        0x43E1F593F0000001ULL, 0x2833E84879B97091ULL,
        0xB85045B68181585DULL, 0x30644E72E131A029ULL
    );
    return r;
}

// ============================================================================
// Montgomery Arithmetic for Fe256
// ============================================================================

/**
 * @brief Montgomery context for arithmetic modulo an odd prime below 2^255
 *
 * All operands and results of the *_mod / mul / sqr members are in
 * Montgomery form (a * R mod p, R = 2^256) and fully reduced to [0, p).
 */
struct Fe256MontContext {
    Fe256 p;        ///< Prime modulus
    Fe256 r1;       ///< R mod p (Montgomery form of 1)
    Fe256 r2;       ///< R^2 mod p (for Montgomery conversion)
    uint64_t n0;    ///< -p^(-1) mod 2^64 (for Montgomery reduction)

    /**
     * @brief Derive n0, R and R^2 for the given prime
     */
    explicit Fe256MontContext(const Fe256& prime);

    void to_montgomery(Fe256* r, const Fe256* a) const;
    void from_montgomery(Fe256* r, const Fe256* a) const;

    /**
     * @brief Montgomery multiplication: r = a * b * R^(-1) mod p
     */
    void mul(Fe256* r, const Fe256* a, const Fe256* b) const;

    void sqr(Fe256* r, const Fe256* a) const { mul(r, a, a); }

    void add_mod(Fe256* r, const Fe256* a, const Fe256* b) const;
    void sub_mod(Fe256* r, const Fe256* a, const Fe256* b) const;
    void neg_mod(Fe256* r, const Fe256* a) const;

    /**
     * @brief Full reduction of an arbitrary 256-bit integer into [0, p)
     */
    void reduce(Fe256* r, const Fe256* a) const;

    /**
     * @brief r = base^exp, base and r in Montgomery form, exp a plain integer
     *
     * Square-and-multiply over all 256 exponent bits with a masked
     * select, so the sequence of operations does not depend on exp.
     */
    void pow(Fe256* r, const Fe256* base, const Fe256* exp) const;

    /**
     * @brief Modular inverse via Fermat (a^(p-2)); a must be nonzero
     */
    void inv(Fe256* r, const Fe256* a) const;
};

} // namespace zkv

#endif // ZKV_CORE_FE256_H
