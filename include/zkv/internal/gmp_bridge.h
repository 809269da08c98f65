/**
 * @file gmp_bridge.h
 * @brief GMP Interop for Precomputation - Internal Header
 *
 * Conversions between Fe256 / limb vectors and GMP integers, used where
 * exact big-integer arithmetic beyond 256 bits is needed once (pairing
 * constants, decimal parsing). Not intended for the public API.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_INTERNAL_GMP_BRIDGE_H
#define ZKV_INTERNAL_GMP_BRIDGE_H

#include "zkv/core/fe256.h"
#include "zkv/core/types.h"

#include <gmp.h>
#include <string>

namespace zkv {
namespace internal {

/**
 * @brief RAII owner of an mpz_t
 */
struct wrapped_mpz {
    mpz_t body;

    wrapped_mpz() { mpz_init(body); }
    ~wrapped_mpz() { mpz_clear(body); }

    wrapped_mpz(const wrapped_mpz&) = delete;
    wrapped_mpz& operator=(const wrapped_mpz&) = delete;
};

/**
 * @brief out = a
 */
void mpz_set_fe256(mpz_t out, const Fe256& a);

/**
 * @brief Low 256 bits of a non-negative integer
 * @throws std::range_error if a is negative or wider than 256 bits
 */
Fe256 fe256_from_mpz(const mpz_t a);

/**
 * @brief Little-endian 64-bit limbs of a non-negative integer
 * @throws std::range_error if a is negative
 */
ExpLimbs limbs_from_mpz(const mpz_t a);

/**
 * @brief Parse a decimal or 0x-prefixed hexadecimal integer
 * @throws std::invalid_argument on malformed text, including embedded whitespace
 */
void mpz_set_text(mpz_t out, const std::string& text);

} // namespace internal
} // namespace zkv

#endif // ZKV_INTERNAL_GMP_BRIDGE_H
