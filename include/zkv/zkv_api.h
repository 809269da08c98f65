/**
 * @file zkv_api.h
 * @brief zkv C API: BN254 pairing and Groth16 verification
 *
 * Plain-data C interface over the C++ engine. Points and field elements
 * cross the boundary as fixed-size structs; nothing returned by this API
 * holds engine memory.
 *
 * Usage:
 * @code
 *   #include <zkv/zkv_api.h>
 *
 *   if (zkv_pairing_init() != ZKV_SUCCESS) { ... }
 *
 *   zkv_groth16_vk_t vk = { alpha, beta, gamma, delta, ic, ic_len };
 *   bool ok = zkv_groth16_verify(&vk, &proof, inputs, num_inputs);
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ZKV_API_H
#define ZKV_API_H

#include "zkv/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Types
 * ============================================================================ */

/**
 * @brief Field element as canonical little-endian 64-bit limbs (value < modulus)
 *
 * Used for Fp coordinates and for Fr public inputs.
 */
typedef struct {
    uint64_t limbs[4];
} zkv_field_t;

typedef struct {
    zkv_field_t x;
    zkv_field_t y;
    bool infinity;          /* Coordinates ignored when set */
} zkv_g1_t;

/**
 * @brief G2 point, coordinates in Fp2 as c0 + c1 * u
 */
typedef struct {
    zkv_field_t x_c0;
    zkv_field_t x_c1;
    zkv_field_t y_c0;
    zkv_field_t y_c1;
    bool infinity;
} zkv_g2_t;

/**
 * @brief GT element: Fp12 coefficients a_0..a_5 over Fp2, each as (c0, c1)
 */
typedef struct {
    zkv_field_t c[12];
} zkv_gt_t;

/**
 * @brief Groth16 verification key; ic is borrowed for the duration of a call
 */
typedef struct {
    zkv_g1_t alpha;
    zkv_g2_t beta;
    zkv_g2_t gamma;
    zkv_g2_t delta;
    const zkv_g1_t* ic;
    size_t ic_len;
} zkv_groth16_vk_t;

typedef struct {
    zkv_g1_t a;
    zkv_g2_t b;
    zkv_g1_t c;
} zkv_groth16_proof_t;

/* ============================================================================
 * Library Info
 * ============================================================================ */

ZKV_API const char* zkv_version(void);

ZKV_API const char* zkv_platform(void);

/* ============================================================================
 * Pairing Engine
 * ============================================================================ */

/**
 * @brief Derive the pairing constants; idempotent and thread-safe
 * @return ZKV_SUCCESS, or ZKV_ERROR_INTERNAL if derivation failed
 */
ZKV_API zkv_error_t zkv_pairing_init(void);

ZKV_API bool zkv_pairing_is_initialized(void);

/* ============================================================================
 * Field Elements
 * ============================================================================ */

/**
 * @brief Decode 32 big-endian bytes as an Fp element
 * @return ZKV_ERROR_INVALID_ENCODING if the value is not below p
 */
ZKV_API zkv_error_t zkv_field_from_bytes(zkv_field_t* out, const uint8_t in[32]);

ZKV_API void zkv_field_to_bytes(const zkv_field_t* f, uint8_t out[32]);

/* ============================================================================
 * Group Elements
 * ============================================================================ */

ZKV_API void zkv_g1_set_infinity(zkv_g1_t* p);
ZKV_API void zkv_g2_set_infinity(zkv_g2_t* p);

ZKV_API bool zkv_g1_is_infinity(const zkv_g1_t* p);
ZKV_API bool zkv_g2_is_infinity(const zkv_g2_t* p);

/**
 * @brief On the curve, in the prime-order subgroup, canonical coordinates
 */
ZKV_API bool zkv_g1_is_valid(const zkv_g1_t* p);
ZKV_API bool zkv_g2_is_valid(const zkv_g2_t* p);

ZKV_API void zkv_g1_generator(zkv_g1_t* out);
ZKV_API void zkv_g2_generator(zkv_g2_t* out);

/* ============================================================================
 * Pairing
 * ============================================================================ */

/**
 * @brief out = e(p, q)
 * @return ZKV_SUCCESS, ZKV_ERROR_INVALID_PARAM for NULL arguments,
 *         ZKV_ERROR_NOT_INITIALIZED, ZKV_ERROR_INVALID_ENCODING for
 *         non-canonical coordinates, ZKV_ERROR_INVALID_POINT off the curve
 *         or outside the order-r subgroup
 */
ZKV_API zkv_error_t zkv_pairing_compute(zkv_gt_t* out, const zkv_g1_t* p, const zkv_g2_t* q);

ZKV_API bool zkv_gt_is_one(const zkv_gt_t* e);

/* ============================================================================
 * Groth16
 * ============================================================================ */

/**
 * @brief Verify a Groth16 proof
 *
 * @param vk Verification key (ic_len must equal num_inputs + 1)
 * @param proof Proof
 * @param inputs Public inputs as Fr elements (may be NULL when num_inputs is 0)
 * @param num_inputs Number of public inputs
 * @return true only for a valid proof; every failure is false
 */
ZKV_API bool zkv_groth16_verify(const zkv_groth16_vk_t* vk,
                                const zkv_groth16_proof_t* proof,
                                const zkv_field_t* inputs,
                                size_t num_inputs);

#ifdef __cplusplus
}
#endif

#endif /* ZKV_API_H */
