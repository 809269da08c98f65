/**
 * @file zkv.h
 * @brief zkv - BN254 Pairing and Groth16 Verification Engine
 *
 * Main include file for the C++ interface. Layers, bottom up:
 * - field:   Fp, Fr, and the Fp2 / Fp6 / Fp12 tower
 * - ec:      G1 and G2 affine points with Jacobian scalar multiplication
 * - pairing: optimal ate pairing into GT
 * - zk:      Groth16 proof verification
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_H
#define ZKV_H

#include "zkv/version.h"
#include "zkv/core/common.h"
#include "zkv/core/types.h"
#include "zkv/core/fe256.h"
#include "zkv/utils/encoding.h"

#include "zkv/field/fp.h"
#include "zkv/field/fp2.h"
#include "zkv/field/fp6.h"
#include "zkv/field/fp12.h"

#include "zkv/ec/curve.h"
#include "zkv/ec/point.h"

#include "zkv/pairing/pairing.h"
#include "zkv/pairing/pairing_context.h"

#include "zkv/zk/groth16.h"

#endif // ZKV_H
