/**
 * @file types.h
 * @brief Shared C++ type aliases for zkv
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ZKV_CORE_TYPES_H
#define ZKV_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace zkv {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Canonical encodings
using FieldBytes = ByteArray<32>;
using G1Bytes = ByteArray<64>;
using G2Bytes = ByteArray<128>;

/**
 * @brief Arbitrary-length exponent, little-endian 64-bit limbs
 */
using ExpLimbs = std::vector<uint64_t>;

} // namespace zkv

#endif // ZKV_CORE_TYPES_H
