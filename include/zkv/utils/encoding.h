/**
 * @file encoding.h
 * @brief Hexadecimal encoding utilities for proof, key and field data
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ZKV_UTILS_ENCODING_H
#define ZKV_UTILS_ENCODING_H

#include "zkv/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Hexadecimal Encoding/Decoding (C API)
// ============================================================================

/**
 * @brief Encode binary data to hexadecimal string (lowercase)
 *
 * @param data Input binary data
 * @param len Length of input data
 * @param hex Output buffer (must be at least len*2+1 bytes)
 * @param hex_size Size of output buffer
 * @return Number of characters written (excluding null terminator), 0 on error
 */
ZKV_API size_t zkv_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size);

/**
 * @brief Decode hexadecimal string to binary data
 *
 * @param hex Input hex string (may contain 0x prefix)
 * @param hex_len Length of hex string (0 for null-terminated)
 * @param data Output buffer
 * @param data_size Size of output buffer
 * @return Number of bytes written, 0 on error
 */
ZKV_API size_t zkv_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size);

/**
 * @brief Get hex character value (0-15), returns -1 for invalid
 */
ZKV_API int zkv_hex_char_value(char c);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include "zkv/core/types.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace zkv {
namespace encoding {

/**
 * @brief Encoding exception for invalid input
 */
class EncodingError : public std::invalid_argument {
public:
    explicit EncodingError(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * @brief Encode bytes to lowercase hex string
 */
std::string hexEncode(const ByteVec& data);
std::string hexEncode(const uint8_t* data, size_t len);

/**
 * @brief Decode hex string to bytes
 * @throws EncodingError on invalid input
 */
ByteVec hexDecode(const std::string& hex);

/**
 * @brief Decode hex into exactly N bytes, left-padding shorter input with zeros
 * @throws EncodingError on invalid input or when the value does not fit
 */
template<size_t N>
ByteArray<N> hexDecodeFixed(const std::string& hex) {
    ByteVec raw = hexDecode(hex);
    if (raw.size() > N) {
        throw EncodingError("Hex value longer than " + std::to_string(N) + " bytes");
    }
    ByteArray<N> out{};
    std::copy(raw.begin(), raw.end(), out.begin() + (N - raw.size()));
    return out;
}

/**
 * @brief Check if string is valid hex
 */
bool isValidHex(const std::string& str) noexcept;

} // namespace encoding
} // namespace zkv

#endif // __cplusplus

#endif // ZKV_UTILS_ENCODING_H
