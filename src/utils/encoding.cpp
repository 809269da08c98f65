/**
 * @file encoding.cpp
 * @brief Hexadecimal encoding utilities implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "zkv/utils/encoding.h"
#include <cstring>

static const char HEX_LOWER[] = "0123456789abcdef";

// ============================================================================
// C API: Hex Encoding/Decoding
// ============================================================================

extern "C" {

size_t zkv_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size) {
    if (data == nullptr || hex == nullptr || hex_size < len * 2 + 1) {
        return 0;
    }
    for (size_t i = 0; i < len; i++) {
        hex[i * 2] = HEX_LOWER[data[i] >> 4];
        hex[i * 2 + 1] = HEX_LOWER[data[i] & 0x0F];
    }
    hex[len * 2] = '\0';
    return len * 2;
}

int zkv_hex_char_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

size_t zkv_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size) {
    if (hex == nullptr || data == nullptr) {
        return 0;
    }

    if (hex_len == 0) {
        hex_len = strlen(hex);
    }

    // Skip 0x prefix if present
    if (hex_len >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex += 2;
        hex_len -= 2;
    }

    if (hex_len % 2 != 0) {
        return 0;
    }

    size_t out_len = hex_len / 2;
    if (data_size < out_len) {
        return 0;
    }

    for (size_t i = 0; i < out_len; i++) {
        int hi = zkv_hex_char_value(hex[i * 2]);
        int lo = zkv_hex_char_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return 0;
        }
        data[i] = (uint8_t)((hi << 4) | lo);
    }

    return out_len;
}

} // extern "C"

// ============================================================================
// C++ API Implementation
// ============================================================================

namespace zkv {
namespace encoding {

std::string hexEncode(const ByteVec& data) {
    return hexEncode(data.data(), data.size());
}

std::string hexEncode(const uint8_t* data, size_t len) {
    std::string result(len * 2 + 1, '\0');
    zkv_hex_encode(data, len, &result[0], result.size());
    result.resize(len * 2);
    return result;
}

ByteVec hexDecode(const std::string& hex) {
    if (!isValidHex(hex)) {
        throw EncodingError("Invalid hex string: " + hex.substr(0, 20));
    }
    ByteVec result(hex.size() / 2);
    size_t decoded = zkv_hex_decode(hex.c_str(), hex.size(), result.data(), result.size());
    result.resize(decoded);
    return result;
}

bool isValidHex(const std::string& str) noexcept {
    size_t start = 0;
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        start = 2;
    }

    if ((str.size() - start) % 2 != 0) {
        return false;
    }

    for (size_t i = start; i < str.size(); i++) {
        if (zkv_hex_char_value(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace encoding
} // namespace zkv
