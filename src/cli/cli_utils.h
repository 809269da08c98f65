/**
 * @file cli_utils.h
 * @brief Common utility functions for zkv CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ZKV_CLI_UTILS_H
#define ZKV_CLI_UTILS_H

#include "zkv/utils/encoding.h"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace zkv {
namespace cli {

/**
 * @brief Read file into byte vector
 */
inline std::vector<uint8_t> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return std::vector<uint8_t>(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

inline std::string read_text_file(const std::string& filename) {
    std::vector<uint8_t> raw = read_file(filename);
    return std::string(raw.begin(), raw.end());
}

/**
 * @brief Read a binary blob, or a hex dump of one when as_hex is set
 *
 * Whitespace in hex files is ignored.
 */
inline std::vector<uint8_t> read_blob(const std::string& filename, bool as_hex) {
    if (!as_hex) {
        return read_file(filename);
    }
    std::string text = read_text_file(filename);
    std::string hex;
    hex.reserve(text.size());
    for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            hex.push_back(c);
        }
    }
    return encoding::hexDecode(hex);
}

} // namespace cli
} // namespace zkv

#endif // ZKV_CLI_UTILS_H
