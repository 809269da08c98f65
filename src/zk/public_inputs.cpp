/**
 * @file public_inputs.cpp
 * @brief Text parsing of Groth16 public inputs (decimal or hex, via GMP)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/zk/groth16.h"
#include "zkv/internal/gmp_bridge.h"

#include <sstream>
#include <stdexcept>

namespace zkv {
namespace zkp {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

Fr parse_public_input(const std::string& text) {
    using internal::wrapped_mpz;

    wrapped_mpz value;
    internal::mpz_set_text(value.body, trim(text));

    wrapped_mpz order;
    internal::mpz_set_fe256(order.body, bn254_r());

    if (mpz_sgn(value.body) < 0 || mpz_cmp(value.body, order.body) >= 0) {
        throw std::invalid_argument("Public input out of range [0, r): " + text);
    }
    return Fr::from_integer(internal::fe256_from_mpz(value.body));
}

std::vector<Fr> parse_public_inputs(const std::string& text) {
    std::vector<Fr> out;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        try {
            out.push_back(parse_public_input(line));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("line " + std::to_string(line_no) + ": " + e.what());
        }
    }
    return out;
}

} // namespace zkp
} // namespace zkv
