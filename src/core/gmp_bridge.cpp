/**
 * @file gmp_bridge.cpp
 * @brief GMP interop implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/internal/gmp_bridge.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace zkv {
namespace internal {

void mpz_set_fe256(mpz_t out, const Fe256& a) {
    mpz_import(out, 4, -1, sizeof(uint64_t), 0, 0, a.limb);
}

Fe256 fe256_from_mpz(const mpz_t a) {
    if (mpz_sgn(a) < 0 || mpz_sizeinbase(a, 2) > 256) {
        throw std::range_error("integer does not fit in 256 bits");
    }
    Fe256 r;
    size_t count = 0;
    mpz_export(r.limb, &count, -1, sizeof(uint64_t), 0, 0, a);
    return r;
}

ExpLimbs limbs_from_mpz(const mpz_t a) {
    if (mpz_sgn(a) < 0) {
        throw std::range_error("negative exponent");
    }
    size_t words = (mpz_sizeinbase(a, 2) + 63) / 64;
    ExpLimbs out(words == 0 ? 1 : words, 0);
    size_t count = 0;
    mpz_export(out.data(), &count, -1, sizeof(uint64_t), 0, 0, a);
    return out;
}

void mpz_set_text(mpz_t out, const std::string& text) {
    std::string digits = text;
    int base = 10;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.erase(0, 2);
        base = 16;
    }
    // mpz_set_str skips embedded whitespace, so "1 2" would read as 12
    bool has_space = std::any_of(digits.begin(), digits.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
    if (digits.empty() || has_space || mpz_set_str(out, digits.c_str(), base) != 0) {
        throw std::invalid_argument("Malformed integer: " + text.substr(0, 20));
    }
}

} // namespace internal
} // namespace zkv
