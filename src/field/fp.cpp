/**
 * @file fp.cpp
 * @brief BN254 prime field contexts and hex conversion
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/field/fp.h"
#include "zkv/utils/encoding.h"

namespace zkv {

const Fe256MontContext& FpTag::context() {
    static const Fe256MontContext ctx(bn254_p());
    return ctx;
}

const Fe256MontContext& FrTag::context() {
    static const Fe256MontContext ctx(bn254_r());
    return ctx;
}

template <typename Tag>
PrimeField<Tag> PrimeField<Tag>::from_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.erase(0, 2);
    }
    if (digits.size() % 2 != 0) {
        digits.insert(digits.begin(), '0');
    }
    FieldBytes bytes = encoding::hexDecodeFixed<32>(digits);
    return from_bytes_be(bytes.data());
}

template <typename Tag>
std::string PrimeField<Tag>::to_hex() const {
    FieldBytes bytes = to_bytes();
    return encoding::hexEncode(bytes.data(), bytes.size());
}

template class PrimeField<FpTag>;
template class PrimeField<FrTag>;

} // namespace zkv
