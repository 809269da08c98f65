/**
 * @file cmd_selftest.cpp
 * @brief selftest subcommand: pairing sanity checks on the generators
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/pairing/pairing.h"
#include "zkv/utils/encoding.h"

#include <chrono>
#include <iostream>

namespace {

bool report(const char* name, bool ok) {
    std::cout << "  " << (ok ? "[PASS] " : "[FAIL] ") << name << "\n";
    return ok;
}

} // namespace

int cmd_selftest(int /*argc*/, char* /*argv*/[]) {
    using namespace zkv;

    std::cout << "\nzkv self-test\n\n";
    if (!report("pairing engine initialization", pairing_init())) {
        return 1;
    }

    const G1Point p = G1Point::generator();
    const G2Point q = G2Point::generator();
    bool ok = true;

    ok &= report("G1 generator valid", p.is_valid());
    ok &= report("G2 generator valid", q.is_valid());

    auto start = std::chrono::steady_clock::now();
    GTElement e = pairing(p, q);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    ok &= report("e(P, Q) != 1", !e.is_one());
    ok &= report("e(2P, Q) == e(P, Q)^2", pairing(p.dbl(), q) == e * e);
    ok &= report("e(P, 2Q) == e(P, Q)^2", pairing(p, q.dbl()) == e * e);
    ok &= report("e(P, Q) * e(-P, Q) == 1", multi_pairing({{p, q}, {-p, q}}).is_one());

    uint8_t first[384];
    e.to_bytes(first);
    std::cout << "\n  e(P, Q)[0..32] = " << encoding::hexEncode(first, 32) << "\n";
    std::cout << "  pairing time   = " << elapsed.count() << " us\n\n";

    return ok ? 0 : 1;
}
