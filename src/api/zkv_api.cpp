/**
 * @file zkv_api.cpp
 * @brief C API bindings over the C++ pairing and Groth16 engine
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "zkv/zkv_api.h"
#include "zkv/version.h"
#include "zkv/zk/groth16.h"

#include <cstring>
#include <stdexcept>
#include <vector>

using namespace zkv;

static_assert(ZKV_FIELD_SIZE == sizeof(FieldBytes), "field encoding size");
static_assert(ZKV_G1_SIZE == G1Point::kEncodedSize, "G1 encoding size");
static_assert(ZKV_G2_SIZE == G2Point::kEncodedSize, "G2 encoding size");
static_assert(ZKV_GT_SIZE == 12 * ZKV_FIELD_SIZE, "GT encoding size");
static_assert(ZKV_PROOF_SIZE == zkp::Groth16Proof::kSerializedSize, "proof encoding size");

namespace {

Fe256 limbs_to_int(const zkv_field_t& f) {
    return Fe256(f.limbs[0], f.limbs[1], f.limbs[2], f.limbs[3]);
}

void int_to_limbs(const Fe256& v, zkv_field_t& f) {
    for (int i = 0; i < 4; ++i) {
        f.limbs[i] = v.limb[i];
    }
}

template <typename Field>
bool decode_field(const zkv_field_t& f, Field& out) {
    Fe256 v = limbs_to_int(f);
    if (!(v < Field::modulus())) {
        return false;
    }
    out = Field::from_integer(v);
    return true;
}

bool decode_g1(const zkv_g1_t& in, G1Point& out) {
    if (in.infinity) {
        out = G1Point::infinity();
        return true;
    }
    Fp x, y;
    if (!decode_field(in.x, x) || !decode_field(in.y, y)) {
        return false;
    }
    out = G1Point(x, y);
    return true;
}

bool decode_g2(const zkv_g2_t& in, G2Point& out) {
    if (in.infinity) {
        out = G2Point::infinity();
        return true;
    }
    Fp x0, x1, y0, y1;
    if (!decode_field(in.x_c0, x0) || !decode_field(in.x_c1, x1) ||
        !decode_field(in.y_c0, y0) || !decode_field(in.y_c1, y1)) {
        return false;
    }
    out = G2Point(Fp2(x0, x1), Fp2(y0, y1));
    return true;
}

void encode_g1(const G1Point& p, zkv_g1_t& out) {
    std::memset(&out, 0, sizeof(out));
    out.infinity = p.is_infinity();
    if (!out.infinity) {
        int_to_limbs(p.x().to_integer(), out.x);
        int_to_limbs(p.y().to_integer(), out.y);
    }
}

void encode_g2(const G2Point& p, zkv_g2_t& out) {
    std::memset(&out, 0, sizeof(out));
    out.infinity = p.is_infinity();
    if (!out.infinity) {
        int_to_limbs(p.x().c0.to_integer(), out.x_c0);
        int_to_limbs(p.x().c1.to_integer(), out.x_c1);
        int_to_limbs(p.y().c0.to_integer(), out.y_c0);
        int_to_limbs(p.y().c1.to_integer(), out.y_c1);
    }
}

void encode_gt(const GTElement& e, zkv_gt_t& out) {
    for (size_t k = 0; k < 6; ++k) {
        const Fp2& a = e.value().coeff(k);
        int_to_limbs(a.c0.to_integer(), out.c[2 * k]);
        int_to_limbs(a.c1.to_integer(), out.c[2 * k + 1]);
    }
}

} // namespace

extern "C" {

// ============================================================================
// Library Info
// ============================================================================

const char* zkv_version(void) {
    return ZKV_VERSION_STRING;
}

const char* zkv_platform(void) {
    return ZKV_PLATFORM_NAME;
}

// ============================================================================
// Pairing Engine
// ============================================================================

zkv_error_t zkv_pairing_init(void) {
    return zkv::pairing_init() ? ZKV_SUCCESS : ZKV_ERROR_INTERNAL;
}

bool zkv_pairing_is_initialized(void) {
    return zkv::pairing_is_initialized();
}

// ============================================================================
// Field Elements
// ============================================================================

zkv_error_t zkv_field_from_bytes(zkv_field_t* out, const uint8_t in[32]) {
    if (!out || !in) {
        return ZKV_ERROR_INVALID_PARAM;
    }
    Fe256 v;
    v.from_bytes_be(in);
    if (!(v < Fp::modulus())) {
        return ZKV_ERROR_INVALID_ENCODING;
    }
    int_to_limbs(v, *out);
    return ZKV_SUCCESS;
}

void zkv_field_to_bytes(const zkv_field_t* f, uint8_t out[32]) {
    if (!f || !out) {
        return;
    }
    limbs_to_int(*f).to_bytes_be(out);
}

// ============================================================================
// Group Elements
// ============================================================================

void zkv_g1_set_infinity(zkv_g1_t* p) {
    if (p) {
        std::memset(p, 0, sizeof(*p));
        p->infinity = true;
    }
}

void zkv_g2_set_infinity(zkv_g2_t* p) {
    if (p) {
        std::memset(p, 0, sizeof(*p));
        p->infinity = true;
    }
}

bool zkv_g1_is_infinity(const zkv_g1_t* p) {
    return p != nullptr && p->infinity;
}

bool zkv_g2_is_infinity(const zkv_g2_t* p) {
    return p != nullptr && p->infinity;
}

bool zkv_g1_is_valid(const zkv_g1_t* p) {
    G1Point pt;
    return p != nullptr && decode_g1(*p, pt) && pt.is_valid();
}

bool zkv_g2_is_valid(const zkv_g2_t* p) {
    G2Point pt;
    return p != nullptr && decode_g2(*p, pt) && pt.is_valid();
}

void zkv_g1_generator(zkv_g1_t* out) {
    if (out) {
        encode_g1(G1Point::generator(), *out);
    }
}

void zkv_g2_generator(zkv_g2_t* out) {
    if (out) {
        encode_g2(G2Point::generator(), *out);
    }
}

// ============================================================================
// Pairing
// ============================================================================

zkv_error_t zkv_pairing_compute(zkv_gt_t* out, const zkv_g1_t* p, const zkv_g2_t* q) {
    if (!out || !p || !q) {
        return ZKV_ERROR_INVALID_PARAM;
    }
    if (!zkv::pairing_is_initialized()) {
        return ZKV_ERROR_NOT_INITIALIZED;
    }

    G1Point g1;
    G2Point g2;
    if (!decode_g1(*p, g1) || !decode_g2(*q, g2)) {
        return ZKV_ERROR_INVALID_ENCODING;
    }

    GTElement e;
    if (!zkv::pairing_compute(e, g1, g2)) {
        return ZKV_ERROR_INVALID_POINT;
    }
    encode_gt(e, *out);
    return ZKV_SUCCESS;
}

bool zkv_gt_is_one(const zkv_gt_t* e) {
    if (!e) {
        return false;
    }
    uint64_t acc = e->c[0].limbs[0] ^ 1;
    for (size_t i = 0; i < 12; ++i) {
        for (size_t j = (i == 0 ? 1 : 0); j < 4; ++j) {
            acc |= e->c[i].limbs[j];
        }
    }
    return acc == 0;
}

// ============================================================================
// Groth16
// ============================================================================

bool zkv_groth16_verify(const zkv_groth16_vk_t* vk,
                        const zkv_groth16_proof_t* proof,
                        const zkv_field_t* inputs,
                        size_t num_inputs) {
    if (!vk || !proof) {
        return false;
    }
    // Length precondition before any decoding; ic_len - 1 cannot wrap
    if (vk->ic_len == 0 || vk->ic_len - 1 != num_inputs || vk->ic == nullptr) {
        return false;
    }
    if (num_inputs > 0 && inputs == nullptr) {
        return false;
    }

    try {
        zkp::VerificationKey key;
        if (!decode_g1(vk->alpha, key.alpha_g1) || !decode_g2(vk->beta, key.beta_g2) ||
            !decode_g2(vk->gamma, key.gamma_g2) || !decode_g2(vk->delta, key.delta_g2)) {
            return false;
        }
        key.ic.resize(vk->ic_len);
        for (size_t i = 0; i < vk->ic_len; ++i) {
            if (!decode_g1(vk->ic[i], key.ic[i])) {
                return false;
            }
        }

        zkp::Groth16Proof pf;
        if (!decode_g1(proof->a, pf.a) || !decode_g2(proof->b, pf.b) ||
            !decode_g1(proof->c, pf.c)) {
            return false;
        }

        std::vector<Fr> public_inputs(num_inputs);
        for (size_t i = 0; i < num_inputs; ++i) {
            if (!decode_field(inputs[i], public_inputs[i])) {
                return false;
            }
        }

        return zkp::Groth16::verify(key, pf, public_inputs);
    } catch (const std::exception&) {
        return false;
    }
}

} // extern "C"
