/**
 * @file groth16.cpp
 * @brief Groth16 Verifier Implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/zk/groth16.h"
#include "zkv/core/common.h"

#include <cstring>
#include <stdexcept>

namespace zkv {
namespace zkp {

namespace {

constexpr size_t kG1Size = G1Point::kEncodedSize;
constexpr size_t kG2Size = G2Point::kEncodedSize;
constexpr size_t kVkFixedSize = kG1Size + 3 * kG2Size + 4;
constexpr size_t kWeightBytes = 16;

using G1Jacobian = G1Point::Jacobian;

template <typename Point>
void append_point(std::vector<uint8_t>& out, const Point& p) {
    size_t off = out.size();
    out.resize(off + Point::kEncodedSize);
    p.to_bytes(out.data() + off);
}

template <typename Point>
Point read_valid_point(const uint8_t* data, const char* what) {
    Point p = Point::from_bytes(data);
    if (!p.is_valid()) {
        throw std::invalid_argument(std::string("Invalid point: ") + what);
    }
    return p;
}

/**
 * @brief Fixed key elements present and every key point in its group
 *
 * A key with alpha, beta, gamma or delta at infinity makes the equation
 * collapse and is rejected outright.
 */
bool key_usable(const VerificationKey& vk) {
    if (vk.alpha_g1.is_infinity() || vk.beta_g2.is_infinity() ||
        vk.gamma_g2.is_infinity() || vk.delta_g2.is_infinity()) {
        return false;
    }
    return vk.is_valid();
}

bool proof_usable(const Groth16Proof& proof) {
    if (proof.a.is_infinity() || proof.b.is_infinity() || proof.c.is_infinity()) {
        return false;
    }
    return proof.is_valid();
}

/**
 * @brief IC[0] + sum_i inputs[i] * IC[i + 1]; sizes checked by the caller
 */
G1Jacobian input_commitment(const VerificationKey& vk, const std::vector<Fr>& inputs) {
    G1Jacobian acc = vk.ic[0].to_jacobian();
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].is_zero() || vk.ic[i + 1].is_infinity()) {
            continue;
        }
        acc = acc + scalar_mul(vk.ic[i + 1].to_jacobian(), inputs[i].to_integer());
    }
    return acc;
}

/**
 * @brief Nonzero 128-bit weight from 16 CSPRNG bytes
 */
Fe256 weight_from_bytes(const uint8_t* bytes) {
    uint8_t buf[32] = {0};
    std::memcpy(buf + 32 - kWeightBytes, bytes, kWeightBytes);
    Fe256 w;
    w.from_bytes_be(buf);
    w.limb[0] |= 1;
    zkv_secure_zero(buf, sizeof(buf));
    return w;
}

} // namespace

// ============================================================================
// VerificationKey
// ============================================================================

bool VerificationKey::is_valid() const {
    if (!alpha_g1.is_valid() || !beta_g2.is_valid() ||
        !gamma_g2.is_valid() || !delta_g2.is_valid()) {
        return false;
    }
    for (const G1Point& p : ic) {
        if (!p.is_valid()) {
            return false;
        }
    }
    return true;
}

std::vector<uint8_t> VerificationKey::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(kVkFixedSize + ic.size() * kG1Size);

    append_point(out, alpha_g1);
    append_point(out, beta_g2);
    append_point(out, gamma_g2);
    append_point(out, delta_g2);

    uint32_t n = static_cast<uint32_t>(ic.size());
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(n >> (8 * i)));
    }
    for (const G1Point& p : ic) {
        append_point(out, p);
    }
    return out;
}

VerificationKey VerificationKey::deserialize(const uint8_t* data, size_t len) {
    if (data == nullptr || len < kVkFixedSize) {
        throw std::invalid_argument("Verification key data too short");
    }

    const uint8_t* p = data + kVkFixedSize - 4;
    uint32_t ic_len = static_cast<uint32_t>(p[0]) |
                      (static_cast<uint32_t>(p[1]) << 8) |
                      (static_cast<uint32_t>(p[2]) << 16) |
                      (static_cast<uint32_t>(p[3]) << 24);

    size_t body = len - kVkFixedSize;
    if (body % kG1Size != 0 || body / kG1Size != ic_len) {
        throw std::invalid_argument("Verification key IC length mismatch");
    }

    VerificationKey vk;
    size_t off = 0;
    vk.alpha_g1 = read_valid_point<G1Point>(data + off, "alpha");
    off += kG1Size;
    vk.beta_g2 = read_valid_point<G2Point>(data + off, "beta");
    off += kG2Size;
    vk.gamma_g2 = read_valid_point<G2Point>(data + off, "gamma");
    off += kG2Size;
    vk.delta_g2 = read_valid_point<G2Point>(data + off, "delta");
    off += kG2Size + 4;

    vk.ic.reserve(ic_len);
    for (uint32_t i = 0; i < ic_len; ++i) {
        vk.ic.push_back(read_valid_point<G1Point>(data + off, "ic"));
        off += kG1Size;
    }
    return vk;
}

// ============================================================================
// Groth16Proof
// ============================================================================

bool Groth16Proof::is_valid() const {
    return a.is_valid() && b.is_valid() && c.is_valid();
}

std::vector<uint8_t> Groth16Proof::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(kSerializedSize);
    append_point(out, a);
    append_point(out, b);
    append_point(out, c);
    return out;
}

Groth16Proof Groth16Proof::deserialize(const uint8_t* data, size_t len) {
    if (data == nullptr || len != kSerializedSize) {
        throw std::invalid_argument("Invalid proof data length");
    }
    Groth16Proof proof;
    proof.a = read_valid_point<G1Point>(data, "proof.a");
    proof.b = read_valid_point<G2Point>(data + kG1Size, "proof.b");
    proof.c = read_valid_point<G1Point>(data + kG1Size + kG2Size, "proof.c");
    return proof;
}

// ============================================================================
// Groth16
// ============================================================================

bool Groth16::verify(const VerificationKey& vk,
                     const Groth16Proof& proof,
                     const std::vector<Fr>& public_inputs) {
    // Structural checks come before any group work
    if (vk.ic.size() != public_inputs.size() + 1) {
        return false;
    }
    if (!pairing_is_initialized()) {
        return false;
    }

    try {
        if (!key_usable(vk) || !proof_usable(proof)) {
            return false;
        }

        G1Point vk_x = G1Point::from_jacobian(input_commitment(vk, public_inputs));

        std::vector<PairingInput> terms;
        terms.reserve(4);
        terms.emplace_back(proof.a, proof.b);
        terms.emplace_back(-vk_x, vk.gamma_g2);
        terms.emplace_back(-proof.c, vk.delta_g2);
        terms.emplace_back(-vk.alpha_g1, vk.beta_g2);

        return multi_pairing(terms).is_one();
    } catch (const std::exception&) {
        return false;
    }
}

PreparedVerificationKey Groth16::prepare(const VerificationKey& vk) {
    if (vk.ic.empty() || !key_usable(vk)) {
        throw std::invalid_argument("Groth16: unusable verification key");
    }
    return PreparedVerificationKey(vk, pairing(vk.alpha_g1, vk.beta_g2));
}

bool Groth16::verify(const PreparedVerificationKey& pvk,
                     const Groth16Proof& proof,
                     const std::vector<Fr>& public_inputs) {
    const VerificationKey& vk = pvk.key();
    if (vk.ic.size() != public_inputs.size() + 1) {
        return false;
    }
    if (!pairing_is_initialized()) {
        return false;
    }

    try {
        if (!proof_usable(proof)) {
            return false;
        }

        G1Point vk_x = G1Point::from_jacobian(input_commitment(vk, public_inputs));

        std::vector<PairingInput> terms;
        terms.reserve(3);
        terms.emplace_back(proof.a, proof.b);
        terms.emplace_back(-vk_x, vk.gamma_g2);
        terms.emplace_back(-proof.c, vk.delta_g2);

        return multi_pairing(terms) == pvk.alpha_beta();
    } catch (const std::exception&) {
        return false;
    }
}

bool Groth16::batch_verify(const VerificationKey& vk,
                           const std::vector<Groth16Proof>& proofs,
                           const std::vector<std::vector<Fr>>& public_inputs_vec) {
    if (proofs.size() != public_inputs_vec.size()) {
        return false;
    }
    if (proofs.size() < kBatchThreshold) {
        for (size_t i = 0; i < proofs.size(); ++i) {
            if (!verify(vk, proofs[i], public_inputs_vec[i])) {
                return false;
            }
        }
        return true;
    }

    for (const std::vector<Fr>& inputs : public_inputs_vec) {
        if (vk.ic.size() != inputs.size() + 1) {
            return false;
        }
    }
    if (!pairing_is_initialized()) {
        return false;
    }

    if (!key_usable(vk)) {
        return false;
    }
    for (const Groth16Proof& proof : proofs) {
        if (!proof_usable(proof)) {
            return false;
        }
    }

    const size_t n = proofs.size();
    std::vector<uint8_t> seed(n * kWeightBytes);
    if (zkv_random_bytes(seed.data(), seed.size()) != ZKV_SUCCESS) {
        return false;
    }

    bool result = false;
    try {
        // prod e(r_i A_i, B_i) * e(-sum r_i vk_x_i, gamma)
        //   * e(-sum r_i C_i, delta) * e(-(sum r_i) alpha, beta) == 1
        std::vector<G1Jacobian> g1_terms;
        g1_terms.reserve(n + 3);
        G1Jacobian vk_x_acc;
        G1Jacobian c_acc;
        Fr weight_sum = Fr::zero();

        for (size_t i = 0; i < n; ++i) {
            Fe256 w = weight_from_bytes(seed.data() + i * kWeightBytes);
            g1_terms.push_back(scalar_mul(proofs[i].a.to_jacobian(), w));
            vk_x_acc = vk_x_acc + scalar_mul(input_commitment(vk, public_inputs_vec[i]), w);
            c_acc = c_acc + scalar_mul(proofs[i].c.to_jacobian(), w);
            weight_sum += Fr::from_integer(w);
            w.secure_zero();
        }
        g1_terms.push_back(-vk_x_acc);
        g1_terms.push_back(-c_acc);
        g1_terms.push_back(-scalar_mul(vk.alpha_g1.to_jacobian(), weight_sum.to_integer()));

        std::vector<G1Point> g1 = G1Point::batch_from_jacobian(g1_terms);

        std::vector<PairingInput> terms;
        terms.reserve(n + 3);
        for (size_t i = 0; i < n; ++i) {
            terms.emplace_back(g1[i], proofs[i].b);
        }
        terms.emplace_back(g1[n], vk.gamma_g2);
        terms.emplace_back(g1[n + 1], vk.delta_g2);
        terms.emplace_back(g1[n + 2], vk.beta_g2);

        result = multi_pairing(terms).is_one();
    } catch (const std::exception&) {
        result = false;
    }
    zkv_secure_zero(seed.data(), seed.size());
    return result;
}

} // namespace zkp
} // namespace zkv
