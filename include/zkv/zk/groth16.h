/**
 * @file groth16.h
 * @brief Groth16 zk-SNARK Proof Verification over BN254
 *
 * Decides the Groth16 pairing equation
 *
 *   e(A, B) = e(alpha, beta) * e(vk_x, gamma) * e(C, delta)
 *   vk_x    = IC[0] + sum_i input[i] * IC[i + 1]
 *
 * evaluated as a single multi-pairing equal to the identity:
 *
 *   e(A, B) * e(-vk_x, gamma) * e(-C, delta) * e(-alpha, beta) == 1
 *
 * Usage Example:
 * @code
 *   zkv::pairing_init();
 *   auto vk = zkp::VerificationKey::deserialize(vk_bytes.data(), vk_bytes.size());
 *   auto proof = zkp::Groth16Proof::deserialize(proof_bytes.data(), proof_bytes.size());
 *   bool valid = zkp::Groth16::verify(vk, proof, public_inputs);
 * @endcode
 *
 * Every verify entry point returns a plain bool and never throws. A
 * malformed key, a point off its curve or outside the prime-order
 * subgroup, an uninitialized engine and a proof that does not satisfy
 * the equation all yield false.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ZKV_ZK_GROTH16_H
#define ZKV_ZK_GROTH16_H

#include "zkv/ec/point.h"
#include "zkv/pairing/pairing.h"

#include <cstdint>
#include <string>
#include <vector>

namespace zkv {
namespace zkp {

// ============================================================================
// Keys and Proofs
// ============================================================================

/**
 * @brief Groth16 verification key
 *
 * Binary layout (serialize/deserialize):
 *   alpha_g1 (64) | beta_g2 (128) | gamma_g2 (128) | delta_g2 (128) |
 *   ic_len (u32 little-endian) | ic[0..ic_len) (64 each)
 */
struct VerificationKey {
    G1Point alpha_g1;
    G2Point beta_g2;
    G2Point gamma_g2;
    G2Point delta_g2;
    std::vector<G1Point> ic;  // ic[0] constant term, ic[i + 1] for public input i

    /**
     * @brief Number of public inputs this key expects (ic.size() - 1)
     */
    size_t num_public_inputs() const { return ic.empty() ? 0 : ic.size() - 1; }

    /**
     * @brief Every point on its curve and in the prime-order subgroup
     */
    bool is_valid() const;

    std::vector<uint8_t> serialize() const;

    /**
     * @throws std::invalid_argument on truncated data, trailing bytes,
     *         non-canonical coordinates or invalid points
     */
    static VerificationKey deserialize(const uint8_t* data, size_t len);
};

/**
 * @brief Groth16 proof (A, B, C)
 */
struct Groth16Proof {
    G1Point a;  // [A]1
    G2Point b;  // [B]2
    G1Point c;  // [C]1

    static constexpr size_t kSerializedSize = 256;

    bool is_valid() const;

    /**
     * @brief a (64) | b (128) | c (64)
     */
    std::vector<uint8_t> serialize() const;

    /**
     * @throws std::invalid_argument on wrong length or invalid points
     */
    static Groth16Proof deserialize(const uint8_t* data, size_t len);

    size_t size() const { return kSerializedSize; }
};

class Groth16;

/**
 * @brief Verification key with e(alpha, beta) precomputed
 *
 * Saves one Miller loop per verification when the same key checks many
 * proofs. Only Groth16::prepare() builds one, after validating every
 * key point, so a prepared key is always usable.
 */
class PreparedVerificationKey {
public:
    const VerificationKey& key() const { return vk_; }
    const GTElement& alpha_beta() const { return alpha_beta_; }

private:
    friend class Groth16;

    PreparedVerificationKey(const VerificationKey& vk, const GTElement& alpha_beta)
        : vk_(vk), alpha_beta_(alpha_beta) {}

    VerificationKey vk_;
    GTElement alpha_beta_;
};

// ============================================================================
// Groth16 Verifier
// ============================================================================

class Groth16 {
public:
    /**
     * @brief Below this many proofs batch_verify() checks them one by one
     */
    static constexpr size_t kBatchThreshold = 4;

    /**
     * @brief Verify a proof
     * @param vk Verification key
     * @param proof Proof to verify
     * @param public_inputs Public inputs, one per ic entry after the first
     * @return true if and only if the proof satisfies the pairing equation
     */
    static bool verify(const VerificationKey& vk,
                       const Groth16Proof& proof,
                       const std::vector<Fr>& public_inputs);

    /**
     * @brief Validate the key and precompute e(alpha, beta)
     * @throws std::invalid_argument if the key is malformed or degenerate
     * @throws std::logic_error if the pairing engine is not initialized
     */
    static PreparedVerificationKey prepare(const VerificationKey& vk);

    /**
     * @brief Verify against a prepared key
     */
    static bool verify(const PreparedVerificationKey& pvk,
                       const Groth16Proof& proof,
                       const std::vector<Fr>& public_inputs);

    /**
     * @brief Verify several proofs for one key
     *
     * From kBatchThreshold proofs on, uses a random linear combination with
     * 128-bit weights drawn from the OS CSPRNG so that all proofs share a
     * single final exponentiation. Returns false if any proof is invalid,
     * if the sizes disagree or if randomness is unavailable. An empty batch
     * verifies.
     */
    static bool batch_verify(const VerificationKey& vk,
                             const std::vector<Groth16Proof>& proofs,
                             const std::vector<std::vector<Fr>>& public_inputs_vec);
};

// ============================================================================
// Public Inputs
// ============================================================================

/**
 * @brief Parse one public input written in decimal or 0x-prefixed hex
 * @throws std::invalid_argument if malformed, negative or not below r
 */
Fr parse_public_input(const std::string& text);

/**
 * @brief Parse one public input per non-empty line; '#' starts a comment
 * @throws std::invalid_argument naming the offending line
 */
std::vector<Fr> parse_public_inputs(const std::string& text);

} // namespace zkp
} // namespace zkv

#endif // ZKV_ZK_GROTH16_H
