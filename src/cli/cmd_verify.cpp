/**
 * @file cmd_verify.cpp
 * @brief verify subcommand: check a Groth16 proof from files
 *
 * Exit codes: 0 valid, 1 invalid proof, 2 usage or input error.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "cli_utils.h"
#include "zkv/zk/groth16.h"

#include <iostream>
#include <string>

namespace {

void print_verify_help() {
    std::cout << "\nUsage: zkv verify -vk <file> -proof <file> [-inputs <file>] [-hex]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -vk <file>        Verification key (alpha|beta|gamma|delta|u32 ic_len|ic)\n";
    std::cout << "  -proof <file>     Proof, 256 bytes (a|b|c)\n";
    std::cout << "  -inputs <file>    Public inputs, one decimal or 0x-hex value per line\n";
    std::cout << "  -hex              Key and proof files hold hex text instead of binary\n";
    std::cout << "  --help            Show this help message\n\n";
}

} // namespace

int cmd_verify(int argc, char* argv[]) {
    using namespace zkv;

    std::string vk_file;
    std::string proof_file;
    std::string inputs_file;
    bool as_hex = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_verify_help();
            return 0;
        } else if (arg == "-vk" && i + 1 < argc) {
            vk_file = argv[++i];
        } else if (arg == "-proof" && i + 1 < argc) {
            proof_file = argv[++i];
        } else if (arg == "-inputs" && i + 1 < argc) {
            inputs_file = argv[++i];
        } else if (arg == "-hex") {
            as_hex = true;
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            print_verify_help();
            return 2;
        }
    }

    if (vk_file.empty() || proof_file.empty()) {
        std::cerr << "Error: -vk and -proof are required\n";
        print_verify_help();
        return 2;
    }

    if (!pairing_init()) {
        std::cerr << "Error: pairing engine initialization failed\n";
        return 2;
    }

    zkp::VerificationKey vk;
    zkp::Groth16Proof proof;
    std::vector<Fr> inputs;
    try {
        std::vector<uint8_t> vk_bytes = cli::read_blob(vk_file, as_hex);
        vk = zkp::VerificationKey::deserialize(vk_bytes.data(), vk_bytes.size());

        std::vector<uint8_t> proof_bytes = cli::read_blob(proof_file, as_hex);
        proof = zkp::Groth16Proof::deserialize(proof_bytes.data(), proof_bytes.size());

        if (!inputs_file.empty()) {
            inputs = zkp::parse_public_inputs(cli::read_text_file(inputs_file));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (vk.ic.size() != inputs.size() + 1) {
        std::cerr << "Error: key expects " << vk.num_public_inputs()
                  << " public inputs, got " << inputs.size() << "\n";
        return 2;
    }

    if (zkp::Groth16::verify(vk, proof, inputs)) {
        std::cout << "Proof: VALID\n";
        return 0;
    }
    std::cout << "Proof: INVALID\n";
    return 1;
}
