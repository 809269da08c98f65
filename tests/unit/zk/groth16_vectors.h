/**
 * @file groth16_vectors.h
 * @brief Known-good Groth16 verification key and proofs over BN254
 *
 * Two public inputs; four proofs satisfying the pairing equation.
 * G2 coordinates are listed real part first.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ZKV_TESTS_GROTH16_VECTORS_H
#define ZKV_TESTS_GROTH16_VECTORS_H

#include "zkv/zk/groth16.h"

#include <vector>

namespace zkv {
namespace test_vectors {

inline G1Point g1(const char* x, const char* y) {
    return G1Point(Fp::from_hex(x), Fp::from_hex(y));
}

inline G2Point g2(const char* x0, const char* x1, const char* y0, const char* y1) {
    return G2Point(Fp2(Fp::from_hex(x0), Fp::from_hex(x1)),
                   Fp2(Fp::from_hex(y0), Fp::from_hex(y1)));
}

inline zkp::VerificationKey verification_key() {
    zkp::VerificationKey vk;
    vk.alpha_g1 = g1("1b64df604657a8a1ddbf1f7e4bb9d3da92d1201ec085fe2276d2fc32e5681ad4",
                     "01145e6dd8856d016313d958d0323cda8ee5a5917a707a8fbabb432ac7af7971");
    vk.beta_g2 = g2("2358ecc09c2e9e34c829ede0d540eec577faf4e4a9010e6ec6ce5feafd2801dc",
                    "0ee851914015f0bc2056ac8ea44740729e47b251cac88c88d17e2192b98c211f",
                    "0bec3dc599a49ab5dc36fc4872d5be9ea1c73659e06a12ffc9c1014e976f6437",
                    "1779cdf7e5789b945ee95d987b6d5388b5e3741d3f1badf3fc552fef6ff248a4");
    vk.gamma_g2 = g2("16bbeed6222bebfde3b864e3a88cd1b25697594e2bab376fa8cdf5e1747c7a93",
                     "0f39db3ad852f0d882b7aa6284e49667215453807f7a2af45f1ee0f7fc9c7d44",
                     "2abe7168d74d3b519982c94715e8148eb021e6b0db37be32a2af9c3cbba7c142",
                     "1abd902251c83c6cfe7e67602b8fca818af0ad820a92a77cccc7a7c86fe50f6a");
    vk.delta_g2 = g2("05a414cc36f0535533643b301b1cc0556fa0ed9b67cc0c657e37f4ec685a1b2f",
                     "17b8dbc09fcf568c3d9316874b93e4c32f8222a129ac128bfa7aaa6ee9bdd0ff",
                     "0e8b7ed5765c3e9a7cd3953d5ca42200c0e07198af3b680deada8de4cad1c62b",
                     "03c37a79ee33d33fb74dbf6e9b4e5c3e3945049eb46a738473e88c39d5b1597c");
    vk.ic = {
        g1("2d6e50a89f8d4d46dc9051d257bc769088c341db5f4ff4f5bb0f0b19832ec384",
           "1c2278bfb1a486ddb1a626cbd120d9763d120d076977e457b5b8b21da1cc60c5"),
        g1("22ac850132195d7d1ee6cafdb63976dc997752a327365587e2bc13115524173d",
           "2f052049c67f4942d97585f699267a3f24b89bc62db95ab4dc87484cd81e6549"),
        g1("1211b2fd74dc7d3329b66641ea5e44cc8ce8068b69e9591350fd2de5793ddad0",
           "2d6876df9163c7ab30612232e4cfeab7ad3d01313a18d1b6704feb9334f09377"),
    };
    return vk;
}

struct ProofCase {
    zkp::Groth16Proof proof;
    std::vector<Fr> inputs;
};

inline std::vector<ProofCase> proof_cases() {
    std::vector<ProofCase> cases(4);

    cases[0].proof.a = g1("0e6d004f39f3988bc16049cdd473f35e55114fb4db73d76ea33c3bc136dcb399",
                          "0a6fc801dcf104d66874dcefb536a45fedab337b820fa40db937e5bebc28b906");
    cases[0].proof.b = g2("0b52367cac5e1a4a9b3387981beb9c90b5a41e22bb71fc6ff980a286d2b52eef",
                          "0c9f27c8a720f1982e748ef7d24d001903a22dacd905b2a393ed54afb48021a7",
                          "1109bf0ef0497c14115a1af3c78f24ac2f0acca484b92fbe5c83169cb7869b96",
                          "260d58421ee6eeafbe847db2e4f6f4e801544c11f1fc519a03552d43dbeb705d");
    cases[0].proof.c = g1("09946d9391f6bfacb2713e5433c7cadd365375f1963884020e54399767ffab76",
                          "2498d17c915965bbb6678afc3deab06f11e414680ad3ca8c98c4c6a169f6554b");
    cases[0].inputs = {Fr::from_u64(3), Fr::from_u64(35)};

    cases[1].proof.a = g1("0d01d125ccdc73bf149f82d0d93d6a6649811369e0fa7799f0958244ab8a099f",
                          "2f89d74f7573587551b9a7adc94d17cc82387917411800894a23ec8099ac8b8b");
    cases[1].proof.b = g2("26f94150339a5a2947119e0d06a3f333ed879ffa67e5b11863e8ab2229513ade",
                          "2c9739feef5952038513791ec6b1e7d19e38e3f858a435b69549e6b024953022",
                          "179602f5fc635fb26377a09e4a0b170bb036a1dbaf72e2421aff46c524e13ef0",
                          "18e52d5e162ff937a3383ef03793e6f95167ade79beffd181a9b755250ec1535");
    cases[1].proof.c = g1("2b6f55b08daa7a76a15e7b94a6002e215f207dbd9bbacaf2ae1a545af6c695f6",
                          "110e50e5faabd87631dc5ce85d6d2573d5e49857a9e3c9109f52a14c07eedebc");
    cases[1].inputs = {
        Fr::from_hex("05d9220685808969bb3fb8a6f29e2c63b4e204562632b0ff72418008b3f69556"),
        Fr::from_hex("09b21d095b419adb05e653ea113f1f063683f6ee5ad461413fa39e3343b274e1"),
    };

    cases[2].proof.a = g1("2eac4e003777d178f294f7bd37e0a276dd6665921c86672569256cffebc19a61",
                          "1c253ef69eb3b56cfe5c869822094999c48f0a72fef3b919c6c9a5b16754a9ad");
    cases[2].proof.b = g2("10c79e5d0929781ff860ab87f41d51180504b3be59532a148f7d5d19e525acbf",
                          "2e5908636185715be906cd8bcd0914540a60416e769f1794c40d867e679b8c87",
                          "1bb48f9b90dbca61d4b9c28df0d67aec03f766ad7b213481e1a9aa7b493d0b43",
                          "0f9cf7b82a7a2bf4a1bff262d1ef1f65ba37670e31f596e6ead3072a26cd76ed");
    cases[2].proof.c = g1("192eb125fe5c532a28d700f530b36ca986325e38a38ed3d371d3288b694f9194",
                          "0f46bb115f3190c1cf78e1603ad20c24c5fdef716a1797519dbadf9eb45d0979");
    cases[2].inputs = {
        Fr::from_hex("0adda3d03043270b2dce55a6fd81f5f68cc3129ab75d11c857af3068dba789af"),
        Fr::from_hex("06720402799b475bd0f34316048ca779d766419b825484eacd9a1e9c75fe1b23"),
    };

    cases[3].proof.a = g1("0b3faec5d08efcbed54c8f20037250abb1822af17f22121a275a9efe0f213de4",
                          "26769892e59c5fcd88cde67a1be284d5a1894921141de9d7504d4b05908e9d6b");
    cases[3].proof.b = g2("0da3e0ec3dae8a6e8ac75d732e10b857d30e1ae1711e04a877b8b022a6855551",
                          "0acc8ab3b1c9e8a1bec8e1f3d0b4b144594354dc5107bf08bd6645da3aefa890",
                          "13c5e90e13efaf8205e588972ac2309d991ca64f3dedbc6657084ecb059ccb02",
                          "20b6bfeb60e0de8d0162ecc83232eef10a70285f6cb1d770a00d94625997a94d");
    cases[3].proof.c = g1("1ff1984d2e1e718d1ff2b81a9de4675bba93a80521e4446278db42af8a70c014",
                          "1565d2ac431eb580ed5a2f56b360d1b5fd313f0fc9128989deeb13b792a195cf");
    cases[3].inputs = {
        Fr::from_hex("1ec3abd96eeaa92b1c98c18d07d64499a835b85fe691ee15dbc4f50bfc5f5b27"),
        Fr::from_hex("23c65cf70f870e6a26cfb3f3a8dba797dc7d4bc2c5bd42feb6fbb997aaa581ba"),
    };

    return cases;
}

} // namespace test_vectors
} // namespace zkv

#endif // ZKV_TESTS_GROTH16_VECTORS_H
