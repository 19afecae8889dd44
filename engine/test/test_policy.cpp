#include "hybrid.hpp"
#include "hybrid_error.hpp"
#include "algorithm_policy.hpp"
#include <iostream>
#include <stdexcept>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

template <typename F>
static bool rejects_with(ErrorKind kind, F&& fn) {
    try {
        fn();
    } catch (const HybridError& e) {
        return e.kind() == kind;
    }
    return false;
}

int main() {
    bool ok = true;

    // ── Tag names ─────────────────────────────────────────────────────────────
    ok &= check(algorithm_name(AlgorithmVersion::MandatoryHybrid) == "MandatoryHybrid",
                "hybrid name");
    ok &= check(parse_algorithm("Dilithium3V1") == AlgorithmVersion::Dilithium3V1,
                "legacy Dilithium3 tag still parses");
    ok &= check(parse_algorithm("Ed25519V1") == AlgorithmVersion::Ed25519V1,
                "legacy Ed25519 tag still parses");
    {
        bool threw = false;
        try { parse_algorithm("RSA2048"); } catch (const std::runtime_error&) { threw = true; }
        ok &= check(threw, "unknown algorithm name must throw");
    }

    ok &= check(is_live(AlgorithmVersion::MandatoryHybrid), "hybrid is live");
    ok &= check(!is_live(AlgorithmVersion::Dilithium3V1), "Dilithium3V1 is not live");
    ok &= check(!is_live(AlgorithmVersion::Ed25519V1), "Ed25519V1 is not live");

    // ── Generation with legacy tags ───────────────────────────────────────────
    for (AlgorithmVersion alg : {AlgorithmVersion::Dilithium3V1, AlgorithmVersion::Ed25519V1}) {
        try {
            hybrid::generate_with_algorithm(alg);
            ok &= fail("legacy generate must be rejected");
        } catch (const HybridError& e) {
            ok &= check(e.kind() == ErrorKind::PolicyRejected, "legacy generate kind");
            ok &= check(e.algorithm() && *e.algorithm() == alg, "error names the rejected tag");
        }
    }

    // ── Sign / verify / public_key with legacy tags ───────────────────────────
    KeyPair pair = hybrid::generate();
    ok &= check(pair.public_key.algorithm == AlgorithmVersion::MandatoryHybrid,
                "generated key is hybrid");

    std::vector<uint8_t> msg = {'p', 'o', 'l', 'i', 'c', 'y'};

    {
        PrivateKey legacy(AlgorithmVersion::Ed25519V1, pair.private_key.material(),
                          pair.private_key.created_at(), pair.private_key.operation_id(),
                          "legacy");
        ok &= check(rejects_with(ErrorKind::PolicyRejected,
                                 [&] { hybrid::sign(legacy, msg); }),
                    "sign with legacy-tagged key must be rejected");
        ok &= check(rejects_with(ErrorKind::PolicyRejected,
                                 [&] { legacy.public_key(); }),
                    "public_key() on legacy-tagged key must be rejected");
    }

    Signature sig = hybrid::sign(pair.private_key, msg);

    {
        PublicKey legacy_pk = pair.public_key;
        legacy_pk.algorithm = AlgorithmVersion::Dilithium3V1;
        ok &= check(rejects_with(ErrorKind::PolicyRejected,
                                 [&] { hybrid::verify(legacy_pk, msg, sig); }),
                    "verify with legacy-tagged public key must be rejected");
    }
    {
        Signature legacy_sig = sig;
        legacy_sig.algorithm = AlgorithmVersion::Ed25519V1;
        ok &= check(rejects_with(ErrorKind::PolicyRejected,
                                 [&] { hybrid::verify(pair.public_key, msg, legacy_sig); }),
                    "verify with legacy-tagged signature must be rejected");
    }

    // A key without material is unusable even under the live tag.
    {
        PrivateKey empty(AlgorithmVersion::MandatoryHybrid, std::nullopt, 0, 0, "empty");
        ok &= check(rejects_with(ErrorKind::InvalidKey,
                                 [&] { hybrid::sign(empty, msg); }),
                    "sign without material must fail with InvalidKey");
    }

    ok &= check(hybrid::verify_ok(pair.public_key, msg, sig), "hybrid round trip still verifies");

    if (ok) std::cout << "PASS\n";
    return ok ? 0 : 1;
}
