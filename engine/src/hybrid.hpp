#pragma once
#include "hybrid_key.hpp"
#include "secret_cache.hpp"
#include "witness.hpp"
#include <vector>
#include <cstdint>

// Mandatory hybrid Dilithium3 + Ed25519 signatures.
//
// Every call is synchronous and reports failure by throwing HybridError.
// Nothing is retried internally. `witness` may be null everywhere; when set,
// its clock stamps created_at / operation_id.

namespace hybrid {

// Fresh keypair from OS entropy.
KeyPair generate(Witness* witness = nullptr);

// As generate(), but the two single-algorithm tags are rejected with
// PolicyRejected before any key material is produced.
KeyPair generate_with_algorithm(AlgorithmVersion algorithm,
                                Witness* witness = nullptr);

// Deterministic keypair. The Ed25519 half comes from the seed alone; the
// Dilithium3 half is read from `cache`, or generated and written there on a
// miss. operation_id is the big-endian value of seed[0..8].
KeyPair generate_from_seed(const Seed& seed,
                           SecretCache& cache,
                           Witness* witness = nullptr);

// Checks the message (non-empty, at most kMaxMessageBytes), counts the use
// against kMaxKeyUsage, then signs with both halves.
Signature sign(const PrivateKey& key,
               const std::vector<uint8_t>& message,
               Witness* witness = nullptr);

// Returns normally only if both halves verify. Throws at the first failing
// gate: PolicyRejected, InvalidKeyLength, InvalidClassicalKey,
// InvalidSignatureLength, PqVerifyFailed, ClassicalVerifyFailed.
void verify(const PublicKey& public_key,
            const std::vector<uint8_t>& message,
            const Signature& signature);

// Non-throwing form of verify() for callers that only need accept/reject.
bool verify_ok(const PublicKey& public_key,
               const std::vector<uint8_t>& message,
               const Signature& signature);

enum class BindingMode {
    Required,       // no witness → BindingUnavailable
    AllowUnbound,   // no witness → plain generate(), policy hash ignored
};

// Keypair whose first signature binds it to policy_hash:
// sign(policy_hash || proof.commitment_hash) and verify it before returning.
// No key material is returned unless that binding verifies.
KeyPair generate_policy_bound(const PolicyHash& policy_hash,
                              Witness* witness,
                              BindingMode mode = BindingMode::Required);

} // namespace hybrid
