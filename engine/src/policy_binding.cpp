#include "hybrid.hpp"
#include "hybrid_error.hpp"
#include <exception>

namespace hybrid {

KeyPair generate_policy_bound(const PolicyHash& policy_hash,
                              Witness* witness,
                              BindingMode mode)
{
    if (!witness) {
        if (mode == BindingMode::AllowUnbound)
            return generate();
        throw HybridError(ErrorKind::BindingUnavailable,
                          "no witness configured for policy-bound key");
    }

    WitnessProof proof;
    try {
        proof = witness->attest(policy_hash);
    } catch (const std::exception& e) {
        throw HybridError(ErrorKind::AttestationFailed, e.what());
    }

    KeyPair pair = generate(witness);

    std::vector<uint8_t> binding;
    binding.reserve(policy_hash.size() + proof.commitment_hash.size());
    binding.insert(binding.end(), policy_hash.begin(), policy_hash.end());
    binding.insert(binding.end(), proof.commitment_hash.begin(), proof.commitment_hash.end());

    Signature binding_sig = sign(pair.private_key, binding, witness);
    verify(pair.public_key, binding, binding_sig);

    return pair;
}

} // namespace hybrid
