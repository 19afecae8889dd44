#include "hybrid.hpp"
#include "algorithm_policy.hpp"
#include "dilithium_sig.hpp"
#include "digest.hpp"
#include "ec_sig.hpp"
#include "hybrid_error.hpp"
#include <openssl/crypto.h>
#include <string>
#include <utility>

namespace hybrid {

static HybridKeyMaterial assemble(PqKeyPair dilithium, const ec_sig::Ed25519KeyPair& ed) {
    HybridKeyMaterial m;
    m.dilithium  = std::move(dilithium);
    m.ed25519_sk = ed.sk;
    m.ed25519_pk = ed.pk;
    return m;
}

// Builds both halves of the pair from one set of material so that the
// PublicKey bytes are exactly what PrivateKey::public_key() derives.
static KeyPair make_pair(HybridKeyMaterial material,
                         uint64_t created_at,
                         uint64_t operation_id,
                         std::string key_id)
{
    PrivateKey priv(AlgorithmVersion::MandatoryHybrid, std::move(material),
                    created_at, operation_id, std::move(key_id));
    PublicKey pub = priv.public_key();
    return KeyPair{std::move(priv), std::move(pub)};
}

KeyPair generate(Witness* witness) {
    return generate_with_algorithm(AlgorithmVersion::MandatoryHybrid, witness);
}

KeyPair generate_with_algorithm(AlgorithmVersion algorithm, Witness* witness) {
    require_live(algorithm, Operation::Generate);

    // One reading serves as both created_at and operation_id.
    uint64_t now = timestamp_now(witness);

    PqKeyPair              dilithium = dilithium_sig::keygen();
    ec_sig::Ed25519KeyPair ed        = ec_sig::keygen();
    HybridKeyMaterial      material  = assemble(std::move(dilithium), ed);
    OPENSSL_cleanse(ed.sk.data(), ed.sk.size());

    return make_pair(std::move(material), now, now,
                     "mandatory-hybrid-" + std::to_string(now));
}

KeyPair generate_from_seed(const Seed& seed, SecretCache& cache, Witness* witness) {
    uint64_t operation_id = 0;
    for (size_t i = 0; i < 8; ++i)
        operation_id = (operation_id << 8) | seed[i];

    std::optional<PqKeyPair> dilithium = cache.load(seed);
    if (!dilithium) {
        dilithium = dilithium_sig::keygen();
        cache.save(seed, *dilithium);
    }

    ec_sig::Ed25519KeyPair ed       = ec_sig::keygen_from_seed(seed);
    HybridKeyMaterial      material = assemble(std::move(*dilithium), ed);
    OPENSSL_cleanse(ed.sk.data(), ed.sk.size());

    uint64_t created_at = timestamp_now(witness);
    return make_pair(std::move(material), created_at, operation_id,
                     "deterministic-hybrid-" + hex_encode(seed.data(), 8));
}

} // namespace hybrid
