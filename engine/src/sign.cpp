#include "hybrid.hpp"
#include "algorithm_policy.hpp"
#include "dilithium_sig.hpp"
#include "ec_sig.hpp"
#include "hybrid_error.hpp"

namespace hybrid {

Signature sign(const PrivateKey& key,
               const std::vector<uint8_t>& message,
               Witness* witness)
{
    if (message.empty())
        throw HybridError(ErrorKind::EmptyMessage, "cannot sign empty message");
    if (message.size() > kMaxMessageBytes)
        throw HybridError(ErrorKind::MessageTooLarge, message.size(), kMaxMessageBytes);

    // Counted before the limit check; a rejected attempt still uses a slot.
    uint64_t count = key.record_use();
    if (count >= kMaxKeyUsage)
        throw HybridError(ErrorKind::UsageLimitExceeded, count, kMaxKeyUsage, key.key_id());

    require_live(key.algorithm(), Operation::Sign);

    const std::optional<HybridKeyMaterial>& material = key.material();
    if (!material)
        throw HybridError(ErrorKind::InvalidKey, "hybrid key has no key material");

    uint64_t operation_id = timestamp_now(witness);

    std::vector<uint8_t>     pq_sig = dilithium_sig::sign(material->dilithium.sk, message);
    ec_sig::Ed25519Signature ed_sig = ec_sig::sign(material->ed25519_sk, message);

    Signature sig;
    sig.algorithm = key.algorithm();
    sig.bytes.reserve(kHybridSignatureBytes);
    sig.bytes.insert(sig.bytes.end(), pq_sig.begin(), pq_sig.end());
    sig.bytes.insert(sig.bytes.end(), ed_sig.begin(), ed_sig.end());
    sig.created_at    = timestamp_now(witness);
    sig.operation_id  = operation_id;
    sig.signer_key_id = key.key_id();
    return sig;
}

} // namespace hybrid
