#include "hybrid.hpp"
#include "algorithm_policy.hpp"
#include "dilithium_sig.hpp"
#include "ec_sig.hpp"
#include "hybrid_error.hpp"

namespace hybrid {

void verify(const PublicKey& public_key,
            const std::vector<uint8_t>& message,
            const Signature& signature)
{
    require_live(public_key.algorithm, Operation::Verify);
    require_live(signature.algorithm, Operation::Verify);

    // Lengths are checked against the fixed primitive widths before any
    // segment is read.
    if (public_key.bytes.size() < kHybridPublicKeyBytes)
        throw HybridError(ErrorKind::InvalidKeyLength,
                          public_key.bytes.size(), kHybridPublicKeyBytes);

    const uint8_t* pq_pk = public_key.bytes.data();
    const uint8_t* ed_pk = public_key.bytes.data() + kPqPublicKeyBytes;
    if (!ec_sig::public_key_decodes(ed_pk))
        throw HybridError(ErrorKind::InvalidClassicalKey);

    if (signature.bytes.size() < kHybridSignatureBytes)
        throw HybridError(ErrorKind::InvalidSignatureLength,
                          signature.bytes.size(), kHybridSignatureBytes);

    const uint8_t* pq_sig = signature.bytes.data();
    const uint8_t* ed_sig = signature.bytes.data() + kPqSignatureBytes;

    if (!dilithium_sig::verify(pq_pk, message, pq_sig))
        throw HybridError(ErrorKind::PqVerifyFailed, signature.signer_key_id);

    if (!ec_sig::verify(ed_pk, message, ed_sig))
        throw HybridError(ErrorKind::ClassicalVerifyFailed, signature.signer_key_id);
}

bool verify_ok(const PublicKey& public_key,
               const std::vector<uint8_t>& message,
               const Signature& signature)
{
    try {
        verify(public_key, message, signature);
        return true;
    } catch (const HybridError&) {
        return false;
    }
}

} // namespace hybrid
