#include "dilithium_sig.hpp"
#include "dilithium_api.hpp"
#include "hybrid_error.hpp"
#include <string>

namespace dilithium_sig {

PqKeyPair keygen() {
    PqKeyPair kp;
    kp.pk.resize(kPqPublicKeyBytes);
    kp.sk.resize(kPqSecretKeyBytes);

    int rc = pqcrystals_dilithium3_ref_keypair(kp.pk.data(), kp.sk.data());
    if (rc != 0)
        throw HybridError(ErrorKind::CryptoFailure,
                          "Dilithium3 keygen failed (rc=" + std::to_string(rc) + ")");
    return kp;
}

std::vector<uint8_t> sign(const std::vector<uint8_t>& sk,
                          const std::vector<uint8_t>& msg)
{
    if (sk.size() != kPqSecretKeyBytes)
        throw HybridError(ErrorKind::InvalidKey, sk.size(), kPqSecretKeyBytes,
                          "Dilithium3 secret key size");

    std::vector<uint8_t> sig(kPqSignatureBytes);
    size_t siglen = 0;
    int rc = pqcrystals_dilithium3_ref_signature(
        sig.data(), &siglen,
        msg.data(), msg.size(),
        nullptr, 0,
        sk.data());

    if (rc != 0)
        throw HybridError(ErrorKind::CryptoFailure,
                          "Dilithium3 signature failed (rc=" + std::to_string(rc) + ")");
    if (siglen != kPqSignatureBytes)
        throw HybridError(ErrorKind::CryptoFailure, siglen, kPqSignatureBytes,
                          "Dilithium3 signature length");
    return sig;
}

bool verify(const uint8_t* pk,
            const std::vector<uint8_t>& msg,
            const uint8_t* sig)
{
    int rc = pqcrystals_dilithium3_ref_verify(
        sig, kPqSignatureBytes,
        msg.data(), msg.size(),
        nullptr, 0,
        pk);
    return (rc == 0);
}

} // namespace dilithium_sig
