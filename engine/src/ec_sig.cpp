#include "ec_sig.hpp"
#include "entropy.hpp"
#include "hybrid_error.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <string>

namespace ec_sig {

// ── Key derivation ────────────────────────────────────────────────────────────

Ed25519KeyPair keypair_from_secret(const Ed25519Secret& sk) {
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   sk.data(), sk.size());
    if (!pkey) throw HybridError(ErrorKind::CryptoFailure, "Ed25519: load sk failed");

    Ed25519KeyPair kp;
    kp.sk = sk;
    size_t pk_len = kp.pk.size();
    if (EVP_PKEY_get_raw_public_key(pkey, kp.pk.data(), &pk_len) <= 0 ||
        pk_len != kClassicalPublicKeyBytes) {
        EVP_PKEY_free(pkey);
        throw HybridError(ErrorKind::CryptoFailure, "Ed25519: extract pk failed");
    }
    EVP_PKEY_free(pkey);
    return kp;
}

Ed25519KeyPair keygen() {
    Ed25519Secret sk;
    secure_random_bytes(sk.data(), sk.size());
    Ed25519KeyPair kp = keypair_from_secret(sk);
    OPENSSL_cleanse(sk.data(), sk.size());
    return kp;
}

Ed25519KeyPair keygen_from_seed(const Seed& seed) {
    // 4-byte little-endian block counter || 12-byte nonce, all zero
    uint8_t iv[16] = {};
    uint8_t zeros[kClassicalSecretKeyBytes] = {};

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw HybridError(ErrorKind::CryptoFailure, "EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_EncryptInit_ex(ctx, EVP_chacha20(), nullptr, seed.data(), iv) != 1) {
        cleanup(); throw HybridError(ErrorKind::CryptoFailure, "ChaCha20 init failed");
    }

    Ed25519Secret sk;
    int len = 0;
    if (EVP_EncryptUpdate(ctx, sk.data(), &len, zeros, (int)sizeof(zeros)) != 1 ||
        len != (int)sk.size()) {
        cleanup(); throw HybridError(ErrorKind::CryptoFailure, "ChaCha20 keystream failed");
    }
    cleanup();

    Ed25519KeyPair kp = keypair_from_secret(sk);
    OPENSSL_cleanse(sk.data(), sk.size());
    return kp;
}

// ── Sign / verify ─────────────────────────────────────────────────────────────

Ed25519Signature sign(const Ed25519Secret& sk, const std::vector<uint8_t>& msg) {
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   sk.data(), sk.size());
    if (!pkey) throw HybridError(ErrorKind::CryptoFailure, "Ed25519 sign: load sk failed");

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        throw HybridError(ErrorKind::CryptoFailure, "Ed25519 sign: EVP_MD_CTX_new failed");
    }

    // Ed25519 requires nullptr md (hashes internally) and one-shot signing
    if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey) <= 0) {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        throw HybridError(ErrorKind::CryptoFailure, "Ed25519 sign: DigestSignInit failed");
    }

    Ed25519Signature sig{};
    size_t sig_len = sig.size();
    int rc = EVP_DigestSign(ctx, sig.data(), &sig_len, msg.data(), msg.size());
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);

    if (rc <= 0 || sig_len != kClassicalSignatureBytes)
        throw HybridError(ErrorKind::CryptoFailure, "Ed25519 sign: DigestSign failed");
    return sig;
}

bool public_key_decodes(const uint8_t* pk) {
    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                  pk, kClassicalPublicKeyBytes);
    if (!pkey) return false;
    EVP_PKEY_free(pkey);
    return true;
}

bool verify(const uint8_t* pk,
            const std::vector<uint8_t>& msg,
            const uint8_t* sig)
{
    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                  pk, kClassicalPublicKeyBytes);
    if (!pkey) return false;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        throw HybridError(ErrorKind::CryptoFailure, "Ed25519 verify: EVP_MD_CTX_new failed");
    }

    if (EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey) <= 0) {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        throw HybridError(ErrorKind::CryptoFailure, "Ed25519 verify: DigestVerifyInit failed");
    }

    int rc = EVP_DigestVerify(ctx, sig, kClassicalSignatureBytes,
                              msg.data(), msg.size());
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return (rc == 1);
}

} // namespace ec_sig
