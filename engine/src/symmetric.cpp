#include "symmetric.hpp"
#include "entropy.hpp"
#include "hybrid_error.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <algorithm>

std::vector<uint8_t> aes256gcm_encrypt(const AesKey& key,
                                       const std::vector<uint8_t>& plaintext)
{
    uint8_t nonce[AES_GCM_NONCE_LEN];
    secure_random_bytes(nonce, AES_GCM_NONCE_LEN);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw HybridError(ErrorKind::CryptoFailure, "EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, AES_GCM_NONCE_LEN, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1) {
        cleanup(); throw HybridError(ErrorKind::CryptoFailure, "AES-256-GCM encrypt init failed");
    }

    std::vector<uint8_t> out(AES_GCM_NONCE_LEN + plaintext.size() + AES_GCM_TAG_LEN);
    std::copy(nonce, nonce + AES_GCM_NONCE_LEN, out.begin());
    uint8_t* ct = out.data() + AES_GCM_NONCE_LEN;

    int len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx, ct, &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            cleanup(); throw HybridError(ErrorKind::CryptoFailure, "AES-256-GCM EncryptUpdate failed");
        }
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx, ct + len, &final_len) != 1) {
        cleanup(); throw HybridError(ErrorKind::CryptoFailure, "AES-256-GCM EncryptFinal failed");
    }

    uint8_t* tag = ct + len + final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, AES_GCM_TAG_LEN, tag) != 1) {
        cleanup(); throw HybridError(ErrorKind::CryptoFailure, "AES-256-GCM GET_TAG failed");
    }
    cleanup();
    return out;
}

std::vector<uint8_t> aes256gcm_decrypt(const AesKey& key,
                                       const std::vector<uint8_t>& blob)
{
    if (blob.size() < static_cast<size_t>(AES_GCM_NONCE_LEN + AES_GCM_TAG_LEN))
        throw HybridError(ErrorKind::DecryptionFailed, blob.size(),
                          AES_GCM_NONCE_LEN + AES_GCM_TAG_LEN, "input too short");

    const uint8_t* nonce  = blob.data();
    const uint8_t* ct     = blob.data() + AES_GCM_NONCE_LEN;
    size_t         ct_len = blob.size() - AES_GCM_NONCE_LEN - AES_GCM_TAG_LEN;
    const uint8_t* tag    = ct + ct_len;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw HybridError(ErrorKind::CryptoFailure, "EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, AES_GCM_NONCE_LEN, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1) {
        cleanup(); throw HybridError(ErrorKind::CryptoFailure, "AES-256-GCM decrypt init failed");
    }

    std::vector<uint8_t> pt(ct_len);
    int len = 0;
    if (ct_len > 0) {
        if (EVP_DecryptUpdate(ctx, pt.data(), &len, ct, static_cast<int>(ct_len)) != 1) {
            cleanup(); throw HybridError(ErrorKind::DecryptionFailed, "DecryptUpdate failed");
        }
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, AES_GCM_TAG_LEN,
                            const_cast<uint8_t*>(tag)) != 1) {
        cleanup(); throw HybridError(ErrorKind::CryptoFailure, "AES-256-GCM SET_TAG failed");
    }

    int final_len = 0;
    int rc = EVP_DecryptFinal_ex(ctx, pt.data() + len, &final_len);
    cleanup();

    if (rc != 1) {
        OPENSSL_cleanse(pt.data(), pt.size());
        throw HybridError(ErrorKind::DecryptionFailed, "authentication failed");
    }

    pt.resize(static_cast<size_t>(len + final_len));
    return pt;
}
