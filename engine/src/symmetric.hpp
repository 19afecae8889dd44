#pragma once
#include <array>
#include <vector>
#include <cstdint>

// AES-256-GCM using OpenSSL EVP.
// Blob layout: nonce(12) || ciphertext(N) || tag(16)

static constexpr int AES_GCM_NONCE_LEN = 12;
static constexpr int AES_GCM_TAG_LEN   = 16;

using AesKey = std::array<uint8_t, 32>;

// Fresh random nonce per call. Throws HybridError{EntropyFailure} if the
// nonce cannot be drawn, {CryptoFailure} on cipher errors.
std::vector<uint8_t> aes256gcm_encrypt(const AesKey& key,
                                       const std::vector<uint8_t>& plaintext);

// Throws HybridError{DecryptionFailed} for short input, wrong key,
// corruption or tampering. Nothing is returned unless the tag checks.
std::vector<uint8_t> aes256gcm_decrypt(const AesKey& key,
                                       const std::vector<uint8_t>& blob);
