#include "secret_cache.hpp"
#include "digest.hpp"
#include "hybrid_error.hpp"
#include <openssl/crypto.h>

namespace secret_cache {

static const char* kKeyLabel      = "AF_ENCRYPTION_KEY_V1";
static const char* kKeyLabelTail  = "DILITHIUM_STORAGE";
static const char* kNameLabel     = "AF_FILENAME_V1";
static const char* kNamePrefix    = ".af_dilithium_";
static constexpr size_t kNameHashBytes = 16;

static std::vector<uint8_t> seed_bytes(const Seed& seed) {
    return std::vector<uint8_t>(seed.begin(), seed.end());
}

AesKey derive_encryption_key(const Seed& seed) {
    std::vector<uint8_t> s = seed_bytes(seed);
    AesKey key = sha256({label_bytes(kKeyLabel), s, label_bytes(kKeyLabelTail)});
    OPENSSL_cleanse(s.data(), s.size());
    return key;
}

std::string cache_file_name(const Seed& seed) {
    std::vector<uint8_t> s = seed_bytes(seed);
    Sha256Digest h = sha256({label_bytes(kNameLabel), s});
    OPENSSL_cleanse(s.data(), s.size());
    return std::string(kNamePrefix) + hex_encode(h.data(), kNameHashBytes);
}

std::vector<uint8_t> encrypt_keypair(const Seed& seed, const PqKeyPair& keypair) {
    if (keypair.pk.size() != kPqPublicKeyBytes || keypair.sk.size() != kPqSecretKeyBytes)
        throw HybridError(ErrorKind::CacheFormat,
                          keypair.pk.size() + keypair.sk.size(),
                          kPqPublicKeyBytes + kPqSecretKeyBytes,
                          "Dilithium3 keypair size");

    std::vector<uint8_t> plaintext;
    plaintext.reserve(kPqPublicKeyBytes + kPqSecretKeyBytes);
    plaintext.insert(plaintext.end(), keypair.pk.begin(), keypair.pk.end());
    plaintext.insert(plaintext.end(), keypair.sk.begin(), keypair.sk.end());

    AesKey key = derive_encryption_key(seed);
    std::vector<uint8_t> blob = aes256gcm_encrypt(key, plaintext);

    OPENSSL_cleanse(key.data(), key.size());
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return blob;
}

PqKeyPair decrypt_keypair(const Seed& seed, const std::vector<uint8_t>& blob) {
    AesKey key = derive_encryption_key(seed);
    std::vector<uint8_t> plaintext;
    try {
        plaintext = aes256gcm_decrypt(key, blob);
    } catch (...) {
        OPENSSL_cleanse(key.data(), key.size());
        throw;
    }
    OPENSSL_cleanse(key.data(), key.size());

    if (plaintext.size() != kPqPublicKeyBytes + kPqSecretKeyBytes) {
        size_t got = plaintext.size();
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw HybridError(ErrorKind::CacheFormat, got,
                          kPqPublicKeyBytes + kPqSecretKeyBytes,
                          "decrypted Dilithium3 keypair size");
    }

    PqKeyPair kp;
    kp.pk.assign(plaintext.begin(), plaintext.begin() + kPqPublicKeyBytes);
    kp.sk.assign(plaintext.begin() + kPqPublicKeyBytes, plaintext.end());
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return kp;
}

} // namespace secret_cache

// ── SecretCache ───────────────────────────────────────────────────────────────

std::optional<PqKeyPair> SecretCache::load(const Seed& seed) {
    std::optional<std::vector<uint8_t>> blob = store_.read(secret_cache::cache_file_name(seed));
    if (!blob)
        return std::nullopt;
    return secret_cache::decrypt_keypair(seed, *blob);
}

void SecretCache::save(const Seed& seed, const PqKeyPair& keypair) {
    store_.write(secret_cache::cache_file_name(seed),
                 secret_cache::encrypt_keypair(seed, keypair));
}

bool SecretCache::evict(const Seed& seed) {
    return store_.erase(secret_cache::cache_file_name(seed));
}
