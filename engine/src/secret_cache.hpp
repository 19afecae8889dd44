#pragma once
#include "hybrid_key.hpp"
#include "secret_store.hpp"
#include "symmetric.hpp"
#include <optional>
#include <string>
#include <vector>

// Encrypted-at-rest cache for the Dilithium3 half of seed-derived keys.
//
//   key   = SHA-256("AF_ENCRYPTION_KEY_V1" || seed || "DILITHIUM_STORAGE")
//   name  = ".af_dilithium_" || hex(SHA-256("AF_FILENAME_V1" || seed)[0..16])
//   blob  = AES-256-GCM(key, pq_pk || pq_sk) as nonce(12) || ct || tag(16)
//
// The seed itself is never stored and never used directly as a cipher key.
// Entries never expire; evict() is the only way to drop one.
class SecretCache {
public:
    explicit SecretCache(SecretStore& store) : store_(store) {}

    // std::nullopt on a miss. Throws HybridError{CacheRead, CachePath,
    // DecryptionFailed, CacheFormat} when an entry exists but is unusable.
    std::optional<PqKeyPair> load(const Seed& seed);

    // Throws HybridError{CacheWrite, CachePath}.
    void save(const Seed& seed, const PqKeyPair& keypair);

    bool evict(const Seed& seed);

    SecretStore& store() { return store_; }

private:
    SecretStore& store_;
};

namespace secret_cache {

AesKey      derive_encryption_key(const Seed& seed);
std::string cache_file_name(const Seed& seed);

std::vector<uint8_t> encrypt_keypair(const Seed& seed, const PqKeyPair& keypair);

// Throws HybridError{DecryptionFailed} if the blob does not authenticate
// under this seed's key, {CacheFormat} if the plaintext has the wrong size.
PqKeyPair decrypt_keypair(const Seed& seed, const std::vector<uint8_t>& blob);

} // namespace secret_cache
