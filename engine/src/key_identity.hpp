#pragma once
#include "hybrid_key.hpp"
#include <string>
#include <vector>

// BLAKE3 (derive-key mode, context "worf public-key fingerprint v1") over
// len32le(algorithm name) || name || len32le(bytes) || bytes.
// 16 bytes, lowercase hex. Depends only on the algorithm and key bytes, so
// it survives re-serialization and is stable across created_at changes.
std::string public_key_fingerprint(const PublicKey& pk);

// 20-byte address: SHA-256(bytes || le64(created_at) || le64(operation_id))[0..20].
std::vector<uint8_t> public_key_address(const PublicKey& pk);
