#pragma once
#include "hybrid_key.hpp"
#include <array>
#include <vector>
#include <cstdint>

namespace ec_sig {

using Ed25519Secret    = std::array<uint8_t, kClassicalSecretKeyBytes>;
using Ed25519Public    = std::array<uint8_t, kClassicalPublicKeyBytes>;
using Ed25519Signature = std::array<uint8_t, kClassicalSignatureBytes>;

struct Ed25519KeyPair {
    Ed25519Secret sk{};
    Ed25519Public pk{};
};

// Fresh keypair; the 32-byte secret comes from secure_random_bytes().
Ed25519KeyPair keygen();

// Deterministic keypair: the secret is the first 32 bytes of the ChaCha20
// keystream keyed by seed (all-zero nonce and counter).
Ed25519KeyPair keygen_from_seed(const Seed& seed);

// Recompute the public half of a raw 32-byte secret.
Ed25519KeyPair keypair_from_secret(const Ed25519Secret& sk);

Ed25519Signature sign(const Ed25519Secret& sk, const std::vector<uint8_t>& msg);

// True if pk (kClassicalPublicKeyBytes bytes) loads as an Ed25519 key.
bool public_key_decodes(const uint8_t* pk);

// Verify sig (kClassicalSignatureBytes bytes) over msg with pk.
bool verify(const uint8_t* pk,
            const std::vector<uint8_t>& msg,
            const uint8_t* sig);

} // namespace ec_sig
