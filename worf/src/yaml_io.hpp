#pragma once
#include "hybrid_key.hpp"
#include <string>

// YAML documents for public keys and signatures.
//
//   ---
//   version: 1
//   type: public-key          # or: signature
//   algorithm: MandatoryHybrid
//   fingerprint: <hex>        # public key only
//   signer: <key id>          # signature only
//   created: <u64>
//   operation-id: <u64>
//   bytes: |-
//     <base64, 64 chars per line>

std::string emit_public_key_yaml(const PublicKey& pk);
std::string emit_signature_yaml(const Signature& sig);

// Throw std::runtime_error on a wrong 'type' or missing fields.
PublicKey parse_public_key_yaml(const std::string& text, std::string* fingerprint_out = nullptr);
Signature parse_signature_yaml(const std::string& text);
