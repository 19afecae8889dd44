#pragma once
#include "hybrid_key.hpp"
#include <vector>
#include <cstdint>
#include <string>

// Binary msgpack form of public keys and signatures.
//
//   public key: { "k": "pk",  "v": 1, "alg": str, "b": bin, "cr": u64, "op": u64, "fp": str }
//   signature:  { "k": "sig", "v": 1, "alg": str, "b": bin, "cr": u64, "op": u64, "sg": str }
//
// "fp" is the BLAKE3 fingerprint of the key; key_reader checks it on load.

namespace key_mp {
    std::vector<uint8_t> pack(const PublicKey& pk);
    std::vector<uint8_t> pack(const Signature& sig);

    PublicKey unpack_public_key(const std::vector<uint8_t>& data, std::string* fingerprint_out = nullptr);
    Signature unpack_signature(const std::vector<uint8_t>& data);

    void write_file(const std::vector<uint8_t>& bytes, const std::string& path);
    std::vector<uint8_t> read_file(const std::string& path);
}
