#include "key_identity.hpp"
#include "algorithm_policy.hpp"
#include "digest.hpp"
#include "blake3.h"
#include <cstdint>

static void put_len32_le(blake3_hasher& h, size_t n) {
    uint32_t len = static_cast<uint32_t>(n);
    uint8_t  le[4] = {
        static_cast<uint8_t>( len        & 0xFF),
        static_cast<uint8_t>((len >>  8) & 0xFF),
        static_cast<uint8_t>((len >> 16) & 0xFF),
        static_cast<uint8_t>((len >> 24) & 0xFF),
    };
    blake3_hasher_update(&h, le, 4);
}

static std::vector<uint8_t> le64(uint64_t v) {
    std::vector<uint8_t> out(8);
    for (size_t i = 0; i < 8; ++i)
        out[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    return out;
}

std::string public_key_fingerprint(const PublicKey& pk) {
    blake3_hasher h;
    blake3_hasher_init_derive_key(&h, "worf public-key fingerprint v1");

    std::string name = algorithm_name(pk.algorithm);
    put_len32_le(h, name.size());
    blake3_hasher_update(&h, name.data(), name.size());

    put_len32_le(h, pk.bytes.size());
    blake3_hasher_update(&h, pk.bytes.data(), pk.bytes.size());

    uint8_t out[16];
    blake3_hasher_finalize(&h, out, sizeof(out));
    return hex_encode(out, sizeof(out));
}

std::vector<uint8_t> public_key_address(const PublicKey& pk) {
    Sha256Digest h = sha256({pk.bytes, le64(pk.created_at), le64(pk.operation_id)});
    return std::vector<uint8_t>(h.begin(), h.begin() + 20);
}
