#include "hybrid_key.hpp"
#include "algorithm_policy.hpp"
#include "hybrid_error.hpp"
#include <openssl/crypto.h>
#include <utility>

std::vector<uint8_t> hybrid_public_bytes(const HybridKeyMaterial& material) {
    std::vector<uint8_t> bytes;
    bytes.reserve(kHybridPublicKeyBytes);
    bytes.insert(bytes.end(), material.dilithium.pk.begin(), material.dilithium.pk.end());
    bytes.insert(bytes.end(), material.ed25519_pk.begin(), material.ed25519_pk.end());
    return bytes;
}

// ── HybridKeyMaterial ─────────────────────────────────────────────────────────

HybridKeyMaterial::HybridKeyMaterial(HybridKeyMaterial&& other) noexcept
    : dilithium(std::move(other.dilithium)),
      ed25519_sk(other.ed25519_sk),
      ed25519_pk(other.ed25519_pk) {
    other.cleanse();
}

HybridKeyMaterial& HybridKeyMaterial::operator=(HybridKeyMaterial&& other) noexcept {
    if (this != &other) {
        cleanse();
        dilithium  = std::move(other.dilithium);
        ed25519_sk = other.ed25519_sk;
        ed25519_pk = other.ed25519_pk;
        other.cleanse();
    }
    return *this;
}

HybridKeyMaterial::~HybridKeyMaterial() {
    cleanse();
}

void HybridKeyMaterial::cleanse() {
    if (!dilithium.sk.empty())
        OPENSSL_cleanse(dilithium.sk.data(), dilithium.sk.size());
    OPENSSL_cleanse(ed25519_sk.data(), ed25519_sk.size());
}

// ── PrivateKey ────────────────────────────────────────────────────────────────

PrivateKey::PrivateKey(AlgorithmVersion algorithm,
                       std::optional<HybridKeyMaterial> material,
                       uint64_t created_at,
                       uint64_t operation_id,
                       std::string key_id,
                       uint64_t usage_count)
    : algorithm_(algorithm),
      material_(std::move(material)),
      created_at_(created_at),
      operation_id_(operation_id),
      key_id_(std::move(key_id)),
      usage_count_(usage_count) {}

PrivateKey::PrivateKey(PrivateKey&& other) noexcept
    : algorithm_(other.algorithm_),
      material_(std::move(other.material_)),
      created_at_(other.created_at_),
      operation_id_(other.operation_id_),
      key_id_(std::move(other.key_id_)),
      usage_count_(other.usage_count_.load()) {
    if (other.material_)
        other.material_->cleanse();
    other.material_.reset();
}

PrivateKey::~PrivateKey() {
    if (material_)
        material_->cleanse();
}

PublicKey PrivateKey::public_key() const {
    require_live(algorithm_, Operation::PublicKey);
    if (!material_)
        throw HybridError(ErrorKind::InvalidKey, "hybrid key has no key material");

    PublicKey pub;
    pub.algorithm    = algorithm_;
    pub.bytes        = hybrid_public_bytes(*material_);
    pub.created_at   = created_at_;
    pub.operation_id = operation_id_;
    return pub;
}
