#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ── Algorithm tags ────────────────────────────────────────────────────────────
// The two single-algorithm tags are kept so that old files still parse, but
// every entry point rejects them (see algorithm_policy.hpp).

enum class AlgorithmVersion : uint8_t {
    Dilithium3V1    = 0,   // pure Dilithium3, disabled
    Ed25519V1       = 1,   // pure Ed25519, disabled
    MandatoryHybrid = 2,
};

// ── Fixed primitive widths ────────────────────────────────────────────────────

static constexpr size_t kPqPublicKeyBytes        = 1952;  // Dilithium3
static constexpr size_t kPqSecretKeyBytes        = 4032;
static constexpr size_t kPqSignatureBytes        = 3309;
static constexpr size_t kClassicalPublicKeyBytes = 32;    // Ed25519
static constexpr size_t kClassicalSecretKeyBytes = 32;
static constexpr size_t kClassicalSignatureBytes = 64;

static constexpr size_t kHybridPublicKeyBytes = kPqPublicKeyBytes + kClassicalPublicKeyBytes;
static constexpr size_t kHybridSignatureBytes = kPqSignatureBytes + kClassicalSignatureBytes;

static constexpr size_t   kMaxMessageBytes = 1048576;
static constexpr uint64_t kMaxKeyUsage     = 1000000;

using Seed       = std::array<uint8_t, 32>;
using PolicyHash = std::array<uint8_t, 32>;

// ── Key material ──────────────────────────────────────────────────────────────

struct PqKeyPair {
    std::vector<uint8_t> pk;   // kPqPublicKeyBytes
    std::vector<uint8_t> sk;   // kPqSecretKeyBytes
};

// Both halves of a hybrid key. There is no way to hold one without the other.
// Both secret halves are cleansed on destruction, and a move leaves the
// source with an empty Dilithium secret and a zeroed Ed25519 secret.
struct HybridKeyMaterial {
    PqKeyPair dilithium;
    std::array<uint8_t, kClassicalSecretKeyBytes> ed25519_sk{};
    std::array<uint8_t, kClassicalPublicKeyBytes> ed25519_pk{};

    HybridKeyMaterial() = default;
    HybridKeyMaterial(const HybridKeyMaterial&) = default;
    HybridKeyMaterial& operator=(const HybridKeyMaterial&) = default;
    HybridKeyMaterial(HybridKeyMaterial&& other) noexcept;
    HybridKeyMaterial& operator=(HybridKeyMaterial&& other) noexcept;
    ~HybridKeyMaterial();

    // Zeroes both secret halves in place. Sizes are kept.
    void cleanse();
};

// public bytes = dilithium pk || ed25519 pk
std::vector<uint8_t> hybrid_public_bytes(const HybridKeyMaterial& material);

struct PublicKey {
    AlgorithmVersion     algorithm = AlgorithmVersion::MandatoryHybrid;
    std::vector<uint8_t> bytes;
    uint64_t             created_at   = 0;
    uint64_t             operation_id = 0;
};

struct Signature {
    AlgorithmVersion     algorithm = AlgorithmVersion::MandatoryHybrid;
    std::vector<uint8_t> bytes;     // dilithium sig || ed25519 sig
    uint64_t             created_at   = 0;
    uint64_t             operation_id = 0;
    std::string          signer_key_id;
};

// Never written to disk as a whole. The usage counter is the only member
// that changes after construction; it is atomic so one key can be shared by
// reference between signing threads.
class PrivateKey {
public:
    PrivateKey(AlgorithmVersion algorithm,
               std::optional<HybridKeyMaterial> material,
               uint64_t created_at,
               uint64_t operation_id,
               std::string key_id,
               uint64_t usage_count = 0);

    PrivateKey(PrivateKey&& other) noexcept;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;
    PrivateKey& operator=(PrivateKey&&) = delete;
    ~PrivateKey();

    AlgorithmVersion algorithm() const { return algorithm_; }
    const std::optional<HybridKeyMaterial>& material() const { return material_; }
    uint64_t created_at() const { return created_at_; }
    uint64_t operation_id() const { return operation_id_; }
    const std::string& key_id() const { return key_id_; }

    uint64_t usage_count() const { return usage_count_.load(); }

    // Atomically bumps the counter and returns the new value.
    uint64_t record_use() const { return usage_count_.fetch_add(1) + 1; }

    // Throws HybridError{PolicyRejected} for legacy tags.
    PublicKey public_key() const;

private:
    AlgorithmVersion                 algorithm_;
    std::optional<HybridKeyMaterial> material_;
    uint64_t                         created_at_;
    uint64_t                         operation_id_;
    std::string                      key_id_;
    mutable std::atomic<uint64_t>    usage_count_;
};

struct KeyPair {
    PrivateKey private_key;
    PublicKey  public_key;
};
