#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

enum class AlgorithmVersion : uint8_t;

// Closed set of failure kinds raised by the hybrid signature engine.
// Callers branch on HybridError::kind(), never on the message text.
enum class ErrorKind {
    PolicyRejected,          // legacy algorithm tag at any entry point
    EmptyMessage,
    MessageTooLarge,
    InvalidKey,              // key carries no usable material
    InvalidKeyLength,
    InvalidClassicalKey,     // Ed25519 public segment did not decode
    InvalidSignatureLength,
    UsageLimitExceeded,
    PqVerifyFailed,
    ClassicalVerifyFailed,
    CacheRead,
    CacheWrite,
    CachePath,
    DecryptionFailed,
    CacheFormat,
    EntropyFailure,
    CryptoFailure,           // a primitive failed while producing output
    AttestationFailed,
    BindingUnavailable,
};

const char* error_kind_name(ErrorKind kind);

// True for the two cryptographic verification outcomes (as opposed to
// malformed input or policy rejections).
inline bool is_verification_failure(ErrorKind kind) {
    return kind == ErrorKind::PqVerifyFailed ||
           kind == ErrorKind::ClassicalVerifyFailed;
}

class HybridError : public std::runtime_error {
public:
    explicit HybridError(ErrorKind kind, const std::string& detail = "");

    HybridError(ErrorKind kind, uint64_t actual, uint64_t limit,
                const std::string& detail = "");

    HybridError(ErrorKind kind, AlgorithmVersion algorithm,
                const std::string& detail = "");

    ErrorKind kind() const { return kind_; }
    std::optional<AlgorithmVersion> algorithm() const { return algorithm_; }

    // Numeric context: observed length/count and the bound it violated.
    // Both are zero when the kind carries no numbers.
    uint64_t actual() const { return actual_; }
    uint64_t limit()  const { return limit_; }

private:
    ErrorKind kind_;
    std::optional<AlgorithmVersion> algorithm_;
    uint64_t actual_ = 0;
    uint64_t limit_  = 0;
};
