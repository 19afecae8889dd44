#include "hybrid_error.hpp"
#include "algorithm_policy.hpp"
#include <string>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PolicyRejected:         return "policy rejected";
        case ErrorKind::EmptyMessage:           return "empty message";
        case ErrorKind::MessageTooLarge:        return "message too large";
        case ErrorKind::InvalidKey:             return "invalid key";
        case ErrorKind::InvalidKeyLength:       return "invalid public key length";
        case ErrorKind::InvalidClassicalKey:    return "invalid Ed25519 public key";
        case ErrorKind::InvalidSignatureLength: return "invalid signature length";
        case ErrorKind::UsageLimitExceeded:     return "key usage limit exceeded";
        case ErrorKind::PqVerifyFailed:         return "Dilithium3 verification failed";
        case ErrorKind::ClassicalVerifyFailed:  return "Ed25519 verification failed";
        case ErrorKind::CacheRead:              return "secret cache read failed";
        case ErrorKind::CacheWrite:             return "secret cache write failed";
        case ErrorKind::CachePath:              return "secret cache path rejected";
        case ErrorKind::DecryptionFailed:       return "secret cache decryption failed";
        case ErrorKind::CacheFormat:            return "secret cache format invalid";
        case ErrorKind::EntropyFailure:         return "entropy source failed";
        case ErrorKind::CryptoFailure:          return "cryptographic primitive failed";
        case ErrorKind::AttestationFailed:      return "witness attestation failed";
        case ErrorKind::BindingUnavailable:     return "policy binding unavailable";
    }
    return "unknown error";
}

static std::string compose(ErrorKind kind, const std::string& detail) {
    std::string msg = error_kind_name(kind);
    if (!detail.empty())
        msg += ": " + detail;
    return msg;
}

HybridError::HybridError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(compose(kind, detail)), kind_(kind) {}

HybridError::HybridError(ErrorKind kind, uint64_t actual, uint64_t limit,
                         const std::string& detail)
    : std::runtime_error(compose(kind, detail) +
                         " (" + std::to_string(actual) + " vs " + std::to_string(limit) + ")"),
      kind_(kind), actual_(actual), limit_(limit) {}

HybridError::HybridError(ErrorKind kind, AlgorithmVersion algorithm,
                         const std::string& detail)
    : std::runtime_error(compose(kind, detail) + " [" + algorithm_name(algorithm) + "]"),
      kind_(kind), algorithm_(algorithm) {}
