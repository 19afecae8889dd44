#include "algorithm_policy.hpp"
#include "hybrid_error.hpp"
#include <stdexcept>

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::Generate:  return "generate";
        case Operation::PublicKey: return "public-key";
        case Operation::Sign:      return "sign";
        case Operation::Verify:    return "verify";
    }
    return "unknown";
}

std::string algorithm_name(AlgorithmVersion alg) {
    switch (alg) {
        case AlgorithmVersion::Dilithium3V1:    return "Dilithium3V1";
        case AlgorithmVersion::Ed25519V1:       return "Ed25519V1";
        case AlgorithmVersion::MandatoryHybrid: return "MandatoryHybrid";
    }
    return "Unknown";
}

AlgorithmVersion parse_algorithm(const std::string& name) {
    if (name == "Dilithium3V1")    return AlgorithmVersion::Dilithium3V1;
    if (name == "Ed25519V1")       return AlgorithmVersion::Ed25519V1;
    if (name == "MandatoryHybrid") return AlgorithmVersion::MandatoryHybrid;
    throw std::runtime_error("Unknown algorithm version: " + name);
}

bool is_live(AlgorithmVersion alg) {
    return alg == AlgorithmVersion::MandatoryHybrid;
}

void require_live(AlgorithmVersion alg, Operation op) {
    switch (alg) {
        case AlgorithmVersion::MandatoryHybrid:
            return;
        case AlgorithmVersion::Dilithium3V1:
            throw HybridError(ErrorKind::PolicyRejected, alg,
                std::string("pure Dilithium3 ") + operation_name(op) + " forbidden");
        case AlgorithmVersion::Ed25519V1:
            throw HybridError(ErrorKind::PolicyRejected, alg,
                std::string("pure Ed25519 ") + operation_name(op) + " forbidden");
    }
    // Out-of-range values cast into the enum are not live either.
    throw HybridError(ErrorKind::PolicyRejected, alg,
        std::string("unknown algorithm in ") + operation_name(op));
}
