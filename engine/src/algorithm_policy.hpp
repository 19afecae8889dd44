#pragma once
#include "hybrid_key.hpp"
#include <string>

// Entry points that consult the algorithm tag, for error context.
enum class Operation { Generate, PublicKey, Sign, Verify };

const char* operation_name(Operation op);

// Stable names used in persisted files:
// "Dilithium3V1", "Ed25519V1", "MandatoryHybrid".
std::string      algorithm_name(AlgorithmVersion alg);
AlgorithmVersion parse_algorithm(const std::string& name);

bool is_live(AlgorithmVersion alg);

// Throws HybridError{PolicyRejected} unless alg is MandatoryHybrid.
// Not configurable.
void require_live(AlgorithmVersion alg, Operation op);
