#pragma once
#include "hybrid_key.hpp"
#include <array>
#include <cstdint>
#include <vector>

struct WitnessProof {
    std::array<uint8_t, 32> commitment_hash{};
};

// External attestation service. Implementations live outside this library;
// the engine only needs these two calls.
class Witness {
public:
    virtual ~Witness() = default;

    // Commit to policy_hash. Throws (any std::exception) if the witness
    // refuses or cannot be reached.
    virtual WitnessProof attest(const PolicyHash& policy_hash) = 0;

    // Monotonic timestamp used instead of the wall clock when a witness
    // is configured.
    virtual uint64_t current_time() = 0;
};

// Witness time if one is given, otherwise UTC seconds since the epoch.
uint64_t timestamp_now(Witness* witness);
