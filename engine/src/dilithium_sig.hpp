#pragma once
#include "hybrid_key.hpp"
#include <vector>
#include <cstdint>

namespace dilithium_sig {

// Fresh Dilithium3 keypair from the library's OS randomness.
PqKeyPair keygen();

// Sign msg with sk (kPqSecretKeyBytes); returns kPqSignatureBytes bytes.
std::vector<uint8_t> sign(const std::vector<uint8_t>& sk,
                          const std::vector<uint8_t>& msg);

// Verify sig over msg. pk and sig point at fixed-width segments that the
// caller has already bounds-checked.
bool verify(const uint8_t* pk,
            const std::vector<uint8_t>& msg,
            const uint8_t* sig);

} // namespace dilithium_sig
