#pragma once
#include <cstddef>
#include <cstdint>

// Fill buf from OpenSSL's CSPRNG (seeded from the OS).
// Throws HybridError{EntropyFailure}; there is no fallback source.
void secure_random_bytes(uint8_t* buf, size_t len);
