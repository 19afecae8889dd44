#pragma once
#include <cstdint>
#include <cstddef>

// ── extern "C" declarations for the Dilithium3 reference API ──────────────────
// Provided by libpqcrystals_dilithium3_ref (pq-crystals/dilithium, ref/).

extern "C" {

int pqcrystals_dilithium3_ref_keypair(uint8_t *pk, uint8_t *sk);
int pqcrystals_dilithium3_ref_signature(uint8_t *sig, size_t *siglen,
                                        const uint8_t *m, size_t mlen,
                                        const uint8_t *ctx, size_t ctxlen,
                                        const uint8_t *sk);
int pqcrystals_dilithium3_ref_verify(const uint8_t *sig, size_t siglen,
                                     const uint8_t *m, size_t mlen,
                                     const uint8_t *ctx, size_t ctxlen,
                                     const uint8_t *pk);

} // extern "C"
