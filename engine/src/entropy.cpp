#include "entropy.hpp"
#include "hybrid_error.hpp"
#include <openssl/rand.h>
#include <climits>

void secure_random_bytes(uint8_t* buf, size_t len) {
    if (len > (size_t)INT_MAX)
        throw HybridError(ErrorKind::EntropyFailure, len, (uint64_t)INT_MAX,
                          "request too large");
    if (RAND_bytes(buf, (int)len) != 1)
        throw HybridError(ErrorKind::EntropyFailure, "RAND_bytes failed");
}
