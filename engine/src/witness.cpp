#include "witness.hpp"
#include <chrono>

uint64_t timestamp_now(Witness* witness) {
    if (witness)
        return witness->current_time();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}
