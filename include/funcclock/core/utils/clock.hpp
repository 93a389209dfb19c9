// ============================================================================
// HIGH-PRECISION MONOTONIC CLOCK
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>

namespace FuncClock {

class Clock {
public:
    // Current time in nanoseconds (monotonic, steady)
    static inline uint64_t now_ns() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }

    static inline uint64_t now_us() {
        return now_ns() / 1000;
    }
};

} // namespace FuncClock
