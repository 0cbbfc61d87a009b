#pragma once

/**
 * LatencyTimer - nanosecond timing for benchmarks
 *
 * Economy operations take mutexes and allocate, so steady_clock resolution
 * is plenty; no cycle counter or frequency calibration needed.
 */

#include <chrono>
#include <cstdint>

namespace econ {
namespace benchmark {

class LatencyTimer {
public:
    static inline uint64_t now_ns() {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch())
                .count());
    }
};

// RAII timer for automatic measurement
class ScopedTimer {
public:
    ScopedTimer() : start_(LatencyTimer::now_ns()) {}

    uint64_t elapsed_ns() const { return LatencyTimer::now_ns() - start_; }

    void reset() { start_ = LatencyTimer::now_ns(); }

private:
    uint64_t start_;
};

} // namespace benchmark
} // namespace econ
