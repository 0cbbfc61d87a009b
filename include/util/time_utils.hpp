#pragma once

/**
 * Time utilities for the economy core
 *
 * All economy timestamps are nanoseconds. Components never read the
 * system clock directly; they go through a Clock so tests and the
 * simulator can advance time without sleeping.
 */

#include "../config/defaults.hpp"
#include "../types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace econ {
namespace util {

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

inline constexpr uint64_t hours_to_ns(int64_t hours) {
    return hours > 0 ? static_cast<uint64_t>(hours) * config::time::NS_PER_HOUR : 0;
}

inline constexpr uint64_t days_to_ns(int64_t days) {
    return days > 0 ? static_cast<uint64_t>(days) * config::time::NS_PER_DAY : 0;
}

inline constexpr double ns_to_days(uint64_t ns) {
    return static_cast<double>(ns) / static_cast<double>(config::time::NS_PER_DAY);
}

// Elapsed time, zero if `later` precedes `earlier`
inline constexpr uint64_t elapsed_ns(Timestamp earlier, Timestamp later) {
    return later > earlier ? later - earlier : 0;
}

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override { return wall_clock_ns(); }
};

/**
 * SimulatedClock - manually advanced clock
 *
 * Thread-safe: the scheduler thread and request threads may read it
 * while a test or the simulator advances it.
 */
class SimulatedClock : public Clock {
public:
    explicit SimulatedClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_.load(std::memory_order_acquire); }

    void set(Timestamp t) { now_.store(t, std::memory_order_release); }
    void advance(uint64_t ns) { now_.fetch_add(ns, std::memory_order_acq_rel); }
    void advance_seconds(uint64_t s) { advance(s * config::time::NS_PER_SECOND); }
    void advance_hours(uint64_t h) { advance(h * config::time::NS_PER_HOUR); }
    void advance_days(uint64_t d) { advance(d * config::time::NS_PER_DAY); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace util
} // namespace econ
