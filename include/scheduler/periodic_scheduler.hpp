#pragma once

/**
 * PeriodicScheduler - runs registered tasks on fixed simulated intervals
 *
 * tick(now) runs every task whose deadline has passed, each at most once,
 * in registration order. A task that fell several intervals behind runs
 * once and is rescheduled from `now` (no catch-up burst), so the work per
 * tick is bounded by the task count.
 *
 * Tests call tick() directly with a SimulatedClock. start() launches a
 * real-time driver thread that ticks with clock.now() until stop().
 */

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace econ {
namespace scheduler {

struct TaskStats {
    std::string name;
    uint64_t interval_ns = 0;
    Timestamp next_due = 0;
    uint64_t runs = 0;
    uint64_t failures = 0;
};

class PeriodicScheduler {
public:
    using Task = std::function<void(Timestamp now)>;
    using TaskId = uint32_t;

    explicit PeriodicScheduler(const util::Clock& clock, logging::AsyncLogger* logger = nullptr,
                               uint32_t driver_sleep_ms = config::scheduler::DRIVER_SLEEP_MS)
        : clock_(clock), logger_(logger), driver_sleep_ms_(driver_sleep_ms) {}

    ~PeriodicScheduler() { stop(); }

    PeriodicScheduler(const PeriodicScheduler&) = delete;
    PeriodicScheduler& operator=(const PeriodicScheduler&) = delete;

    // First run is one interval after registration
    TaskId add_task(std::string name, uint64_t interval_ns, Task task) {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        Entry e;
        e.id = static_cast<TaskId>(tasks_.size() + 1);
        e.stats.name = std::move(name);
        e.stats.interval_ns = interval_ns > 0 ? interval_ns : 1;
        e.stats.next_due = clock_.now() + e.stats.interval_ns;
        e.task = std::move(task);
        tasks_.push_back(std::move(e));
        return tasks_.back().id;
    }

    /**
     * Run due tasks. Returns the number of task runs performed.
     * Concurrent ticks (driver thread and a manual call) are serialized.
     */
    size_t tick(Timestamp now) {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);

        std::vector<std::pair<size_t, Task>> due;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            for (size_t i = 0; i < tasks_.size(); ++i) {
                auto& e = tasks_[i];
                if (now >= e.stats.next_due) {
                    due.emplace_back(i, e.task);
                    e.stats.next_due = now + e.stats.interval_ns;
                }
            }
        }

        for (auto& [index, task] : due) {
            bool ok = true;
            try {
                task(now);
            } catch (const std::exception& e) {
                ok = false;
                ECON_LOGF_ERROR(logger_, logging::LogCategory::System, "task %zu failed: %s", index, e.what());
            }
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            tasks_[index].stats.runs++;
            if (!ok)
                tasks_[index].stats.failures++;
        }
        ticks_.fetch_add(1, std::memory_order_relaxed);
        return due.size();
    }

    size_t tick() { return tick(clock_.now()); }

    // Run one task immediately regardless of its deadline
    bool run_now(TaskId id) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            if (id == 0 || id > tasks_.size())
                return false;
            task = tasks_[id - 1].task;
        }
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        task(clock_.now());
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_[id - 1].stats.runs++;
        return true;
    }

    // ========================================
    // Real-time driver
    // ========================================
    void start() {
        if (running_.exchange(true))
            return;
        driver_ = std::thread([this]() { drive(); });
        ECON_LOG_INFO(logger_, logging::LogCategory::System, "scheduler started");
    }

    void stop() {
        if (running_.exchange(false)) {
            if (driver_.joinable()) {
                driver_.join();
            }
            ECON_LOG_INFO(logger_, logging::LogCategory::System, "scheduler stopped");
        }
    }

    void pause() { paused_.store(true, std::memory_order_release); }
    void resume() { paused_.store(false, std::memory_order_release); }

    bool running() const { return running_.load(std::memory_order_acquire); }
    bool paused() const { return paused_.load(std::memory_order_acquire); }

    // ========================================
    // Stats
    // ========================================
    size_t task_count() const {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        return tasks_.size();
    }

    TaskStats stats(TaskId id) const {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        if (id == 0 || id > tasks_.size())
            return {};
        return tasks_[id - 1].stats;
    }

    std::vector<TaskStats> all_stats() const {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        std::vector<TaskStats> out;
        out.reserve(tasks_.size());
        for (const auto& e : tasks_) {
            out.push_back(e.stats);
        }
        return out;
    }

    uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        TaskId id = 0;
        TaskStats stats;
        Task task;
    };

    const util::Clock& clock_;
    logging::AsyncLogger* logger_;
    uint32_t driver_sleep_ms_;

    mutable std::mutex tasks_mutex_;
    std::vector<Entry> tasks_;

    std::mutex tick_mutex_;
    std::atomic<uint64_t> ticks_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::thread driver_;

    void drive() {
        while (running_.load(std::memory_order_acquire)) {
            if (!paused_.load(std::memory_order_acquire)) {
                tick(clock_.now());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(driver_sleep_ms_));
        }
    }
};

} // namespace scheduler
} // namespace econ
