#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <functional>
#include <thread>

namespace econ {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

// Category constants for the economy core
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Ledger = 1;
constexpr uint8_t Exchange = 2;
constexpr uint8_t Inflation = 3;
constexpr uint8_t Profile = 4;
constexpr uint8_t Pricing = 5;
constexpr uint8_t Personalization = 6;
constexpr uint8_t Persistence = 7;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Ledger:
        return "ledger";
    case LogCategory::Exchange:
        return "exchange";
    case LogCategory::Inflation:
        return "inflation";
    case LogCategory::Profile:
        return "profile";
    case LogCategory::Pricing:
        return "pricing";
    case LogCategory::Personalization:
        return "personal";
    case LogCategory::Persistence:
        return "persist";
    default:
        return "other";
    }
}

/**
 * Log Entry - Fixed size, two cache lines
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // 8 bytes
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte
    uint16_t reserved;     // 2 bytes padding
    uint32_t thread_id;    // 4 bytes
    char message[112];     // 112 bytes (null-terminated)

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 128, "LogEntry must be 128 bytes");

/**
 * Bounded ring buffer, many producers / one consumer.
 *
 * Gameplay threads and the scheduler thread all log, so producers
 * serialize on a spin flag; the consumer side stays lock-free.
 */
template <size_t Capacity = 4096>
class LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    bool try_push(const LogEntry& entry) {
        while (producer_lock_.test_and_set(std::memory_order_acquire)) {
            std::this_thread::yield();
        }

        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);
        bool pushed = false;
        if (next_head != tail_.load(std::memory_order_acquire)) {
            buffer_[head] = entry;
            head_.store(next_head, std::memory_order_release);
            pushed = true;
        }

        producer_lock_.clear(std::memory_order_release);
        return pushed;
    }

    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }
        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

    bool empty() const { return size() == 0; }

private:
    std::atomic_flag producer_lock_ = ATOMIC_FLAG_INIT;
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    std::array<LogEntry, Capacity> buffer_{};
};

/**
 * Async Logger
 *
 * log() formats into a fixed entry and enqueues; a background thread
 * writes entries out. Without start() entries accumulate until flush()
 * or stop() drains them on the caller's thread, which is what tests use.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   ECON_LOGF_INFO(&logger, LogCategory::Ledger, "earn %s %lld", id, amount);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    void stop() {
        if (running_.exchange(false)) {
            if (consumer_thread_.joinable()) {
                consumer_thread_.join();
            }
        }
        flush();
    }

    // Drain pending entries on the calling thread; a no-op while the consumer thread owns the buffer
    void flush() {
        if (running_.load())
            return;
        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        LogEntry entry;
        entry.timestamp_ns = get_timestamp_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        if (!buffer_.try_push(entry)) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }

    // Must be set before start()
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<4096> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    std::atomic<LogLevel> min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            auto ts_ms = entry.timestamp_ns / 1000000;
            std::fprintf(stderr, "[%llu.%03llu] [%s] [%s] %s\n", static_cast<unsigned long long>(ts_ms / 1000),
                         static_cast<unsigned long long>(ts_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

// Convenience macros; logger is a pointer and may be null (silent)
#define ECON_LOG(logger, level, cat, msg)                                                                              \
    do {                                                                                                               \
        if (logger)                                                                                                    \
            (logger)->log(level, cat, msg);                                                                            \
    } while (0)

#define ECON_LOG_DEBUG(logger, cat, msg) ECON_LOG(logger, econ::logging::LogLevel::Debug, cat, msg)
#define ECON_LOG_INFO(logger, cat, msg) ECON_LOG(logger, econ::logging::LogLevel::Info, cat, msg)
#define ECON_LOG_WARN(logger, cat, msg) ECON_LOG(logger, econ::logging::LogLevel::Warn, cat, msg)
#define ECON_LOG_ERROR(logger, cat, msg) ECON_LOG(logger, econ::logging::LogLevel::Error, cat, msg)

#define ECON_LOGF(logger, level, cat, fmt, ...)                                                                        \
    do {                                                                                                               \
        if (logger)                                                                                                    \
            (logger)->logf(level, cat, fmt, ##__VA_ARGS__);                                                            \
    } while (0)

#define ECON_LOGF_DEBUG(logger, cat, fmt, ...) ECON_LOGF(logger, econ::logging::LogLevel::Debug, cat, fmt, ##__VA_ARGS__)
#define ECON_LOGF_INFO(logger, cat, fmt, ...) ECON_LOGF(logger, econ::logging::LogLevel::Info, cat, fmt, ##__VA_ARGS__)
#define ECON_LOGF_WARN(logger, cat, fmt, ...) ECON_LOGF(logger, econ::logging::LogLevel::Warn, cat, fmt, ##__VA_ARGS__)
#define ECON_LOGF_ERROR(logger, cat, fmt, ...) ECON_LOGF(logger, econ::logging::LogLevel::Error, cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace econ
