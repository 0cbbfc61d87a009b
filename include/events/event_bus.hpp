#pragma once

/**
 * EventBus - in-process publish/subscribe channel for economy events
 *
 * Publishing only enqueues (cheap, safe under any component lock).
 * dispatch() drains the queue and delivers each event to every subscriber
 * in registration order, in publish order. Consumers therefore see events
 * on the scheduler tick, not inside the mutating call.
 *
 * No bus lock is held while subscriber callbacks run, so a subscriber may
 * call back into the ledger or publish further events.
 */

#include "../logging/async_logger.hpp"
#include "economy_event.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace econ {
namespace events {

class EventBus {
public:
    using Handler = std::function<void(const EventEnvelope&)>;
    using SubscriptionId = uint32_t;

    explicit EventBus(logging::AsyncLogger* logger = nullptr) : logger_(logger) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        SubscriptionId id = ++next_subscription_;
        subscribers_.emplace_back(id, std::move(handler));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (it->first == id) {
                subscribers_.erase(it);
                return true;
            }
        }
        return false;
    }

    Sequence publish(EconomyEvent event, Timestamp timestamp) {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        Sequence seq = ++next_sequence_;
        queue_.push_back(EventEnvelope{seq, timestamp, std::move(event)});
        ++published_;
        return seq;
    }

    /**
     * Deliver up to max_events queued events (0 = all currently queued).
     * Returns the number of events delivered.
     */
    size_t dispatch(size_t max_events = 0) {
        std::vector<EventEnvelope> batch;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            size_t n = (max_events == 0 || max_events > queue_.size()) ? queue_.size() : max_events;
            batch.reserve(n);
            for (size_t i = 0; i < n; ++i) {
                batch.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
        }
        if (batch.empty())
            return 0;

        std::vector<std::pair<SubscriptionId, Handler>> targets;
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            targets = subscribers_;
        }

        for (const auto& envelope : batch) {
            for (const auto& [id, handler] : targets) {
                try {
                    handler(envelope);
                } catch (const std::exception& e) {
                    failures_.fetch_add(1, std::memory_order_relaxed);
                    ECON_LOGF_ERROR(logger_, logging::LogCategory::System, "subscriber %u failed on event %llu: %s",
                                    id, static_cast<unsigned long long>(envelope.sequence), e.what());
                }
            }
        }
        delivered_.fetch_add(batch.size(), std::memory_order_relaxed);
        return batch.size();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return queue_.size();
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        return subscribers_.size();
    }

    uint64_t published() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return published_;
    }
    uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
    uint64_t handler_failures() const { return failures_.load(std::memory_order_relaxed); }

private:
    logging::AsyncLogger* logger_;

    mutable std::mutex queue_mutex_;
    std::deque<EventEnvelope> queue_;
    Sequence next_sequence_ = 0;
    uint64_t published_ = 0;

    mutable std::mutex subscribers_mutex_;
    std::vector<std::pair<SubscriptionId, Handler>> subscribers_;
    SubscriptionId next_subscription_ = 0;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace events
} // namespace econ
