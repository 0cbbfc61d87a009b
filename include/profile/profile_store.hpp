#pragma once

/**
 * PlayerProfileStore - per-player economic profiles and shop analytics
 *
 * Fed by the event bus (attach()) or directly through record_event().
 * Each profile has its own mutex; the profile map itself is guarded by a
 * shared mutex and only written when a player is first seen.
 *
 * Exchange legs never reach the store: the ledger publishes neither
 * CurrencyEarned nor CurrencySpent for them.
 */

#include "../economy/currency.hpp"
#include "../events/event_bus.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"
#include "player_profile.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace econ {
namespace profile {

struct ShopStats {
    ItemId item;
    uint64_t views = 0;
    uint64_t purchases = 0;
    Amount revenue = 0;

    double conversion_rate() const {
        return views > 0 ? static_cast<double>(purchases) / static_cast<double>(views) : 0.0;
    }
    double average_price() const {
        return purchases > 0 ? static_cast<double>(revenue) / static_cast<double>(purchases) : 0.0;
    }
};

struct SweepReport {
    size_t profiles = 0;
    size_t segment_changes = 0;
    size_t newly_churned = 0;
};

class PlayerProfileStore {
public:
    PlayerProfileStore(const economy::CurrencyRegistry& registry, const util::Clock& clock,
                       logging::AsyncLogger* logger = nullptr);

    PlayerProfileStore(const PlayerProfileStore&) = delete;
    PlayerProfileStore& operator=(const PlayerProfileStore&) = delete;

    // Subscribe to ledger/shop events
    events::EventBus::SubscriptionId attach(events::EventBus& bus);
    void on_event(const events::EventEnvelope& envelope);

    void record_event(const PlayerId& player, ProfileEventType type, Amount value, const EventTags& tags,
                      Timestamp at);
    void record_event(const PlayerId& player, ProfileEventType type, Amount value = 0, const EventTags& tags = {});

    // Recompute derived fields of every profile at `now`
    SweepReport sweep(Timestamp now);

    std::optional<PlayerProfile> profile(const PlayerId& player) const;
    Segment segment(const PlayerId& player) const; // New for unknown players

    std::vector<PlayerProfile> players_by_segment(Segment segment) const;
    std::map<Segment, size_t> segment_counts() const;
    std::vector<PlayerProfile> all() const;
    size_t size() const;

    std::optional<ShopStats> shop_stats(const ItemId& item) const;
    std::vector<ShopStats> shop_analytics() const;

    // Segments, revenue and shop sections of the analytics report
    std::string report() const;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j); // throws SnapshotError

private:
    struct Entry {
        explicit Entry(const PlayerId& id) { profile.player = id; }

        mutable std::mutex mutex;
        PlayerProfile profile;
    };

    const economy::CurrencyRegistry& registry_;
    const util::Clock& clock_;
    logging::AsyncLogger* logger_;

    mutable std::shared_mutex profiles_mutex_;
    std::map<PlayerId, std::unique_ptr<Entry>> profiles_;

    mutable std::mutex shop_mutex_;
    std::map<ItemId, ShopStats> shop_;

    Entry& entry_for(const PlayerId& player);
    void apply(PlayerProfile& p, ProfileEventType type, Amount value, const EventTags& tags, Timestamp at) const;
    void update_shop(const ItemId& item, ProfileEventType type, Amount value);
    bool is_hard(const CurrencyId& currency) const;
};

} // namespace profile
} // namespace econ
