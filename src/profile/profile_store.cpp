#include "../../include/profile/profile_store.hpp"
#include "../../include/persistence/json_codec.hpp"

#include <algorithm>
#include <cstdio>

namespace econ {
namespace profile {

namespace LogCategory = logging::LogCategory;

PlayerProfileStore::PlayerProfileStore(const economy::CurrencyRegistry& registry, const util::Clock& clock,
                                       logging::AsyncLogger* logger)
    : registry_(registry), clock_(clock), logger_(logger) {}

events::EventBus::SubscriptionId PlayerProfileStore::attach(events::EventBus& bus) {
    return bus.subscribe([this](const events::EventEnvelope& envelope) { on_event(envelope); });
}

bool PlayerProfileStore::is_hard(const CurrencyId& currency) const {
    const economy::Currency* c = registry_.find(currency);
    return c && c->is_hard_currency;
}

void PlayerProfileStore::on_event(const events::EventEnvelope& envelope) {
    Timestamp at = envelope.timestamp;
    std::visit(events::Overloaded{
                   [&](const events::CurrencyEarned& e) {
                       EventTags tags;
                       tags.currency = e.currency;
                       tags.hard_currency = is_hard(e.currency);
                       record_event(e.player, ProfileEventType::CurrencyEarned, e.amount, tags, at);
                   },
                   [&](const events::CurrencySpent& e) {
                       EventTags tags;
                       tags.currency = e.currency;
                       tags.hard_currency = is_hard(e.currency);
                       tags.category = e.category;
                       record_event(e.player, ProfileEventType::CurrencySpent, e.amount, tags, at);
                   },
                   [&](const events::ItemPurchased& e) {
                       EventTags tags;
                       tags.item = e.item;
                       tags.category = e.category;
                       record_event(e.player, ProfileEventType::ItemPurchased, e.total_cost, tags, at);
                   },
                   [&](const events::ItemViewed& e) {
                       EventTags tags;
                       tags.item = e.item;
                       record_event(e.player, ProfileEventType::ItemViewed, 0, tags, at);
                   },
                   [&](const events::RewardClaimed& e) {
                       EventTags tags;
                       tags.reward_id = e.reward_id;
                       record_event(e.player, ProfileEventType::RewardClaimed, 0, tags, at);
                   },
                   // Balance moves, exchanges and market events carry no profile signal
                   [](const events::BalanceChanged&) {},
                   [](const events::CurrencyExchanged&) {},
                   [](const events::DiscountStarted&) {},
                   [](const events::DiscountEnded&) {},
                   [](const events::MultipliersAdjusted&) {},
               },
               envelope.event);
}

// =============================================================================
// Recording
// =============================================================================

PlayerProfileStore::Entry& PlayerProfileStore::entry_for(const PlayerId& player) {
    {
        std::shared_lock lock(profiles_mutex_);
        auto it = profiles_.find(player);
        if (it != profiles_.end())
            return *it->second;
    }
    std::unique_lock lock(profiles_mutex_);
    auto& slot = profiles_[player];
    if (!slot) {
        slot = std::make_unique<Entry>(player);
        ECON_LOGF_DEBUG(logger_, LogCategory::Profile, "new profile %s", player.c_str());
    }
    return *slot;
}

void PlayerProfileStore::apply(PlayerProfile& p, ProfileEventType type, Amount value, const EventTags& tags,
                               Timestamp at) const {
    p.last_active = std::max(p.last_active, at);

    switch (type) {
    case ProfileEventType::CurrencySpent:
        if (tags.hard_currency)
            p.total_spent += value;
        if (!tags.category.empty())
            p.spend_by_category[tags.category] += value;
        break;
    case ProfileEventType::CurrencyEarned:
        p.total_earned += value;
        break;
    case ProfileEventType::ItemPurchased:
        p.purchase_count++;
        p.last_purchase = std::max(p.last_purchase, at);
        if (p.first_purchase == 0)
            p.first_purchase = at;
        break;
    case ProfileEventType::RewardClaimed:
        p.rewards_claimed++;
        break;
    case ProfileEventType::SessionActivity:
    case ProfileEventType::ItemViewed:
        break;
    }
}

void PlayerProfileStore::update_shop(const ItemId& item, ProfileEventType type, Amount value) {
    if (item.empty())
        return;
    std::lock_guard<std::mutex> lock(shop_mutex_);
    ShopStats& s = shop_[item];
    s.item = item;
    if (type == ProfileEventType::ItemViewed) {
        s.views++;
    } else if (type == ProfileEventType::ItemPurchased) {
        s.purchases++;
        s.revenue += value;
    }
}

void PlayerProfileStore::record_event(const PlayerId& player, ProfileEventType type, Amount value,
                                      const EventTags& tags, Timestamp at) {
    Entry& entry = entry_for(player);
    Segment before;
    Segment after;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        before = entry.profile.segment;
        apply(entry.profile, type, value, tags, at);
        recompute(entry.profile, std::max(at, clock_.now()));
        after = entry.profile.segment;
    }

    if (type == ProfileEventType::ItemViewed || type == ProfileEventType::ItemPurchased) {
        update_shop(tags.item, type, value);
    }

    if (before != after) {
        ECON_LOGF_INFO(logger_, LogCategory::Profile, "%s segment %s -> %s", player.c_str(),
                       segment_to_string(before), segment_to_string(after));
    }
}

void PlayerProfileStore::record_event(const PlayerId& player, ProfileEventType type, Amount value,
                                      const EventTags& tags) {
    record_event(player, type, value, tags, clock_.now());
}

SweepReport PlayerProfileStore::sweep(Timestamp now) {
    SweepReport report;
    std::shared_lock map_lock(profiles_mutex_);
    for (auto& [id, entry] : profiles_) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        Segment before = entry->profile.segment;
        recompute(entry->profile, now);
        report.profiles++;
        if (entry->profile.segment != before) {
            report.segment_changes++;
            if (entry->profile.segment == Segment::Churned)
                report.newly_churned++;
        }
    }
    if (report.segment_changes > 0) {
        ECON_LOGF_INFO(logger_, LogCategory::Profile, "sweep: %zu profiles, %zu segment changes, %zu churned",
                       report.profiles, report.segment_changes, report.newly_churned);
    }
    return report;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<PlayerProfile> PlayerProfileStore::profile(const PlayerId& player) const {
    std::shared_lock map_lock(profiles_mutex_);
    auto it = profiles_.find(player);
    if (it == profiles_.end())
        return std::nullopt;
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->profile;
}

Segment PlayerProfileStore::segment(const PlayerId& player) const {
    auto p = profile(player);
    return p ? p->segment : Segment::New;
}

std::vector<PlayerProfile> PlayerProfileStore::all() const {
    std::shared_lock map_lock(profiles_mutex_);
    std::vector<PlayerProfile> out;
    out.reserve(profiles_.size());
    for (const auto& [id, entry] : profiles_) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        out.push_back(entry->profile);
    }
    return out;
}

std::vector<PlayerProfile> PlayerProfileStore::players_by_segment(Segment segment) const {
    std::vector<PlayerProfile> out;
    for (auto& p : all()) {
        if (p.segment == segment)
            out.push_back(std::move(p));
    }
    return out;
}

std::map<Segment, size_t> PlayerProfileStore::segment_counts() const {
    std::map<Segment, size_t> counts;
    for (const auto& p : all()) {
        counts[p.segment]++;
    }
    return counts;
}

size_t PlayerProfileStore::size() const {
    std::shared_lock lock(profiles_mutex_);
    return profiles_.size();
}

std::optional<ShopStats> PlayerProfileStore::shop_stats(const ItemId& item) const {
    std::lock_guard<std::mutex> lock(shop_mutex_);
    auto it = shop_.find(item);
    if (it == shop_.end())
        return std::nullopt;
    return it->second;
}

std::vector<ShopStats> PlayerProfileStore::shop_analytics() const {
    std::lock_guard<std::mutex> lock(shop_mutex_);
    std::vector<ShopStats> out;
    out.reserve(shop_.size());
    for (const auto& [id, s] : shop_) {
        out.push_back(s);
    }
    return out;
}

std::string PlayerProfileStore::report() const {
    std::string out;
    char line[256];

    out += "=== PLAYER SEGMENTS ===\n";
    auto counts = segment_counts();
    for (Segment s : {Segment::New, Segment::Casual, Segment::Regular, Segment::Whale, Segment::Churned}) {
        std::snprintf(line, sizeof(line), "  %-8s %zu players\n", segment_to_string(s), counts[s]);
        out += line;
    }

    Amount revenue = 0;
    uint64_t purchases = 0;
    for (const auto& p : all()) {
        revenue += p.total_spent;
        purchases += p.purchase_count;
    }
    out += "\n=== REVENUE METRICS ===\n";
    std::snprintf(line, sizeof(line), "  Total Revenue:          %lld\n", static_cast<long long>(revenue));
    out += line;
    std::snprintf(line, sizeof(line), "  Total Purchases:        %llu\n", static_cast<unsigned long long>(purchases));
    out += line;
    std::snprintf(line, sizeof(line), "  Average Purchase Value: %.2f\n",
                  purchases > 0 ? static_cast<double>(revenue) / static_cast<double>(purchases) : 0.0);
    out += line;

    out += "\n=== SHOP ANALYTICS ===\n";
    for (const auto& s : shop_analytics()) {
        std::snprintf(line, sizeof(line), "  %-24s views=%-6llu purchases=%-6llu conversion=%6.2f%% revenue=%lld\n",
                      s.item.c_str(), static_cast<unsigned long long>(s.views),
                      static_cast<unsigned long long>(s.purchases), s.conversion_rate() * 100.0,
                      static_cast<long long>(s.revenue));
        out += line;
    }
    return out;
}

// =============================================================================
// Persistence
// =============================================================================

nlohmann::json PlayerProfileStore::to_json() const {
    nlohmann::json shop = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(shop_mutex_);
        for (const auto& [id, s] : shop_) {
            shop[id] = {{"views", s.views}, {"purchases", s.purchases}, {"revenue", s.revenue}};
        }
    }
    return {{"profiles", all()}, {"shop", shop}};
}

void PlayerProfileStore::from_json(const nlohmann::json& j) {
    std::map<PlayerId, std::unique_ptr<Entry>> profiles;
    std::map<ItemId, ShopStats> shop;
    Timestamp now = clock_.now();
    try {
        for (const auto& pj : j.at("profiles")) {
            PlayerProfile p = pj.get<PlayerProfile>();
            auto entry = std::make_unique<Entry>(p.player);
            entry->profile = p;
            recompute(entry->profile, std::max(now, p.last_active));
            profiles.emplace(p.player, std::move(entry));
        }
        for (const auto& [id, sj] : j.at("shop").items()) {
            ShopStats s;
            s.item = id;
            s.views = sj.at("views").get<uint64_t>();
            s.purchases = sj.at("purchases").get<uint64_t>();
            s.revenue = sj.at("revenue").get<Amount>();
            shop.emplace(id, s);
        }
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("profiles: ") + e.what());
    }

    {
        std::unique_lock lock(profiles_mutex_);
        profiles_ = std::move(profiles);
    }
    {
        std::lock_guard<std::mutex> lock(shop_mutex_);
        shop_ = std::move(shop);
    }
    ECON_LOGF_INFO(logger_, LogCategory::Persistence, "profiles restored: %zu", size());
}

} // namespace profile
} // namespace econ
