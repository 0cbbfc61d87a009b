#include "../../include/pricing/pricing_engine.hpp"
#include "../../include/persistence/json_codec.hpp"

#include <algorithm>

namespace econ {
namespace pricing {

namespace LogCategory = logging::LogCategory;
using economy::CurrencyLedger;

PricingEngine::PricingEngine(CurrencyLedger& ledger, ItemInventory& inventory, events::EventBus& bus,
                             const util::Clock& clock, PricingConfig config, logging::AsyncLogger* logger)
    : ledger_(ledger), inventory_(inventory), bus_(bus), clock_(clock), config_(config), logger_(logger) {}

// =============================================================================
// Catalog
// =============================================================================

void PricingEngine::add_category(const ShopCategory& category) {
    if (category.id.empty()) {
        throw CatalogError("shop category with empty id");
    }
    std::unique_lock lock(catalog_mutex_);
    for (const auto& c : categories_) {
        if (c.id == category.id) {
            throw CatalogError("duplicate shop category '" + category.id + "'");
        }
    }
    categories_.push_back(category);
}

void PricingEngine::add_item(ShopItem item) {
    const auto& registry = ledger_.registry();
    if (item.id.empty()) {
        throw CatalogError("shop item with empty id");
    }
    if (item.costs.empty()) {
        throw CatalogError("shop item '" + item.id + "' has no cost");
    }
    for (auto& cost : item.costs) {
        registry.require(cost.currency);
        if (cost.amount <= 0) {
            throw CatalogError("shop item '" + item.id + "' has non-positive cost in " + cost.currency);
        }
        if (!item.discount)
            cost.original_amount = cost.amount;
    }
    for (const auto& reward : item.rewards) {
        if (const auto* c = std::get_if<CurrencyReward>(&reward)) {
            registry.require(c->currency);
            if (c->amount <= 0) {
                throw CatalogError("shop item '" + item.id + "' has non-positive reward in " + c->currency);
            }
        }
    }
    if (item.eligibility.min_level > item.eligibility.max_level) {
        throw CatalogError("shop item '" + item.id + "' has min level above max level");
    }

    std::unique_lock lock(catalog_mutex_);
    if (!item.category.empty() && !categories_.empty()) {
        bool known = std::any_of(categories_.begin(), categories_.end(),
                                 [&](const ShopCategory& c) { return c.id == item.category; });
        if (!known) {
            throw CatalogError("shop item '" + item.id + "' references unknown category '" + item.category + "'");
        }
    }
    if (items_.count(item.id) != 0) {
        throw CatalogError("duplicate shop item '" + item.id + "'");
    }
    ItemId id = item.id;
    items_.emplace(id, std::make_unique<ItemEntry>(std::move(item)));
}

void PricingEngine::set_level_provider(LevelProvider provider) {
    std::unique_lock lock(catalog_mutex_);
    level_provider_ = std::move(provider);
}

void PricingEngine::set_multipliers(const CurrencyId& currency, double sink, double source) {
    std::lock_guard<std::mutex> lock(multipliers_mutex_);
    multipliers_[currency] = Multiplier{sink, source};
}

double PricingEngine::sink_multiplier(const CurrencyId& currency) const {
    std::lock_guard<std::mutex> lock(multipliers_mutex_);
    auto it = multipliers_.find(currency);
    return it != multipliers_.end() ? it->second.sink : 1.0;
}

double PricingEngine::source_multiplier(const CurrencyId& currency) const {
    std::lock_guard<std::mutex> lock(multipliers_mutex_);
    auto it = multipliers_.find(currency);
    return it != multipliers_.end() ? it->second.source : 1.0;
}

PricingEngine::ItemEntry* PricingEngine::find(const ItemId& id) const {
    std::shared_lock lock(catalog_mutex_);
    auto it = items_.find(id);
    return it != items_.end() ? it->second.get() : nullptr;
}

int32_t PricingEngine::level_of(const PlayerId& player) const {
    LevelProvider provider;
    {
        std::shared_lock lock(catalog_mutex_);
        provider = level_provider_;
    }
    return provider ? provider(player) : config_.default_player_level;
}

// =============================================================================
// Pricing helpers (entry.mutex held)
// =============================================================================

EconomyResult PricingEngine::eligibility_locked(const ShopItem& item, const PlayerId& player, int32_t level,
                                                Timestamp now) const {
    if (!item.is_available)
        return EconomyResult::ItemUnavailable;
    if (level < item.eligibility.min_level || level > item.eligibility.max_level)
        return EconomyResult::ItemUnavailable;
    if (item.sold_out())
        return EconomyResult::ItemUnavailable;
    if (item.time_boxed() && now > item.eligibility.available_until)
        return EconomyResult::ItemUnavailable;
    if (item.eligibility.max_player_purchases != UNLIMITED &&
        player_purchases(player, item.id) >= item.eligibility.max_player_purchases) {
        return EconomyResult::ItemUnavailable;
    }
    return EconomyResult::Success;
}

std::vector<QuotedCost> PricingEngine::costs_locked(const ShopItem& item, Timestamp now) const {
    // A window past expiry prices at the original even before the sweep reverts it
    bool window_open = item.discount && !item.discount->expired(now) && !item.discount->cap_reached();
    std::vector<QuotedCost> out;
    out.reserve(item.costs.size());
    for (const auto& cost : item.costs) {
        QuotedCost q;
        q.currency = cost.currency;
        q.original = cost.original_amount;
        q.listed = window_open ? cost.amount : cost.original_amount;
        q.effective = effective_amount(q.listed, sink_multiplier(cost.currency));
        out.push_back(q);
    }
    return out;
}

void PricingEngine::revert_discount_locked(ShopItem& item) {
    for (auto& cost : item.costs) {
        cost.amount = cost.original_amount;
    }
    item.discount.reset();
}

// =============================================================================
// Queries
// =============================================================================

EconomyResult PricingEngine::check_eligibility(const ItemId& id, const PlayerId& player) const {
    ItemEntry* entry = find(id);
    if (!entry)
        return EconomyResult::ItemUnknown;
    int32_t level = level_of(player);
    std::lock_guard<std::mutex> lock(entry->mutex);
    return eligibility_locked(entry->item, player, level, clock_.now());
}

bool PricingEngine::can_afford(const ItemId& id, const PlayerId& player) const {
    auto q = quote(id, player);
    return q && q->affordable;
}

bool PricingEngine::can_purchase(const ItemId& id, const PlayerId& player) const {
    auto q = quote(id, player);
    return q && q->purchasable();
}

std::optional<PriceQuote> PricingEngine::quote(const ItemId& id, const PlayerId& player) const {
    ItemEntry* entry = find(id);
    if (!entry)
        return std::nullopt;
    int32_t level = level_of(player);
    Timestamp now = clock_.now();

    PriceQuote q;
    q.item = id;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        q.eligibility = eligibility_locked(entry->item, player, level, now);
        q.costs = costs_locked(entry->item, now);
        const auto& window = entry->item.discount;
        if (window && !window->expired(now) && !window->cap_reached())
            q.discount_percent = window->percent;
    }

    std::map<CurrencyId, Amount> needed;
    for (const auto& c : q.costs) {
        needed[c.currency] += c.effective;
    }
    q.affordable = true;
    for (const auto& [currency, amount] : needed) {
        if (!ledger_.can_afford(player, currency, amount)) {
            q.affordable = false;
            break;
        }
    }
    return q;
}

std::optional<ShopItem> PricingEngine::item(const ItemId& id) const {
    ItemEntry* entry = find(id);
    if (!entry)
        return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->item;
}

std::vector<ShopItem> PricingEngine::items() const {
    std::vector<ShopItem> out;
    std::shared_lock lock(catalog_mutex_);
    out.reserve(items_.size());
    for (const auto& [id, entry] : items_) {
        std::lock_guard<std::mutex> item_lock(entry->mutex);
        out.push_back(entry->item);
    }
    return out;
}

std::vector<ShopItem> PricingEngine::available_items(const PlayerId& player) const {
    int32_t level = level_of(player);
    Timestamp now = clock_.now();
    std::vector<ShopItem> out;
    {
        std::shared_lock lock(catalog_mutex_);
        for (const auto& [id, entry] : items_) {
            std::lock_guard<std::mutex> item_lock(entry->mutex);
            if (eligibility_locked(entry->item, player, level, now) == EconomyResult::Success)
                out.push_back(entry->item);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ShopItem& a, const ShopItem& b) {
        if (a.is_recommended != b.is_recommended)
            return a.is_recommended;
        if (a.is_popular != b.is_popular)
            return a.is_popular;
        return a.display_order < b.display_order;
    });
    return out;
}

std::vector<ShopItem> PricingEngine::items_in_category(const std::string& category) const {
    std::vector<ShopItem> out;
    for (auto& item : items()) {
        if (item.category == category)
            out.push_back(std::move(item));
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const ShopItem& a, const ShopItem& b) { return a.display_order < b.display_order; });
    return out;
}

std::vector<ShopCategory> PricingEngine::categories() const {
    std::vector<ShopCategory> out;
    {
        std::shared_lock lock(catalog_mutex_);
        for (const auto& c : categories_) {
            if (c.is_active)
                out.push_back(c);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const ShopCategory& a, const ShopCategory& b) { return a.display_order < b.display_order; });
    return out;
}

int32_t PricingEngine::player_purchases(const PlayerId& player, const ItemId& item) const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    auto p = purchases_.find(player);
    if (p == purchases_.end())
        return 0;
    auto it = p->second.find(item);
    return it != p->second.end() ? it->second : 0;
}

size_t PricingEngine::item_count() const {
    std::shared_lock lock(catalog_mutex_);
    return items_.size();
}

// =============================================================================
// Rewards (wallet lock held)
// =============================================================================

EconomyResult PricingEngine::grant_locked(CurrencyLedger::WalletSession& wallet, const std::vector<Reward>& rewards,
                                          const std::string& tag, Granted& granted) {
    const PlayerId& player = wallet.player();

    // A currency reward is credited in full or the grant fails
    std::map<CurrencyId, Amount> incoming;
    for (const auto& reward : rewards) {
        if (const auto* r = std::get_if<CurrencyReward>(&reward)) {
            Amount amount = scaled_reward(r->amount, source_multiplier(r->currency));
            if (amount > 0)
                incoming[r->currency] += amount;
        }
    }
    for (const auto& [currency, amount] : incoming) {
        const economy::Currency* def = ledger_.registry().find(currency);
        if (!def)
            return EconomyResult::CurrencyUnknown;
        if (amount > def->max_amount - wallet.balance(currency)) {
            ECON_LOGF_DEBUG(logger_, LogCategory::Pricing, "%s: no room for %lld %s", player.c_str(),
                            static_cast<long long>(amount), currency.c_str());
            return EconomyResult::BalanceCapped;
        }
    }

    for (const auto& reward : rewards) {
        if (const auto* r = std::get_if<ItemReward>(&reward)) {
            if (inventory_.grant_item(player, *r) != EconomyResult::Success)
                return EconomyResult::InsufficientInventory;
            granted.items.push_back(*r);
        } else if (const auto* b = std::get_if<BoosterReward>(&reward)) {
            if (inventory_.grant_booster(player, *b) != EconomyResult::Success)
                return EconomyResult::InsufficientInventory;
            granted.boosters.push_back(*b);
        }
    }

    for (const auto& reward : rewards) {
        const auto* r = std::get_if<CurrencyReward>(&reward);
        if (!r)
            continue;
        Amount amount = scaled_reward(r->amount, source_multiplier(r->currency));
        if (amount <= 0)
            continue;
        if (wallet.earn(r->currency, amount, tag, false) != EconomyResult::Success)
            return EconomyResult::InsufficientInventory;
        granted.currency.push_back(CurrencyReward{r->currency, amount});
    }
    return EconomyResult::Success;
}

void PricingEngine::revoke_locked(CurrencyLedger::WalletSession& wallet, const Granted& granted,
                                  const std::string& tag) {
    const PlayerId& player = wallet.player();
    for (const auto& c : granted.currency) {
        EconomyResult r = wallet.spend(c.currency, c.amount, "revoke_" + tag, "", false);
        if (r != EconomyResult::Success) {
            ECON_LOGF_ERROR(logger_, LogCategory::Pricing, "revoke of %lld %s from %s failed: %s",
                            static_cast<long long>(c.amount), c.currency.c_str(), player.c_str(),
                            economy_result_to_string(r));
        }
    }
    for (const auto& i : granted.items) {
        inventory_.revoke_item(player, i);
    }
    for (const auto& b : granted.boosters) {
        inventory_.revoke_booster(player, b);
    }
}

void PricingEngine::publish_earned(const PlayerId& player, const Granted& granted, const std::string& tag,
                                   Timestamp now) {
    for (const auto& c : granted.currency) {
        bus_.publish(events::CurrencyEarned{player, c.currency, c.amount, tag}, now);
    }
}

// =============================================================================
// Purchase
// =============================================================================

EconomyResult PricingEngine::purchase(const ItemId& id, const PlayerId& player) {
    ItemEntry* entry = find(id);
    if (!entry)
        return EconomyResult::ItemUnknown;
    int32_t level = level_of(player);
    const auto& registry = ledger_.registry();

    EconomyResult result = ledger_.with_wallet(player, [&](CurrencyLedger::WalletSession& wallet) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ShopItem& item = entry->item;
        Timestamp now = clock_.now();

        if (item.discount && item.discount->expired(now)) {
            revert_discount_locked(item);
            bus_.publish(events::DiscountEnded{item.id}, now);
        }

        EconomyResult eligible = eligibility_locked(item, player, level, now);
        if (eligible != EconomyResult::Success)
            return eligible;

        // Each line must be payable on its own; lines sharing a currency are settled by the spend loop
        auto costs = costs_locked(item, now);
        for (const auto& c : costs) {
            const economy::Currency& def = registry.require(c.currency);
            if (wallet.balance(c.currency) - c.effective < def.min_amount)
                return EconomyResult::InsufficientFunds;
        }

        const std::string reason = "shop_purchase_" + item.id;
        std::vector<QuotedCost> spent;
        auto refund_spent = [&]() {
            for (const auto& c : spent) {
                EconomyResult r = wallet.refund(c.currency, c.effective, "refund_" + item.id);
                if (r != EconomyResult::Success) {
                    ECON_LOGF_ERROR(logger_, LogCategory::Pricing, "refund of %lld %s to %s failed: %s",
                                    static_cast<long long>(c.effective), c.currency.c_str(), player.c_str(),
                                    economy_result_to_string(r));
                }
            }
        };

        for (const auto& c : costs) {
            EconomyResult r = wallet.spend(c.currency, c.effective, reason, item.category, false);
            if (r != EconomyResult::Success) {
                ECON_LOGF_WARN(logger_, LogCategory::Pricing, "%s: cost %s failed mid-purchase (%s)", item.id.c_str(),
                               c.currency.c_str(), economy_result_to_string(r));
                refund_spent();
                return EconomyResult::PurchaseCostFailure;
            }
            spent.push_back(c);
        }

        Granted granted;
        if (grant_locked(wallet, item.rewards, reason, granted) != EconomyResult::Success) {
            ECON_LOGF_WARN(logger_, LogCategory::Pricing, "%s: reward grant rejected for %s", item.id.c_str(),
                           player.c_str());
            revoke_locked(wallet, granted, reason);
            refund_spent();
            return EconomyResult::InsufficientInventory;
        }

        // Commit
        item.current_purchases++;
        {
            std::lock_guard<std::mutex> history_lock(history_mutex_);
            purchases_[player][item.id]++;
        }
        if (item.discount) {
            item.discount->purchases++;
            if (item.discount->cap_reached()) {
                revert_discount_locked(item);
                bus_.publish(events::DiscountEnded{item.id}, now);
            }
        }

        Amount total = 0;
        for (const auto& c : spent) {
            total += c.effective;
            bus_.publish(events::CurrencySpent{player, c.currency, c.effective, reason, item.category}, now);
        }
        publish_earned(player, granted, reason, now);
        bus_.publish(events::ItemPurchased{player, item.id, item.category, total}, now);
        return EconomyResult::Success;
    });

    if (result == EconomyResult::Success) {
        ECON_LOGF_INFO(logger_, LogCategory::Pricing, "%s bought %s", player.c_str(), id.c_str());
    } else {
        ECON_LOGF_DEBUG(logger_, LogCategory::Pricing, "%s denied %s: %s", player.c_str(), id.c_str(),
                        economy_result_to_string(result));
    }
    return result;
}

EconomyResult PricingEngine::claim_reward(const PlayerId& player, const std::string& reward_id,
                                          const std::vector<Reward>& rewards) {
    for (const auto& reward : rewards) {
        if (const auto* c = std::get_if<CurrencyReward>(&reward)) {
            if (!ledger_.registry().contains(c->currency))
                return EconomyResult::CurrencyUnknown;
            if (c->amount <= 0)
                return EconomyResult::InvalidAmount;
        }
    }

    return ledger_.with_wallet(player, [&](CurrencyLedger::WalletSession& wallet) {
        const std::string tag = "reward_" + reward_id;
        Granted granted;
        if (grant_locked(wallet, rewards, tag, granted) != EconomyResult::Success) {
            revoke_locked(wallet, granted, tag);
            return EconomyResult::InsufficientInventory;
        }
        Timestamp now = clock_.now();
        publish_earned(player, granted, tag, now);
        bus_.publish(events::RewardClaimed{player, reward_id}, now);
        return EconomyResult::Success;
    });
}

EconomyResult PricingEngine::view_item(const ItemId& id, const PlayerId& player) {
    if (!find(id))
        return EconomyResult::ItemUnknown;
    bus_.publish(events::ItemViewed{player, id}, clock_.now());
    return EconomyResult::Success;
}

void PricingEngine::set_item_available(const ItemId& id, bool available) {
    ItemEntry* entry = find(id);
    if (!entry)
        return;
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->item.is_available = available;
}

// =============================================================================
// Discounts
// =============================================================================

EconomyResult PricingEngine::apply_timed_discount(const ItemId& id, double percent, int32_t hours,
                                                  int32_t max_purchases) {
    ItemEntry* entry = find(id);
    if (!entry)
        return EconomyResult::ItemUnknown;
    if (!(percent > 0.0) || percent > config_.max_discount_pct || hours <= 0)
        return EconomyResult::InvalidAmount;
    if (max_purchases != UNLIMITED && max_purchases <= 0)
        return EconomyResult::InvalidAmount;

    Timestamp now = clock_.now();
    Timestamp expires_at = now + util::hours_to_ns(hours);
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ShopItem& item = entry->item;
        if (item.discount) {
            revert_discount_locked(item);
            bus_.publish(events::DiscountEnded{item.id}, now);
        }
        for (auto& cost : item.costs) {
            cost.amount = discounted_amount(cost.original_amount, percent);
        }
        item.discount = DiscountWindow{percent, now, expires_at, max_purchases, 0};
        bus_.publish(events::DiscountStarted{item.id, percent, expires_at}, now);
    }
    ECON_LOGF_INFO(logger_, LogCategory::Pricing, "discount %.1f%% on %s for %dh", percent, id.c_str(), hours);
    return EconomyResult::Success;
}

bool PricingEngine::end_discount(const ItemId& id) {
    ItemEntry* entry = find(id);
    if (!entry)
        return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->item.discount)
        return false;
    revert_discount_locked(entry->item);
    bus_.publish(events::DiscountEnded{id}, clock_.now());
    return true;
}

size_t PricingEngine::expire_discounts(Timestamp now) {
    size_t ended = 0;
    std::shared_lock lock(catalog_mutex_);
    for (auto& [id, entry] : items_) {
        std::lock_guard<std::mutex> item_lock(entry->mutex);
        auto& window = entry->item.discount;
        if (window && (window->expired(now) || window->cap_reached())) {
            revert_discount_locked(entry->item);
            bus_.publish(events::DiscountEnded{id}, now);
            ++ended;
        }
    }
    if (ended > 0) {
        ECON_LOGF_INFO(logger_, LogCategory::Pricing, "%zu discount windows ended", ended);
    }
    return ended;
}

// =============================================================================
// Persistence
// =============================================================================

nlohmann::json PricingEngine::to_json() const {
    nlohmann::json items = nlohmann::json::object();
    for (const auto& item : this->items()) {
        items[item.id] = {{"costs", item.costs},
                          {"current_purchases", item.current_purchases},
                          {"available", item.is_available},
                          {"discount", item.discount ? nlohmann::json(*item.discount) : nlohmann::json(nullptr)}};
    }
    nlohmann::json history;
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history = purchases_;
    }
    return {{"items", items}, {"purchases", history}};
}

void PricingEngine::from_json(const nlohmann::json& j) {
    struct State {
        std::vector<ShopCost> costs;
        int32_t current_purchases;
        bool available;
        std::optional<DiscountWindow> discount;
    };
    std::map<ItemId, State> states;
    std::map<PlayerId, std::map<ItemId, int32_t>> purchases;

    try {
        for (const auto& [id, sj] : j.at("items").items()) {
            ItemEntry* entry = find(id);
            if (!entry) {
                throw SnapshotError("state for unknown shop item '" + id + "'");
            }
            State s;
            s.costs = sj.at("costs").get<std::vector<ShopCost>>();
            s.current_purchases = sj.at("current_purchases").get<int32_t>();
            s.available = sj.at("available").get<bool>();
            if (!sj.at("discount").is_null())
                s.discount = sj.at("discount").get<DiscountWindow>();

            std::lock_guard<std::mutex> lock(entry->mutex);
            const auto& catalog_costs = entry->item.costs;
            if (s.costs.size() != catalog_costs.size()) {
                throw SnapshotError("cost lines of '" + id + "' do not match catalog");
            }
            for (size_t i = 0; i < s.costs.size(); ++i) {
                if (s.costs[i].currency != catalog_costs[i].currency || s.costs[i].amount <= 0) {
                    throw SnapshotError("cost " + std::to_string(i) + " of '" + id + "' does not match catalog");
                }
            }
            if (s.current_purchases < 0) {
                throw SnapshotError("negative purchase count for '" + id + "'");
            }
            states.emplace(id, std::move(s));
        }
        purchases = j.at("purchases").get<std::map<PlayerId, std::map<ItemId, int32_t>>>();
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("shop: ") + e.what());
    }

    for (auto& [id, s] : states) {
        ItemEntry* entry = find(id);
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->item.costs = std::move(s.costs);
        entry->item.current_purchases = s.current_purchases;
        entry->item.is_available = s.available;
        entry->item.discount = s.discount;
    }
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        purchases_ = std::move(purchases);
    }
    ECON_LOGF_INFO(logger_, LogCategory::Persistence, "shop restored: %zu items", states.size());
}

} // namespace pricing
} // namespace econ
