#pragma once

/**
 * Read-only value snapshots for UI and tooling
 *
 * Views are plain structs copied out of the economy; holding one never
 * holds a lock, and nothing in a view can be written back.
 */

#include "../economy/currency_ledger.hpp"
#include "../economy/exchange_rates.hpp"
#include "../pricing/inventory.hpp"
#include "../pricing/pricing_engine.hpp"
#include "../profile/profile_store.hpp"

#include <cstdio>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace econ {
namespace presentation {

struct BalanceView {
    CurrencyId currency;
    std::string name;
    std::string symbol;
    Amount amount = 0;
    Amount max_amount = 0;
    bool hard_currency = false;
};

struct WalletView {
    PlayerId player;
    std::vector<BalanceView> balances; // registry order
    std::map<std::string, int64_t> items;
    std::map<std::string, int64_t> boosters;
};

struct ShopItemView {
    ItemId id;
    std::string name;
    std::string category;
    std::string kind;
    std::vector<pricing::QuotedCost> price;
    double discount_percent = 0.0;
    Timestamp discount_expires_at = 0;
    bool popular = false;
    bool recommended = false;
    EconomyResult eligibility = EconomyResult::Success;
    bool affordable = false;
    std::string rewards; // "100 coins, 1x sword"
};

struct ProfileSummary {
    PlayerId player;
    profile::Segment segment = profile::Segment::New;
    Amount total_spent = 0;
    uint32_t purchases = 0;
    double engagement = 0.0;
    double churn_risk = 0.0;
    double days_inactive = 0.0;
};

struct RateView {
    CurrencyId from;
    CurrencyId to;
    double rate = 0.0;
    double min_rate = 0.0;
    double max_rate = 0.0;
    bool active = false;
};

// ============================================================================
// Builders
// ============================================================================

inline WalletView wallet_view(const economy::CurrencyLedger& ledger, const pricing::ItemInventory& inventory,
                              const PlayerId& player) {
    WalletView view;
    view.player = player;
    for (const auto* c : ledger.registry().all()) {
        view.balances.push_back(
            {c->id, c->name, c->symbol, ledger.balance(player, c->id), c->max_amount, c->is_hard_currency});
    }
    view.items = inventory.items(player);
    view.boosters = inventory.boosters(player);
    return view;
}

inline std::string describe_rewards(const std::vector<pricing::Reward>& rewards) {
    std::ostringstream out;
    bool first = true;
    for (const auto& reward : rewards) {
        if (!first)
            out << ", ";
        first = false;
        std::visit(
            [&out](const auto& r) {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, pricing::CurrencyReward>) {
                    out << r.amount << " " << r.currency;
                } else if constexpr (std::is_same_v<T, pricing::ItemReward>) {
                    out << r.quantity << "x " << r.item;
                } else {
                    out << r.quantity << "x " << r.booster;
                    if (r.duration_s > 0)
                        out << " (" << r.duration_s << "s)";
                }
            },
            reward);
    }
    return out.str();
}

inline std::optional<ShopItemView> shop_item_view(const pricing::PricingEngine& pricing, const ItemId& item,
                                                  const PlayerId& player) {
    auto def = pricing.item(item);
    auto quote = pricing.quote(item, player);
    if (!def || !quote)
        return std::nullopt;

    ShopItemView view;
    view.id = def->id;
    view.name = def->name;
    view.category = def->category;
    view.kind = pricing::item_kind_to_string(def->kind);
    view.price = quote->costs;
    view.discount_percent = quote->discount_percent;
    if (def->discount && quote->discount_percent > 0.0)
        view.discount_expires_at = def->discount->expires_at;
    view.popular = def->is_popular;
    view.recommended = def->is_recommended;
    view.eligibility = quote->eligibility;
    view.affordable = quote->affordable;
    view.rewards = describe_rewards(def->rewards);
    return view;
}

// Items the player may currently buy, in shop order
inline std::vector<ShopItemView> shop_view(const pricing::PricingEngine& pricing, const PlayerId& player) {
    std::vector<ShopItemView> out;
    for (const auto& item : pricing.available_items(player)) {
        if (auto view = shop_item_view(pricing, item.id, player))
            out.push_back(std::move(*view));
    }
    return out;
}

inline std::optional<ProfileSummary> profile_summary(const profile::PlayerProfileStore& store, const PlayerId& player,
                                                     Timestamp now) {
    auto p = store.profile(player);
    if (!p)
        return std::nullopt;
    return ProfileSummary{p->player,           p->segment,    p->total_spent,
                          p->purchase_count,   p->engagement_score, p->churn_risk,
                          profile::days_inactive(*p, now)};
}

inline std::vector<RateView> rate_views(const economy::ExchangeRateTable& rates) {
    std::vector<RateView> out;
    for (const auto& r : rates.all()) {
        out.push_back({r.from, r.to, r.rate, r.min_rate, r.max_rate, r.is_active});
    }
    return out;
}

// ============================================================================
// Text rendering
// ============================================================================

inline std::string format_wallet(const WalletView& view) {
    std::ostringstream out;
    out << "Wallet " << view.player << "\n";
    for (const auto& b : view.balances) {
        out << "  " << b.name << ": " << b.amount;
        if (b.hard_currency)
            out << " (hard)";
        out << "\n";
    }
    for (const auto& [id, count] : view.items) {
        out << "  item " << id << " x" << count << "\n";
    }
    for (const auto& [id, count] : view.boosters) {
        out << "  booster " << id << " x" << count << "\n";
    }
    return out.str();
}

inline std::string format_rates(const std::vector<RateView>& rates) {
    std::ostringstream out;
    char line[128];
    for (const auto& r : rates) {
        std::snprintf(line, sizeof(line), "  %-8s -> %-8s %10.4f  [%.4f, %.4f]%s\n", r.from.c_str(), r.to.c_str(),
                      r.rate, r.min_rate, r.max_rate, r.active ? "" : " inactive");
        out << line;
    }
    return out.str();
}

} // namespace presentation
} // namespace econ
