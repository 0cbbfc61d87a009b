#pragma once

/**
 * Shop catalog types: items, costs, rewards, eligibility, discount windows
 *
 * Key Invariants:
 *   cost.amount is the listed price; cost.original_amount is the undiscounted
 *   price and is never recomputed, so reverting a discount restores it exactly.
 *   Inflation multipliers are applied at quote time and never stored here.
 */

#include "../config/defaults.hpp"
#include "../types.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace econ {
namespace pricing {

enum class ItemKind : uint8_t { Currency = 0, Booster, Decoration, Character, Consumable, Permanent, Subscription, Special };

inline const char* item_kind_to_string(ItemKind kind) {
    switch (kind) {
    case ItemKind::Currency:
        return "currency";
    case ItemKind::Booster:
        return "booster";
    case ItemKind::Decoration:
        return "decoration";
    case ItemKind::Character:
        return "character";
    case ItemKind::Consumable:
        return "consumable";
    case ItemKind::Permanent:
        return "permanent";
    case ItemKind::Subscription:
        return "subscription";
    case ItemKind::Special:
        return "special";
    }
    return "unknown";
}

// Throws CatalogError
inline ItemKind item_kind_from_string(const std::string& s) {
    static const ItemKind kinds[] = {ItemKind::Currency,   ItemKind::Booster,   ItemKind::Decoration,
                                     ItemKind::Character,  ItemKind::Consumable, ItemKind::Permanent,
                                     ItemKind::Subscription, ItemKind::Special};
    for (ItemKind k : kinds) {
        if (s == item_kind_to_string(k))
            return k;
    }
    throw CatalogError("unknown item kind '" + s + "'");
}

struct ShopCost {
    CurrencyId currency;
    Amount amount = 0;          // listed (possibly discounted)
    Amount original_amount = 0; // undiscounted
};

// ============================================================================
// Rewards
// ============================================================================

struct CurrencyReward {
    CurrencyId currency;
    Amount amount = 0;
};

struct ItemReward {
    ItemId item;
    int32_t quantity = 1;
};

struct BoosterReward {
    std::string booster;
    int32_t quantity = 1;
    uint32_t duration_s = 0; // 0 = until consumed
};

using Reward = std::variant<CurrencyReward, ItemReward, BoosterReward>;

struct Eligibility {
    int32_t min_level = 1;
    int32_t max_level = std::numeric_limits<int32_t>::max();
    int32_t max_player_purchases = UNLIMITED;
    Timestamp available_until = 0; // 0 = not time-boxed
};

struct DiscountWindow {
    double percent = 0.0;
    Timestamp started_at = 0;
    Timestamp expires_at = 0;
    int32_t max_purchases = UNLIMITED; // offer cap
    int32_t purchases = 0;

    bool expired(Timestamp now) const { return now > expires_at; }
    bool cap_reached() const { return max_purchases != UNLIMITED && purchases >= max_purchases; }
};

struct ShopItem {
    ItemId id;
    std::string name;
    std::string description;
    ItemKind kind = ItemKind::Consumable;
    std::string category;
    int32_t display_order = 0;
    bool is_popular = false;
    bool is_recommended = false;

    std::vector<ShopCost> costs;
    std::vector<Reward> rewards;
    Eligibility eligibility;

    bool is_available = true;
    int32_t max_purchases = UNLIMITED;
    int32_t current_purchases = 0;

    std::optional<DiscountWindow> discount;

    bool time_boxed() const { return eligibility.available_until != 0; }
    bool sold_out() const { return max_purchases != UNLIMITED && current_purchases >= max_purchases; }
};

struct ShopCategory {
    std::string id;
    std::string name;
    int32_t display_order = 0;
    bool is_active = true;
};

// ============================================================================
// Price arithmetic
// ============================================================================

inline Amount round_cost(double value) {
    Amount rounded = static_cast<Amount>(std::llround(value));
    return std::max<Amount>(rounded, config::pricing::MIN_COST);
}

// Listed price under a discount of `percent`
inline Amount discounted_amount(Amount original, double percent) {
    return round_cost(static_cast<double>(original) * (1.0 - percent / 100.0));
}

// Price actually charged
inline Amount effective_amount(Amount listed, double sink_multiplier) {
    return round_cost(static_cast<double>(listed) * sink_multiplier);
}

// Currency reward actually granted; may round to zero
inline Amount scaled_reward(Amount amount, double source_multiplier) {
    return static_cast<Amount>(std::llround(static_cast<double>(amount) * source_multiplier));
}

} // namespace pricing
} // namespace econ
