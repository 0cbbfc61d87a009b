#pragma once

/**
 * JSON mapping for economy value types (nlohmann/json ADL hooks)
 *
 * Shared by the catalog loader and the snapshot path. Optional fields fall
 * back to the struct defaults; required fields throw nlohmann::json
 * exceptions which callers translate into CatalogError / SnapshotError.
 */

#include "../economy/currency.hpp"
#include "../economy/currency_ledger.hpp"
#include "../economy/exchange_rates.hpp"
#include "../economy/transaction.hpp"
#include "../pricing/shop_item.hpp"
#include "../profile/player_profile.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace econ {

namespace economy {

inline void to_json(nlohmann::json& j, const Currency& c) {
    j = {{"id", c.id},
         {"name", c.name},
         {"symbol", c.symbol},
         {"description", c.description},
         {"hard", c.is_hard_currency},
         {"tradeable", c.is_tradeable},
         {"min", c.min_amount},
         {"max", c.max_amount},
         {"decimals", c.decimal_places}};
}

inline void from_json(const nlohmann::json& j, Currency& c) {
    Currency d;
    c.id = j.at("id").get<CurrencyId>();
    c.name = j.value("name", c.id);
    c.symbol = j.value("symbol", d.symbol);
    c.description = j.value("description", d.description);
    c.is_hard_currency = j.value("hard", d.is_hard_currency);
    c.is_tradeable = j.value("tradeable", d.is_tradeable);
    c.min_amount = j.value("min", d.min_amount);
    c.max_amount = j.value("max", d.max_amount);
    c.decimal_places = j.value("decimals", d.decimal_places);
}

inline void to_json(nlohmann::json& j, const ExchangeRate& r) {
    j = {{"from", r.from},         {"to", r.to},           {"rate", r.rate},
         {"min_rate", r.min_rate}, {"max_rate", r.max_rate}, {"active", r.is_active},
         {"last_updated", r.last_updated}};
}

inline void from_json(const nlohmann::json& j, ExchangeRate& r) {
    r.from = j.at("from").get<CurrencyId>();
    r.to = j.at("to").get<CurrencyId>();
    r.rate = j.at("rate").get<double>();
    r.min_rate = j.value("min_rate", r.rate);
    r.max_rate = j.value("max_rate", r.rate);
    r.is_active = j.value("active", true);
    r.last_updated = j.value("last_updated", Timestamp{0});
}

inline void to_json(nlohmann::json& j, const Transaction& tx) {
    j = {{"seq", tx.sequence},
         {"type", transaction_type_to_string(tx.type)},
         {"player", tx.player},
         {"currency", tx.currency},
         {"amount", tx.amount},
         {"tag", tx.tag},
         {"ts", tx.timestamp},
         {"balance_after", tx.balance_after}};
}

inline void from_json(const nlohmann::json& j, Transaction& tx) {
    tx.sequence = j.at("seq").get<Sequence>();
    tx.type = transaction_type_from_string(j.at("type").get<std::string>());
    tx.player = j.at("player").get<PlayerId>();
    tx.currency = j.at("currency").get<CurrencyId>();
    tx.amount = j.at("amount").get<Amount>();
    tx.tag = j.at("tag").get<std::string>();
    tx.timestamp = j.at("ts").get<Timestamp>();
    tx.balance_after = j.at("balance_after").get<Amount>();
}

inline void to_json(nlohmann::json& j, const CurrencyStats& s) {
    j = {{"earned", s.total_earned},
         {"spent", s.total_spent},
         {"average_balance", s.average_balance},
         {"count", s.transaction_count},
         {"last_updated", s.last_updated}};
}

inline void from_json(const nlohmann::json& j, CurrencyStats& s) {
    s.total_earned = j.at("earned").get<Amount>();
    s.total_spent = j.at("spent").get<Amount>();
    s.average_balance = j.at("average_balance").get<double>();
    s.transaction_count = j.at("count").get<uint64_t>();
    s.last_updated = j.at("last_updated").get<Timestamp>();
}

} // namespace economy

namespace profile {

inline void to_json(nlohmann::json& j, const PlayerProfile& p) {
    j = {{"player", p.player},
         {"total_spent", p.total_spent},
         {"total_earned", p.total_earned},
         {"purchases", p.purchase_count},
         {"rewards_claimed", p.rewards_claimed},
         {"first_purchase", p.first_purchase},
         {"last_purchase", p.last_purchase},
         {"last_active", p.last_active},
         {"spend_by_category", p.spend_by_category},
         {"segment", segment_to_string(p.segment)},
         {"engagement", p.engagement_score},
         {"churn_risk", p.churn_risk}};
}

// Derived fields are recomputed by the owner after loading
inline void from_json(const nlohmann::json& j, PlayerProfile& p) {
    p.player = j.at("player").get<PlayerId>();
    p.total_spent = j.at("total_spent").get<Amount>();
    p.total_earned = j.at("total_earned").get<Amount>();
    p.purchase_count = j.at("purchases").get<uint32_t>();
    p.rewards_claimed = j.at("rewards_claimed").get<uint32_t>();
    p.first_purchase = j.at("first_purchase").get<Timestamp>();
    p.last_purchase = j.at("last_purchase").get<Timestamp>();
    p.last_active = j.at("last_active").get<Timestamp>();
    p.spend_by_category = j.at("spend_by_category").get<std::map<std::string, Amount>>();
    p.segment = segment_from_string(j.at("segment").get<std::string>());
}

} // namespace profile

namespace pricing {

inline nlohmann::json reward_to_json(const Reward& reward) {
    return std::visit(
        [](const auto& r) -> nlohmann::json {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, CurrencyReward>) {
                return {{"type", "currency"}, {"currency", r.currency}, {"amount", r.amount}};
            } else if constexpr (std::is_same_v<T, ItemReward>) {
                return {{"type", "item"}, {"item", r.item}, {"quantity", r.quantity}};
            } else {
                return {{"type", "booster"}, {"booster", r.booster}, {"quantity", r.quantity},
                        {"duration_s", r.duration_s}};
            }
        },
        reward);
}

// Throws CatalogError on an unknown reward type
inline Reward reward_from_json(const nlohmann::json& j) {
    std::string type = j.at("type").get<std::string>();
    if (type == "currency") {
        return CurrencyReward{j.at("currency").get<CurrencyId>(), j.at("amount").get<Amount>()};
    }
    if (type == "item") {
        return ItemReward{j.at("item").get<ItemId>(), j.value("quantity", 1)};
    }
    if (type == "booster") {
        return BoosterReward{j.at("booster").get<std::string>(), j.value("quantity", 1), j.value("duration_s", 0u)};
    }
    throw CatalogError("unknown reward type '" + type + "'");
}

inline void to_json(nlohmann::json& j, const ShopCost& c) {
    j = {{"currency", c.currency}, {"amount", c.amount}, {"original_amount", c.original_amount}};
}

inline void from_json(const nlohmann::json& j, ShopCost& c) {
    c.currency = j.at("currency").get<CurrencyId>();
    c.amount = j.at("amount").get<Amount>();
    c.original_amount = j.value("original_amount", c.amount);
}

inline void to_json(nlohmann::json& j, const DiscountWindow& w) {
    j = {{"percent", w.percent},
         {"started_at", w.started_at},
         {"expires_at", w.expires_at},
         {"max_purchases", w.max_purchases},
         {"purchases", w.purchases}};
}

inline void from_json(const nlohmann::json& j, DiscountWindow& w) {
    w.percent = j.at("percent").get<double>();
    w.started_at = j.at("started_at").get<Timestamp>();
    w.expires_at = j.at("expires_at").get<Timestamp>();
    w.max_purchases = j.at("max_purchases").get<int32_t>();
    w.purchases = j.at("purchases").get<int32_t>();
}

inline void to_json(nlohmann::json& j, const Eligibility& e) {
    j = {{"min_level", e.min_level},
         {"max_level", e.max_level},
         {"max_player_purchases", e.max_player_purchases},
         {"available_until", e.available_until}};
}

inline void from_json(const nlohmann::json& j, Eligibility& e) {
    Eligibility d;
    e.min_level = j.value("min_level", d.min_level);
    e.max_level = j.value("max_level", d.max_level);
    e.max_player_purchases = j.value("max_player_purchases", d.max_player_purchases);
    e.available_until = j.value("available_until", d.available_until);
}

inline void to_json(nlohmann::json& j, const ShopItem& item) {
    nlohmann::json rewards = nlohmann::json::array();
    for (const auto& r : item.rewards) {
        rewards.push_back(reward_to_json(r));
    }
    j = {{"id", item.id},
         {"name", item.name},
         {"description", item.description},
         {"kind", item_kind_to_string(item.kind)},
         {"category", item.category},
         {"display_order", item.display_order},
         {"popular", item.is_popular},
         {"recommended", item.is_recommended},
         {"costs", item.costs},
         {"rewards", rewards},
         {"eligibility", item.eligibility},
         {"available", item.is_available},
         {"max_purchases", item.max_purchases},
         {"current_purchases", item.current_purchases}};
    j["discount"] = item.discount ? nlohmann::json(*item.discount) : nlohmann::json(nullptr);
}

inline void from_json(const nlohmann::json& j, ShopItem& item) {
    ShopItem d;
    item.id = j.at("id").get<ItemId>();
    item.name = j.value("name", item.id);
    item.description = j.value("description", d.description);
    item.kind = item_kind_from_string(j.value("kind", std::string(item_kind_to_string(d.kind))));
    item.category = j.value("category", d.category);
    item.display_order = j.value("display_order", d.display_order);
    item.is_popular = j.value("popular", d.is_popular);
    item.is_recommended = j.value("recommended", d.is_recommended);
    item.costs = j.at("costs").get<std::vector<ShopCost>>();
    item.rewards.clear();
    for (const auto& r : j.at("rewards")) {
        item.rewards.push_back(reward_from_json(r));
    }
    item.eligibility = j.contains("eligibility") ? j.at("eligibility").get<Eligibility>() : d.eligibility;
    item.is_available = j.value("available", d.is_available);
    item.max_purchases = j.value("max_purchases", d.max_purchases);
    item.current_purchases = j.value("current_purchases", d.current_purchases);
    if (j.contains("discount") && !j.at("discount").is_null()) {
        item.discount = j.at("discount").get<DiscountWindow>();
    } else {
        item.discount.reset();
    }
}

inline void to_json(nlohmann::json& j, const ShopCategory& c) {
    j = {{"id", c.id}, {"name", c.name}, {"display_order", c.display_order}, {"active", c.is_active}};
}

inline void from_json(const nlohmann::json& j, ShopCategory& c) {
    c.id = j.at("id").get<std::string>();
    c.name = j.value("name", c.id);
    c.display_order = j.value("display_order", 0);
    c.is_active = j.value("active", true);
}

} // namespace pricing

} // namespace econ
