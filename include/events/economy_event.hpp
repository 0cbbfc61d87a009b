#pragma once

/**
 * Economy events published by the ledger and the pricing engine.
 *
 * One struct per event kind, combined into a std::variant so consumers
 * handle every kind explicitly with std::visit.
 */

#include "../types.hpp"

#include <string>
#include <variant>

namespace econ {
namespace events {

struct BalanceChanged {
    PlayerId player;
    CurrencyId currency;
    Amount old_balance = 0;
    Amount new_balance = 0;
};

struct CurrencyEarned {
    PlayerId player;
    CurrencyId currency;
    Amount amount = 0;
    std::string source;
};

struct CurrencySpent {
    PlayerId player;
    CurrencyId currency;
    Amount amount = 0;
    std::string reason;
    std::string category; // shop category for purchases, empty otherwise
};

struct CurrencyExchanged {
    PlayerId player;
    CurrencyId from;
    CurrencyId to;
    Amount amount = 0;
    Amount converted = 0;
    double rate = 0.0;
};

struct ItemPurchased {
    PlayerId player;
    ItemId item;
    std::string category;
    Amount total_cost = 0; // sum of effective costs across currencies
};

struct ItemViewed {
    PlayerId player;
    ItemId item;
};

struct RewardClaimed {
    PlayerId player;
    std::string reward_id;
};

struct DiscountStarted {
    ItemId item;
    double percent = 0.0;
    Timestamp expires_at = 0;
};

struct DiscountEnded {
    ItemId item;
};

struct MultipliersAdjusted {
    CurrencyId currency;
    double inflation_rate = 0.0;
    double sink_multiplier = 1.0;
    double source_multiplier = 1.0;
};

using EconomyEvent = std::variant<BalanceChanged, CurrencyEarned, CurrencySpent, CurrencyExchanged, ItemPurchased,
                                  ItemViewed, RewardClaimed, DiscountStarted, DiscountEnded, MultipliersAdjusted>;

struct EventEnvelope {
    Sequence sequence = 0;
    Timestamp timestamp = 0;
    EconomyEvent event;
};

// Helper for std::visit with lambdas
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace events
} // namespace econ
