#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace econ {

// Whole currency units; precision beyond the unit lives in Currency::decimal_places
using Amount = int64_t;
using PlayerId = std::string;
using CurrencyId = std::string;
using ItemId = std::string;
using Timestamp = uint64_t; // nanoseconds, see util/time_utils.hpp
using Sequence = uint64_t;

constexpr Amount AMOUNT_MAX = std::numeric_limits<Amount>::max();
constexpr int32_t UNLIMITED = -1;

// Outcome of every recoverable economy operation
enum class EconomyResult : uint8_t {
    Success = 0,
    CurrencyUnknown,       // Currency id not registered
    InvalidAmount,         // Zero or negative amount
    InsufficientFunds,     // Balance would drop below minimum
    BalanceCapped,         // Balance already at maximum, nothing credited
    InsufficientInventory, // Item/booster grant rejected by inventory
    ExchangeUnavailable,   // No active rate or currency not tradeable
    ExchangeTooSmall,      // Converted amount rounds to zero
    ItemUnknown,           // Shop item id not in catalog
    ItemUnavailable,       // Eligibility, time window or purchase cap failed
    PurchaseCostFailure    // A cost failed mid-purchase, spent costs refunded
};

inline const char* economy_result_to_string(EconomyResult result) {
    switch (result) {
    case EconomyResult::Success:
        return "Success";
    case EconomyResult::CurrencyUnknown:
        return "CurrencyUnknown";
    case EconomyResult::InvalidAmount:
        return "InvalidAmount";
    case EconomyResult::InsufficientFunds:
        return "InsufficientFunds";
    case EconomyResult::BalanceCapped:
        return "BalanceCapped";
    case EconomyResult::InsufficientInventory:
        return "InsufficientInventory";
    case EconomyResult::ExchangeUnavailable:
        return "ExchangeUnavailable";
    case EconomyResult::ExchangeTooSmall:
        return "ExchangeTooSmall";
    case EconomyResult::ItemUnknown:
        return "ItemUnknown";
    case EconomyResult::ItemUnavailable:
        return "ItemUnavailable";
    case EconomyResult::PurchaseCostFailure:
        return "PurchaseCostFailure";
    default:
        return "Unknown";
    }
}

inline bool succeeded(EconomyResult result) {
    return result == EconomyResult::Success;
}

/**
 * Unrecoverable conditions. These escalate to the host application;
 * everything else is reported through EconomyResult.
 */
class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& what) : std::runtime_error("catalog: " + what) {}
};

class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& what) : std::runtime_error("snapshot: " + what) {}
};

} // namespace econ
