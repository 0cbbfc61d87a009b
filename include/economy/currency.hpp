#pragma once

/**
 * Currency Registry - static currency definitions
 *
 * Loaded once from the catalog at startup. Definitions are immutable after
 * registration; the registry hands out const references only.
 */

#include "../types.hpp"

#include <map>
#include <string>
#include <vector>

namespace econ {
namespace economy {

struct Currency {
    CurrencyId id;
    std::string name;
    std::string symbol;
    std::string description;
    bool is_hard_currency = false;
    bool is_tradeable = true;
    Amount min_amount = 0;
    Amount max_amount = AMOUNT_MAX;
    int32_t decimal_places = 0;

    Amount clamp(Amount value) const {
        if (value < min_amount)
            return min_amount;
        if (value > max_amount)
            return max_amount;
        return value;
    }

    bool contains(Amount value) const { return value >= min_amount && value <= max_amount; }
};

class CurrencyRegistry {
public:
    CurrencyRegistry() = default;

    // Throws CatalogError on duplicate id or inconsistent bounds
    void register_currency(const Currency& currency) {
        if (currency.id.empty()) {
            throw CatalogError("currency with empty id");
        }
        if (currency.min_amount < 0) {
            throw CatalogError("currency '" + currency.id + "' has negative minimum");
        }
        if (currency.min_amount > currency.max_amount) {
            throw CatalogError("currency '" + currency.id + "' has min > max");
        }
        if (currencies_.count(currency.id) != 0) {
            throw CatalogError("duplicate currency '" + currency.id + "'");
        }
        currencies_.emplace(currency.id, currency);
        order_.push_back(currency.id);
    }

    const Currency* find(const CurrencyId& id) const {
        auto it = currencies_.find(id);
        return it != currencies_.end() ? &it->second : nullptr;
    }

    bool contains(const CurrencyId& id) const { return currencies_.count(id) != 0; }

    // Throws CatalogError; used when wiring catalog references at startup
    const Currency& require(const CurrencyId& id) const {
        const Currency* c = find(id);
        if (!c) {
            throw CatalogError("unknown currency '" + id + "'");
        }
        return *c;
    }

    // Registration order
    const std::vector<CurrencyId>& ids() const { return order_; }

    std::vector<const Currency*> all() const {
        std::vector<const Currency*> out;
        out.reserve(order_.size());
        for (const auto& id : order_) {
            out.push_back(&currencies_.at(id));
        }
        return out;
    }

    std::vector<const Currency*> tradeable() const {
        std::vector<const Currency*> out;
        for (const auto& id : order_) {
            const Currency& c = currencies_.at(id);
            if (c.is_tradeable)
                out.push_back(&c);
        }
        return out;
    }

    size_t size() const { return currencies_.size(); }
    bool empty() const { return currencies_.empty(); }

private:
    std::map<CurrencyId, Currency> currencies_;
    std::vector<CurrencyId> order_;
};

} // namespace economy
} // namespace econ
