#pragma once

/**
 * ExchangeRateTable - directional currency conversion rates
 *
 * rate(A->B) is independent of rate(B->A). Every write path re-clamps to
 * [min_rate, max_rate], so a sampled rate is always inside its band.
 *
 * Readers (ledger exchanges) take a shared lock, writers (inflation cycle)
 * an exclusive one.
 */

#include "../types.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace econ {
namespace economy {

struct ExchangeRate {
    CurrencyId from;
    CurrencyId to;
    double rate = 1.0;
    double min_rate = 0.0;
    double max_rate = 0.0;
    bool is_active = true;
    Timestamp last_updated = 0;

    double clamp(double value) const { return std::clamp(value, min_rate, max_rate); }
    bool in_band() const { return rate >= min_rate && rate <= max_rate; }
};

class ExchangeRateTable {
public:
    using Key = std::pair<CurrencyId, CurrencyId>;

    // Throws CatalogError on an empty or inverted band
    void add(ExchangeRate rate) {
        if (rate.min_rate <= 0.0 || rate.max_rate < rate.min_rate) {
            throw CatalogError("exchange rate " + rate.from + "->" + rate.to + " has invalid band");
        }
        rate.rate = rate.clamp(rate.rate);
        std::unique_lock lock(mutex_);
        rates_[Key{rate.from, rate.to}] = std::move(rate);
    }

    std::optional<ExchangeRate> find(const CurrencyId& from, const CurrencyId& to) const {
        std::shared_lock lock(mutex_);
        auto it = rates_.find(Key{from, to});
        if (it == rates_.end())
            return std::nullopt;
        return it->second;
    }

    // 0 when absent
    double rate(const CurrencyId& from, const CurrencyId& to) const {
        auto r = find(from, to);
        return r ? r->rate : 0.0;
    }

    // Returns false when the pair does not exist
    bool set_rate(const CurrencyId& from, const CurrencyId& to, double value, Timestamp now) {
        std::unique_lock lock(mutex_);
        auto it = rates_.find(Key{from, to});
        if (it == rates_.end())
            return false;
        it->second.rate = it->second.clamp(value);
        it->second.last_updated = now;
        return true;
    }

    bool set_active(const CurrencyId& from, const CurrencyId& to, bool active) {
        std::unique_lock lock(mutex_);
        auto it = rates_.find(Key{from, to});
        if (it == rates_.end())
            return false;
        it->second.is_active = active;
        return true;
    }

    /**
     * Apply fn(rate) -> new value to every active rate under one lock.
     * Results are clamped before being stored.
     */
    template <typename Fn>
    void update_all(Fn&& fn, Timestamp now) {
        std::unique_lock lock(mutex_);
        for (auto& [key, r] : rates_) {
            if (!r.is_active)
                continue;
            r.rate = r.clamp(fn(r));
            r.last_updated = now;
        }
    }

    std::vector<ExchangeRate> all() const {
        std::shared_lock lock(mutex_);
        std::vector<ExchangeRate> out;
        out.reserve(rates_.size());
        for (const auto& [key, r] : rates_) {
            out.push_back(r);
        }
        return out;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return rates_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<Key, ExchangeRate> rates_;
};

} // namespace economy
} // namespace econ
