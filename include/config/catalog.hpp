#pragma once

/**
 * Catalog - startup definition of the economy
 *
 * JSON layout:
 *   {
 *     "currencies":     [ {id, name, symbol, hard, tradeable, min, max, decimals}, ... ],
 *     "exchange_rates": [ {from, to, rate, min_rate, max_rate, active}, ... ],
 *     "categories":     [ {id, name, display_order, active}, ... ],
 *     "items":          [ {id, name, kind, category, costs[], rewards[], eligibility, ...}, ... ],
 *     "stack_caps":     { item_or_booster_id: max_held },
 *     "economy":        { tunables, all optional }
 *   }
 *
 * Every referenced currency and category must be defined in the same
 * document; anything else is a CatalogError.
 */

#include "../economy/currency.hpp"
#include "../economy/currency_ledger.hpp"
#include "../economy/exchange_rates.hpp"
#include "../inflation/inflation_controller.hpp"
#include "../personalization/personalization_service.hpp"
#include "../pricing/pricing_engine.hpp"
#include "../pricing/shop_item.hpp"
#include "defaults.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace econ {
namespace config {

struct SchedulerConfig {
    uint64_t dispatch_interval_ns = scheduler::DISPATCH_INTERVAL_NS;
    uint64_t inflation_interval_ns = inflation::CYCLE_INTERVAL_NS;
    uint64_t profile_sweep_interval_ns = profile::SWEEP_INTERVAL_NS;
    uint64_t discount_sweep_interval_ns = pricing::DISCOUNT_SWEEP_INTERVAL_NS;
};

// "economy" section of the catalog
struct EconomyConfig {
    economy::LedgerConfig ledger;
    econ::inflation::InflationConfig inflation;
    econ::pricing::PricingConfig pricing;
    econ::personalization::PersonalizationConfig personalization;
    SchedulerConfig scheduler;
    std::string personalization_endpoint; // empty = no remote advice
};

struct Catalog {
    std::vector<economy::Currency> currencies;
    std::vector<economy::ExchangeRate> exchange_rates;
    std::vector<econ::pricing::ShopCategory> categories;
    std::vector<econ::pricing::ShopItem> items;
    std::map<std::string, int64_t> stack_caps; // inventory id -> max held
    EconomyConfig economy;
};

class CatalogLoader {
public:
    // All three throw CatalogError
    static Catalog load(const std::string& path);
    static Catalog parse(const std::string& text);
    static Catalog from_json(const nlohmann::json& j);

    static nlohmann::json to_json(const Catalog& catalog);

    // Cross-reference checks; throws CatalogError on the first problem
    static void validate(const Catalog& catalog);

private:
    static EconomyConfig economy_from_json(const nlohmann::json& j);
};

} // namespace config
} // namespace econ
