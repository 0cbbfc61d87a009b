#include "../../include/config/catalog.hpp"
#include "../../include/persistence/json_codec.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace econ {
namespace config {

namespace {

uint64_t seconds_to_ns(double seconds) {
    return static_cast<uint64_t>(seconds * static_cast<double>(time::NS_PER_SECOND));
}

double ns_to_seconds(uint64_t ns) {
    return static_cast<double>(ns) / static_cast<double>(time::NS_PER_SECOND);
}

} // namespace

Catalog CatalogLoader::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw CatalogError("cannot open catalog '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

Catalog CatalogLoader::parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw CatalogError(std::string("catalog is not valid JSON: ") + e.what());
    }
    return from_json(j);
}

Catalog CatalogLoader::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw CatalogError("catalog root must be an object");
    }

    Catalog catalog;
    try {
        catalog.currencies = j.at("currencies").get<std::vector<economy::Currency>>();
        if (j.contains("exchange_rates")) {
            catalog.exchange_rates = j.at("exchange_rates").get<std::vector<economy::ExchangeRate>>();
        }
        if (j.contains("categories")) {
            catalog.categories = j.at("categories").get<std::vector<econ::pricing::ShopCategory>>();
        }
        if (j.contains("items")) {
            for (const auto& item : j.at("items")) {
                econ::pricing::ShopItem parsed = item.get<econ::pricing::ShopItem>();
                // Catalog prices are always undiscounted list prices
                for (auto& cost : parsed.costs) {
                    cost.original_amount = cost.amount;
                }
                parsed.discount.reset();
                parsed.current_purchases = 0;
                catalog.items.push_back(std::move(parsed));
            }
        }
        if (j.contains("stack_caps")) {
            catalog.stack_caps = j.at("stack_caps").get<std::map<std::string, int64_t>>();
        }
        if (j.contains("economy")) {
            catalog.economy = economy_from_json(j.at("economy"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw CatalogError(std::string("malformed catalog: ") + e.what());
    }

    validate(catalog);
    return catalog;
}

EconomyConfig CatalogLoader::economy_from_json(const nlohmann::json& j) {
    EconomyConfig c;

    c.ledger.player_ring_capacity = j.value("player_history", c.ledger.player_ring_capacity);
    c.ledger.market_ring_capacity = j.value("market_history", c.ledger.market_ring_capacity);

    if (j.contains("inflation")) {
        const auto& inf = j.at("inflation");
        auto& cfg = c.inflation;
        cfg.min_transactions = inf.value("min_transactions", cfg.min_transactions);
        cfg.window = inf.value("window", cfg.window);
        cfg.threshold = inf.value("threshold", cfg.threshold);
        cfg.gain = inf.value("gain", cfg.gain);
        cfg.max_step = inf.value("max_step", cfg.max_step);
        cfg.multiplier_min = inf.value("multiplier_min", cfg.multiplier_min);
        cfg.multiplier_max = inf.value("multiplier_max", cfg.multiplier_max);
        cfg.rate_drift = inf.value("rate_drift", cfg.rate_drift);
        cfg.seed = inf.value("seed", cfg.seed);
        if (inf.contains("interval_s")) {
            c.scheduler.inflation_interval_ns = seconds_to_ns(inf.at("interval_s").get<double>());
        }
    }

    if (j.contains("pricing")) {
        const auto& p = j.at("pricing");
        c.pricing.max_discount_pct = p.value("max_discount_pct", c.pricing.max_discount_pct);
        c.pricing.default_player_level = p.value("default_player_level", c.pricing.default_player_level);
        if (p.contains("discount_sweep_s")) {
            c.scheduler.discount_sweep_interval_ns = seconds_to_ns(p.at("discount_sweep_s").get<double>());
        }
    }

    if (j.contains("profile")) {
        const auto& p = j.at("profile");
        if (p.contains("sweep_s")) {
            c.scheduler.profile_sweep_interval_ns = seconds_to_ns(p.at("sweep_s").get<double>());
        }
    }

    if (j.contains("personalization")) {
        const auto& p = j.at("personalization");
        c.personalization.max_personal_discount_pct =
            p.value("max_discount_pct", c.personalization.max_personal_discount_pct);
        c.personalization.offer_duration_hours = p.value("offer_hours", c.personalization.offer_duration_hours);
        c.personalization_endpoint = p.value("endpoint", c.personalization_endpoint);
    }

    if (j.contains("dispatch_s")) {
        c.scheduler.dispatch_interval_ns = seconds_to_ns(j.at("dispatch_s").get<double>());
    }

    // Range checks
    if (c.ledger.player_ring_capacity == 0 || c.ledger.market_ring_capacity == 0) {
        throw CatalogError("history capacities must be positive");
    }
    const auto& inf = c.inflation;
    if (inf.window == 0 || inf.threshold < 0.0 || inf.gain <= 0.0 || inf.max_step <= 0.0 || inf.max_step >= 1.0) {
        throw CatalogError("invalid inflation tunables");
    }
    if (inf.multiplier_min <= 0.0 || inf.multiplier_max < inf.multiplier_min) {
        throw CatalogError("invalid multiplier band");
    }
    if (inf.rate_drift < 0.0 || inf.rate_drift >= 1.0) {
        throw CatalogError("rate drift must be in [0, 1)");
    }
    if (c.pricing.max_discount_pct <= 0.0 || c.pricing.max_discount_pct >= 100.0) {
        throw CatalogError("max discount must be in (0, 100)");
    }
    if (c.personalization.max_personal_discount_pct < 0.0 ||
        c.personalization.max_personal_discount_pct > c.pricing.max_discount_pct) {
        throw CatalogError("personal discount limit exceeds the shop discount limit");
    }
    if (c.personalization.offer_duration_hours <= 0) {
        throw CatalogError("offer duration must be positive");
    }
    const auto& s = c.scheduler;
    if (s.dispatch_interval_ns == 0 || s.inflation_interval_ns == 0 || s.profile_sweep_interval_ns == 0 ||
        s.discount_sweep_interval_ns == 0) {
        throw CatalogError("scheduler intervals must be positive");
    }
    return c;
}

void CatalogLoader::validate(const Catalog& catalog) {
    if (catalog.currencies.empty()) {
        throw CatalogError("catalog defines no currencies");
    }

    std::set<CurrencyId> currencies;
    for (const auto& c : catalog.currencies) {
        if (c.id.empty()) {
            throw CatalogError("currency with empty id");
        }
        if (c.min_amount < 0 || c.min_amount > c.max_amount) {
            throw CatalogError("currency '" + c.id + "' has invalid bounds");
        }
        if (!currencies.insert(c.id).second) {
            throw CatalogError("duplicate currency '" + c.id + "'");
        }
    }

    std::set<std::pair<CurrencyId, CurrencyId>> pairs;
    for (const auto& r : catalog.exchange_rates) {
        if (!currencies.count(r.from) || !currencies.count(r.to)) {
            throw CatalogError("exchange rate " + r.from + "->" + r.to + " references an unknown currency");
        }
        if (r.from == r.to) {
            throw CatalogError("exchange rate " + r.from + "->" + r.to + " is a self-conversion");
        }
        if (r.min_rate <= 0.0 || r.max_rate < r.min_rate || r.rate < r.min_rate || r.rate > r.max_rate) {
            throw CatalogError("exchange rate " + r.from + "->" + r.to + " is outside its band");
        }
        if (!pairs.insert({r.from, r.to}).second) {
            throw CatalogError("duplicate exchange rate " + r.from + "->" + r.to);
        }
    }

    std::set<std::string> categories;
    for (const auto& c : catalog.categories) {
        if (!categories.insert(c.id).second) {
            throw CatalogError("duplicate category '" + c.id + "'");
        }
    }

    std::set<ItemId> items;
    for (const auto& item : catalog.items) {
        if (!items.insert(item.id).second) {
            throw CatalogError("duplicate item '" + item.id + "'");
        }
        if (!item.category.empty() && !categories.count(item.category)) {
            throw CatalogError("item '" + item.id + "' references unknown category '" + item.category + "'");
        }
        if (item.costs.empty()) {
            throw CatalogError("item '" + item.id + "' has no cost");
        }
        for (const auto& cost : item.costs) {
            if (!currencies.count(cost.currency)) {
                throw CatalogError("item '" + item.id + "' costs unknown currency '" + cost.currency + "'");
            }
            if (cost.amount <= 0) {
                throw CatalogError("item '" + item.id + "' has a non-positive cost");
            }
        }
        if (item.rewards.empty()) {
            throw CatalogError("item '" + item.id + "' grants nothing");
        }
        for (const auto& reward : item.rewards) {
            if (const auto* cr = std::get_if<econ::pricing::CurrencyReward>(&reward)) {
                if (!currencies.count(cr->currency)) {
                    throw CatalogError("item '" + item.id + "' rewards unknown currency '" + cr->currency + "'");
                }
            }
        }
    }

    for (const auto& [id, cap] : catalog.stack_caps) {
        if (cap <= 0) {
            throw CatalogError("stack cap for '" + id + "' must be positive");
        }
    }
}

nlohmann::json CatalogLoader::to_json(const Catalog& catalog) {
    const auto& e = catalog.economy;
    nlohmann::json economy = {
        {"player_history", e.ledger.player_ring_capacity},
        {"market_history", e.ledger.market_ring_capacity},
        {"dispatch_s", ns_to_seconds(e.scheduler.dispatch_interval_ns)},
        {"inflation",
         {{"interval_s", ns_to_seconds(e.scheduler.inflation_interval_ns)},
          {"min_transactions", e.inflation.min_transactions},
          {"window", e.inflation.window},
          {"threshold", e.inflation.threshold},
          {"gain", e.inflation.gain},
          {"max_step", e.inflation.max_step},
          {"multiplier_min", e.inflation.multiplier_min},
          {"multiplier_max", e.inflation.multiplier_max},
          {"rate_drift", e.inflation.rate_drift},
          {"seed", e.inflation.seed}}},
        {"pricing",
         {{"max_discount_pct", e.pricing.max_discount_pct},
          {"default_player_level", e.pricing.default_player_level},
          {"discount_sweep_s", ns_to_seconds(e.scheduler.discount_sweep_interval_ns)}}},
        {"profile", {{"sweep_s", ns_to_seconds(e.scheduler.profile_sweep_interval_ns)}}},
        {"personalization",
         {{"max_discount_pct", e.personalization.max_personal_discount_pct},
          {"offer_hours", e.personalization.offer_duration_hours},
          {"endpoint", e.personalization_endpoint}}}};

    return {{"currencies", catalog.currencies},
            {"exchange_rates", catalog.exchange_rates},
            {"categories", catalog.categories},
            {"items", catalog.items},
            {"stack_caps", catalog.stack_caps},
            {"economy", economy}};
}

} // namespace config
} // namespace econ
