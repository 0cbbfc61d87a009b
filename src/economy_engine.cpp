#include "../include/economy_engine.hpp"
#include "../include/persistence/json_codec.hpp"
#include "../include/persistence/snapshot_store.hpp"
#include "../include/personalization/http_personalization_client.hpp"

#include <cstdio>
#include <sstream>

namespace econ {

namespace LogCategory = logging::LogCategory;

EconomyEngine::EconomyEngine(const config::Catalog& catalog, const util::Clock& clock, logging::AsyncLogger* logger)
    : config_(catalog.economy), clock_(clock), logger_(logger), registry_(build_registry(catalog)), bus_(logger),
      ledger_(registry_, rates_, bus_, clock_, config_.ledger, logger),
      pricing_(ledger_, inventory_, bus_, clock_, config_.pricing, logger), profiles_(registry_, clock_, logger),
      inflation_(ledger_, rates_, bus_, clock_, config_.inflation, logger), scheduler_(clock_, logger) {
    install_catalog(catalog);
    wire();

    if (!config_.personalization_endpoint.empty()) {
        personalization::HttpClientConfig http;
        http.endpoint = config_.personalization_endpoint;
        set_personalization_client(std::make_unique<personalization::HttpPersonalizationClient>(http, logger_));
    }

    ECON_LOGF_INFO(logger_, LogCategory::System, "economy ready: %zu currencies, %zu rates, %zu items",
                   registry_.size(), rates_.size(), pricing_.item_count());
}

EconomyEngine::~EconomyEngine() { scheduler_.stop(); }

economy::CurrencyRegistry EconomyEngine::build_registry(const config::Catalog& catalog) {
    economy::CurrencyRegistry registry;
    for (const auto& c : catalog.currencies) {
        registry.register_currency(c);
    }
    return registry;
}

void EconomyEngine::install_catalog(const config::Catalog& catalog) {
    for (const auto& r : catalog.exchange_rates) {
        registry_.require(r.from);
        registry_.require(r.to);
        rates_.add(r);
    }
    for (const auto& [id, cap] : catalog.stack_caps) {
        inventory_.set_stack_cap(id, cap);
    }
    for (const auto& category : catalog.categories) {
        pricing_.add_category(category);
    }
    for (const auto& item : catalog.items) {
        pricing_.add_item(item);
    }
}

void EconomyEngine::wire() {
    inflation_.set_adjustment_callback([this](const CurrencyId& currency, double sink, double source) {
        pricing_.set_multipliers(currency, sink, source);
    });

    profiles_.attach(bus_);

    const auto& s = config_.scheduler;
    // Dispatch first so a tick's sweeps see the events queued before it
    scheduler_.add_task("event_dispatch", s.dispatch_interval_ns, [this](Timestamp) { bus_.dispatch(); });
    scheduler_.add_task("inflation_cycle", s.inflation_interval_ns, [this](Timestamp) {
        inflation_.run_next_cycle();
    });
    scheduler_.add_task("profile_sweep", s.profile_sweep_interval_ns, [this](Timestamp now) {
        profiles_.sweep(now);
    });
    scheduler_.add_task("discount_expiry", s.discount_sweep_interval_ns, [this](Timestamp now) {
        pricing_.expire_discounts(now);
    });
}

// ========================================
// Personalization
// ========================================

void EconomyEngine::set_personalization_client(std::unique_ptr<personalization::PersonalizationClient> client) {
    personalization_.reset();
    personalization_client_ = std::move(client);
    if (personalization_client_) {
        personalization_ = std::make_unique<personalization::PersonalizationService>(
            *personalization_client_, profiles_, pricing_, config_.personalization, logger_);
    }
}

personalization::OfferDecision EconomyEngine::request_offer(const PlayerId& player, const ItemId& item,
                                                            const std::string& action) {
    if (!personalization_) {
        personalization::OfferDecision none;
        if (!pricing_.item(item))
            none.result = EconomyResult::ItemUnknown;
        return none;
    }
    return personalization_->request_offer(player, item, action);
}

// ========================================
// Reporting
// ========================================

std::string EconomyEngine::report() const {
    std::ostringstream out;
    char line[256];

    out << "=== CURRENCIES ===\n";
    for (const auto* c : registry_.all()) {
        auto stats = ledger_.currency_stats(c->id);
        auto m = inflation_.multipliers(c->id);
        std::snprintf(line, sizeof(line),
                      "%-10s earned=%lld spent=%lld txns=%llu avg_balance=%.1f "
                      "inflation=%+.3f sink=%.3f source=%.3f\n",
                      c->id.c_str(), static_cast<long long>(stats.total_earned),
                      static_cast<long long>(stats.total_spent),
                      static_cast<unsigned long long>(stats.transaction_count), stats.average_balance,
                      inflation_.inflation_rate(c->id), m.sink, m.source);
        out << line;
    }

    out << "\n=== EXCHANGE RATES ===\n";
    for (const auto& r : rates_.all()) {
        std::snprintf(line, sizeof(line), "%-10s -> %-10s %10.4f [%.4f, %.4f]%s\n", r.from.c_str(), r.to.c_str(),
                      r.rate, r.min_rate, r.max_rate, r.is_active ? "" : " (inactive)");
        out << line;
    }

    out << "\n" << profiles_.report();
    return out.str();
}

// ========================================
// Persistence
// ========================================

nlohmann::json EconomyEngine::rates_to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : rates_.all()) {
        out.push_back(r);
    }
    return out;
}

void EconomyEngine::rates_from_json(const nlohmann::json& j) {
    std::vector<economy::ExchangeRate> saved;
    try {
        saved = j.get<std::vector<economy::ExchangeRate>>();
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("rates: ") + e.what());
    }
    for (const auto& r : saved) {
        if (!rates_.find(r.from, r.to)) {
            throw SnapshotError("snapshot rate " + r.from + "->" + r.to + " is not in the catalog");
        }
    }
    for (const auto& r : saved) {
        rates_.set_rate(r.from, r.to, r.rate, r.last_updated);
        rates_.set_active(r.from, r.to, r.is_active);
    }
}

void EconomyEngine::apply_sections(const nlohmann::json& state) {
    ledger_.from_json(state.at("ledger"));
    inventory_.from_json(state.at("inventory"));
    pricing_.from_json(state.at("pricing"));
    profiles_.from_json(state.at("profiles"));
    // Re-announces multipliers to the pricing engine
    inflation_.from_json(state.at("inflation"));
    rates_from_json(state.at("rates"));
}

nlohmann::json EconomyEngine::to_json() {
    // Queued events belong to state that is already in the ledger
    bus_.dispatch();
    return {{"clock", clock_.now()},
            {"ledger", ledger_.to_json()},
            {"inventory", inventory_.to_json()},
            {"pricing", pricing_.to_json()},
            {"profiles", profiles_.to_json()},
            {"inflation", inflation_.to_json()},
            {"rates", rates_to_json()}};
}

void EconomyEngine::from_json(const nlohmann::json& state) {
    static const char* sections[] = {"ledger", "inventory", "pricing", "profiles", "inflation", "rates"};
    for (const char* section : sections) {
        if (!state.contains(section)) {
            throw SnapshotError(std::string("snapshot is missing '") + section + "'");
        }
    }

    // A section that fails validation rolls every section back to the pre-load state
    nlohmann::json previous = {{"ledger", ledger_.to_json()},
                               {"inventory", inventory_.to_json()},
                               {"pricing", pricing_.to_json()},
                               {"profiles", profiles_.to_json()},
                               {"inflation", inflation_.to_json()},
                               {"rates", rates_to_json()}};
    try {
        apply_sections(state);
    } catch (const std::exception& e) {
        ECON_LOGF_ERROR(logger_, LogCategory::Persistence, "snapshot rejected, previous state kept: %s", e.what());
        apply_sections(previous);
        throw;
    }

    ECON_LOGF_INFO(logger_, LogCategory::Persistence, "restored %zu players, %zu profiles", ledger_.player_count(),
                   profiles_.size());
}

void EconomyEngine::save(const std::string& path) {
    persistence::SnapshotStore store(path, logger_);
    store.save(to_json(), clock_.now());
}

void EconomyEngine::load(const std::string& path) {
    persistence::SnapshotStore store(path, logger_);
    from_json(store.load());
}

} // namespace econ
