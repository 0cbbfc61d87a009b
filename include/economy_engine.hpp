#pragma once

/**
 * EconomyEngine - composition root for the economy core
 *
 * Builds every component from a Catalog and wires them together:
 *   inflation adjustment callback -> PricingEngine::set_multipliers
 *   event bus                     -> PlayerProfileStore
 *   scheduler tasks               -> bus dispatch, inflation cycle,
 *                                    profile sweep, discount expiry
 *
 * There are no globals; tests build as many engines as they like, each
 * with its own SimulatedClock.
 *
 * Usage:
 *   util::SimulatedClock clock;
 *   EconomyEngine engine(config::CatalogLoader::load("catalog.json"), clock);
 *   engine.ledger().earn("p1", "coins", 500, "level_complete");
 *   engine.pricing().purchase("starter_pack", "p1");
 *   clock.advance_seconds(60);
 *   engine.tick();
 */

#include "config/catalog.hpp"
#include "economy/currency.hpp"
#include "economy/currency_ledger.hpp"
#include "economy/exchange_rates.hpp"
#include "events/event_bus.hpp"
#include "inflation/inflation_controller.hpp"
#include "logging/async_logger.hpp"
#include "personalization/personalization_client.hpp"
#include "personalization/personalization_service.hpp"
#include "pricing/inventory.hpp"
#include "pricing/pricing_engine.hpp"
#include "profile/profile_store.hpp"
#include "scheduler/periodic_scheduler.hpp"
#include "types.hpp"
#include "util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace econ {

class EconomyEngine {
public:
    // Throws CatalogError when the catalog cannot be installed
    EconomyEngine(const config::Catalog& catalog, const util::Clock& clock, logging::AsyncLogger* logger = nullptr);
    ~EconomyEngine();

    EconomyEngine(const EconomyEngine&) = delete;
    EconomyEngine& operator=(const EconomyEngine&) = delete;

    // ========================================
    // Components
    // ========================================
    const economy::CurrencyRegistry& registry() const { return registry_; }
    economy::ExchangeRateTable& rates() { return rates_; }
    const economy::ExchangeRateTable& rates() const { return rates_; }
    events::EventBus& bus() { return bus_; }
    economy::CurrencyLedger& ledger() { return ledger_; }
    const economy::CurrencyLedger& ledger() const { return ledger_; }
    pricing::ItemInventory& inventory() { return inventory_; }
    const pricing::ItemInventory& inventory() const { return inventory_; }
    pricing::PricingEngine& pricing() { return pricing_; }
    const pricing::PricingEngine& pricing() const { return pricing_; }
    profile::PlayerProfileStore& profiles() { return profiles_; }
    const profile::PlayerProfileStore& profiles() const { return profiles_; }
    inflation::InflationController& inflation() { return inflation_; }
    const inflation::InflationController& inflation() const { return inflation_; }
    scheduler::PeriodicScheduler& scheduler() { return scheduler_; }
    const util::Clock& clock() const { return clock_; }
    const config::EconomyConfig& config() const { return config_; }

    // ========================================
    // Periodic work
    // ========================================
    size_t tick(Timestamp now) { return scheduler_.tick(now); }
    size_t tick() { return scheduler_.tick(); }

    // Deliver queued events now instead of waiting for the dispatch task
    size_t flush_events() { return bus_.dispatch(); }

    // Real-time driver
    void start() { scheduler_.start(); }
    void stop() { scheduler_.stop(); }

    // ========================================
    // Personalization
    // ========================================
    void set_personalization_client(std::unique_ptr<personalization::PersonalizationClient> client);
    bool has_personalization() const { return personalization_ != nullptr; }

    // Default decision (nothing applied) when no client is configured
    personalization::OfferDecision request_offer(const PlayerId& player, const ItemId& item,
                                                 const std::string& action);

    // ========================================
    // Reporting & persistence
    // ========================================
    std::string report() const;

    // Call with the real-time driver stopped
    nlohmann::json to_json();
    void from_json(const nlohmann::json& state); // throws SnapshotError

    void save(const std::string& path);
    void load(const std::string& path);

private:
    config::EconomyConfig config_;
    const util::Clock& clock_;
    logging::AsyncLogger* logger_;

    economy::CurrencyRegistry registry_;
    economy::ExchangeRateTable rates_;
    events::EventBus bus_;
    economy::CurrencyLedger ledger_;
    pricing::ItemInventory inventory_;
    pricing::PricingEngine pricing_;
    profile::PlayerProfileStore profiles_;
    inflation::InflationController inflation_;
    scheduler::PeriodicScheduler scheduler_;

    std::unique_ptr<personalization::PersonalizationClient> personalization_client_;
    std::unique_ptr<personalization::PersonalizationService> personalization_;

    static economy::CurrencyRegistry build_registry(const config::Catalog& catalog);
    void install_catalog(const config::Catalog& catalog);
    void wire();
    nlohmann::json rates_to_json() const;
    void rates_from_json(const nlohmann::json& j);
    void apply_sections(const nlohmann::json& state);
};

} // namespace econ
