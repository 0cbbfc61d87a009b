#include "../include/economy/currency_ledger.hpp"
#include "../include/events/event_bus.hpp"
#include "../include/inflation/inflation_controller.hpp"
#include "../include/util/time_utils.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace econ;
using namespace econ::economy;
using namespace econ::inflation;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "Running " << #name << "... ";                                                                    \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

struct Economy {
    CurrencyRegistry registry;
    ExchangeRateTable rates;
    events::EventBus bus;
    util::SimulatedClock clock{config::time::NS_PER_DAY};
    std::unique_ptr<CurrencyLedger> ledger;
    std::unique_ptr<InflationController> controller;

    explicit Economy(InflationConfig config = no_drift()) {
        Currency coins;
        coins.id = "coins";
        coins.max_amount = 1'000'000;
        registry.register_currency(coins);
        Currency gems;
        gems.id = "gems";
        gems.is_hard_currency = true;
        gems.max_amount = 100'000;
        registry.register_currency(gems);

        rates.add(ExchangeRate{"coins", "gems", 0.01, 0.005, 0.02, true, 0});
        rates.add(ExchangeRate{"gems", "coins", 100.0, 50.0, 200.0, true, 0});

        ledger = std::make_unique<CurrencyLedger>(registry, rates, bus, clock);
        controller = std::make_unique<InflationController>(*ledger, rates, bus, clock, config);
    }

    static InflationConfig no_drift() {
        InflationConfig c;
        c.rate_drift = 0.0;
        c.seed = 11;
        return c;
    }

    // earned 1500, spent 500 over the last 10: rate +2.0
    void inflate(const PlayerId& player = "p1") {
        for (int i = 0; i < 5; ++i)
            ledger->earn(player, "coins", 300, "quest");
        for (int i = 0; i < 5; ++i)
            ledger->spend(player, "coins", 100, "shop");
    }

    // Last 10: earned 250, spent 1500: rate -0.833
    void deflate(const PlayerId& player = "p1") {
        ledger->earn(player, "coins", 2000, "seed");
        for (int i = 0; i < 5; ++i)
            ledger->earn(player, "coins", 50, "quest");
        for (int i = 0; i < 5; ++i)
            ledger->spend(player, "coins", 300, "shop");
    }
};

Transaction tx(Amount amount) {
    Transaction t;
    t.amount = amount;
    return t;
}

// ============================================
// Rate computation
// ============================================

TEST(test_compute_inflation_rate) {
    std::vector<Transaction> window = {tx(150), tx(-100)};
    ASSERT_NEAR(InflationController::compute_inflation_rate(window), 0.5, 1e-12);

    window = {tx(50), tx(-100)};
    ASSERT_NEAR(InflationController::compute_inflation_rate(window), -0.5, 1e-12);

    // Nothing spent
    window = {tx(500)};
    ASSERT_EQ(InflationController::compute_inflation_rate(window), 0.0);
    ASSERT_EQ(InflationController::compute_inflation_rate({}), 0.0);
}

TEST(test_classify_uses_threshold) {
    Economy econ;
    ASSERT_EQ(econ.controller->classify(0.05), Pressure::Neutral);
    ASSERT_EQ(econ.controller->classify(-0.10), Pressure::Neutral);
    ASSERT_EQ(econ.controller->classify(0.11), Pressure::Inflation);
    ASSERT_EQ(econ.controller->classify(-0.2), Pressure::Deflation);
}

// ============================================
// Cycles
// ============================================

TEST(test_inflation_raises_sink_lowers_source) {
    Economy econ;
    econ.inflate();

    auto report = econ.controller->run_cycle(1);
    ASSERT_EQ(report.currencies_checked, 1u); // gems has no history
    ASSERT_EQ(report.currencies_adjusted, 1u);

    auto m = econ.controller->multipliers("coins");
    ASSERT_NEAR(m.sink, 1.3, 1e-9);   // step capped at 0.30
    ASSERT_NEAR(m.source, 0.7, 1e-9);
    ASSERT_NEAR(econ.controller->inflation_rate("coins"), 2.0, 1e-9);

    auto untouched = econ.controller->multipliers("gems");
    ASSERT_EQ(untouched.sink, 1.0);
    ASSERT_EQ(untouched.source, 1.0);
}

TEST(test_deflation_lowers_sink_raises_source) {
    Economy econ;
    econ.deflate();
    econ.controller->run_cycle(1);

    auto m = econ.controller->multipliers("coins");
    ASSERT_NEAR(m.sink, 0.7, 1e-9);
    ASSERT_NEAR(m.source, 1.3, 1e-9);
}

TEST(test_neutral_leaves_multipliers) {
    Economy econ;
    for (int i = 0; i < 5; ++i)
        econ.ledger->earn("p1", "coins", 100, "quest");
    for (int i = 0; i < 5; ++i)
        econ.ledger->spend("p1", "coins", 100, "shop");

    auto report = econ.controller->run_cycle(1);
    ASSERT_EQ(report.currencies_checked, 1u);
    ASSERT_EQ(report.currencies_adjusted, 0u);
    ASSERT_EQ(econ.controller->multipliers("coins").sink, 1.0);
}

TEST(test_requires_min_transactions) {
    Economy econ;
    for (int i = 0; i < 9; ++i)
        econ.ledger->earn("p1", "coins", 1000, "quest");

    auto report = econ.controller->run_cycle(1);
    ASSERT_EQ(report.currencies_checked, 0u);
    ASSERT_EQ(econ.controller->multipliers("coins").sink, 1.0);
}

TEST(test_rerun_is_idempotent) {
    Economy econ;
    econ.inflate();

    econ.controller->run_cycle(1);
    auto first = econ.controller->multipliers("coins");
    econ.controller->run_cycle(1);
    auto second = econ.controller->multipliers("coins");

    ASSERT_EQ(first.sink, second.sink);
    ASSERT_EQ(first.source, second.source);
    ASSERT_EQ(econ.controller->last_cycle(), 1u);
}

TEST(test_multipliers_clamped_over_cycles) {
    Economy econ;
    econ.inflate();

    for (int i = 0; i < 6; ++i) {
        econ.controller->run_next_cycle();
    }
    ASSERT_EQ(econ.controller->last_cycle(), 6u);

    auto m = econ.controller->multipliers("coins");
    ASSERT_NEAR(m.sink, 2.0, 1e-12);
    ASSERT_NEAR(m.source, 0.5, 1e-12);
}

TEST(test_callback_and_event) {
    Economy econ;
    std::map<CurrencyId, Multipliers> seen;
    econ.controller->set_adjustment_callback(
        [&](const CurrencyId& currency, double sink, double source) { seen[currency] = Multipliers{sink, source}; });

    int adjusted_events = 0;
    econ.bus.subscribe([&](const events::EventEnvelope& e) {
        if (auto* m = std::get_if<events::MultipliersAdjusted>(&e.event)) {
            ASSERT_EQ(m->currency, "coins");
            ++adjusted_events;
        }
    });

    econ.inflate();
    econ.controller->run_cycle(1);
    econ.bus.dispatch();

    ASSERT_EQ(seen.size(), 1u);
    ASSERT_NEAR(seen["coins"].sink, 1.3, 1e-9);
    ASSERT_EQ(adjusted_events, 1);
}

// ============================================
// Exchange rate drift
// ============================================

TEST(test_drift_stays_in_band_and_reruns_identically) {
    InflationConfig config;
    config.rate_drift = 0.05;
    config.seed = 99;
    Economy econ(config);

    auto report = econ.controller->run_cycle(1);
    ASSERT_EQ(report.rates_drifted, 2u);

    double after_first = econ.rates.rate("gems", "coins");
    ASSERT_TRUE(after_first >= 95.0 - 1e-9 && after_first <= 105.0 + 1e-9);

    econ.controller->run_cycle(1);
    ASSERT_EQ(econ.rates.rate("gems", "coins"), after_first);

    for (int i = 0; i < 200; ++i) {
        econ.controller->run_next_cycle();
        for (const auto& r : econ.rates.all()) {
            ASSERT_TRUE(r.in_band());
        }
    }
}

TEST(test_inactive_rate_does_not_drift) {
    InflationConfig config;
    config.rate_drift = 0.05;
    config.seed = 5;
    Economy econ(config);
    econ.rates.set_active("coins", "gems", false);

    auto report = econ.controller->run_cycle(1);
    ASSERT_EQ(report.rates_drifted, 1u);
    ASSERT_EQ(econ.rates.rate("coins", "gems"), 0.01);
}

// ============================================
// Persistence
// ============================================

TEST(test_snapshot_reannounces_multipliers) {
    Economy source;
    source.inflate();
    source.controller->run_cycle(1);
    auto j = source.controller->to_json();

    Economy target;
    double restored_sink = 0.0;
    target.controller->set_adjustment_callback(
        [&](const CurrencyId&, double sink, double) { restored_sink = sink; });
    target.controller->from_json(j);

    ASSERT_NEAR(restored_sink, 1.3, 1e-9);
    ASSERT_EQ(target.controller->last_cycle(), 1u);
    ASSERT_NEAR(target.controller->multipliers("coins").source, 0.7, 1e-9);
}

// Rerunning the saved cycle after a restore steps from the pre-cycle state
TEST(test_restored_cycle_reruns_identically) {
    InflationConfig config;
    config.rate_drift = 0.05;
    config.seed = 99;

    Economy source(config);
    source.inflate();
    source.controller->run_cycle(1);
    double drifted = source.rates.rate("gems", "coins");
    auto j = source.controller->to_json();

    Economy target(config);
    target.inflate();
    for (const auto& r : source.rates.all()) {
        target.rates.set_rate(r.from, r.to, r.rate, r.last_updated);
    }
    target.controller->from_json(j);
    target.controller->run_cycle(1);

    ASSERT_NEAR(target.controller->multipliers("coins").sink, 1.3, 1e-9);
    ASSERT_NEAR(target.controller->multipliers("coins").source, 0.7, 1e-9);
    ASSERT_EQ(target.rates.rate("gems", "coins"), drifted);

    // The next cycle still compounds
    target.controller->run_cycle(2);
    ASSERT_NEAR(target.controller->multipliers("coins").sink, 1.6, 1e-9);
}

TEST(test_snapshot_rejects_out_of_band) {
    Economy econ;
    nlohmann::json coins = {{"sink", 5.0}, {"source", 1.0}, {"inflation_rate", 0.0}, {"cycle", 3}};
    nlohmann::json j = {{"last_cycle", 3}, {"currencies", {{"coins", coins}}}};
    bool thrown = false;
    try {
        econ.controller->from_json(j);
    } catch (const SnapshotError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_EQ(econ.controller->last_cycle(), 0u);
}

int main() {
    std::cout << "=== Inflation Controller Tests ===\n";

    RUN_TEST(test_compute_inflation_rate);
    RUN_TEST(test_classify_uses_threshold);
    RUN_TEST(test_inflation_raises_sink_lowers_source);
    RUN_TEST(test_deflation_lowers_sink_raises_source);
    RUN_TEST(test_neutral_leaves_multipliers);
    RUN_TEST(test_requires_min_transactions);
    RUN_TEST(test_rerun_is_idempotent);
    RUN_TEST(test_multipliers_clamped_over_cycles);
    RUN_TEST(test_callback_and_event);
    RUN_TEST(test_drift_stays_in_band_and_reruns_identically);
    RUN_TEST(test_inactive_rate_does_not_drift);
    RUN_TEST(test_snapshot_reannounces_multipliers);
    RUN_TEST(test_restored_cycle_reruns_identically);
    RUN_TEST(test_snapshot_rejects_out_of_band);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
