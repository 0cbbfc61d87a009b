#include "../include/economy_engine.hpp"
#include "../include/persistence/snapshot_store.hpp"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace econ;

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

const char* CATALOG = R"({
  "currencies": [
    {"id": "coins", "max": 999999},
    {"id": "gems", "hard": true, "max": 99999}
  ],
  "exchange_rates": [
    {"from": "gems", "to": "coins", "rate": 100, "min_rate": 50, "max_rate": 200}
  ],
  "categories": [
    {"id": "boosters", "name": "Boosters", "display_order": 0}
  ],
  "items": [
    {"id": "xp_booster", "kind": "booster", "category": "boosters",
     "costs": [{"currency": "gems", "amount": 20}],
     "rewards": [{"type": "booster", "booster": "xp", "quantity": 1, "duration_s": 3600}]},
    {"id": "coin_hat", "kind": "decoration", "category": "boosters",
     "costs": [{"currency": "coins", "amount": 100}],
     "rewards": [{"type": "item", "item": "coin_hat", "quantity": 1}]}
  ],
  "economy": {
    "dispatch_s": 1,
    "inflation": {"interval_s": 60, "min_transactions": 4, "window": 10, "threshold": 0.1,
                  "gain": 0.5, "max_step": 0.3, "rate_drift": 0.0, "seed": 3},
    "pricing": {"discount_sweep_s": 60},
    "profile": {"sweep_s": 300}
  }
})";

struct Harness {
    util::SimulatedClock clock{config::time::NS_PER_DAY};
    std::unique_ptr<EconomyEngine> engine;

    Harness() { engine = std::make_unique<EconomyEngine>(config::CatalogLoader::parse(CATALOG), clock); }

    void advance(uint64_t seconds) {
        clock.advance_seconds(seconds);
        engine->tick();
    }
};

using personalization::PersonalizationAdvice;
using personalization::PersonalizationContext;

class FixedAdvice : public personalization::PersonalizationClient {
public:
    std::optional<PersonalizationAdvice> request(const PersonalizationContext&) override {
        PersonalizationAdvice a;
        a.price_factor = 0.75;
        return a;
    }
};

TEST(test_builds_from_catalog) {
    Harness h;
    ASSERT_EQ(h.engine->registry().size(), 2u);
    ASSERT_EQ(h.engine->pricing().item_count(), 2u);
    ASSERT_EQ(h.engine->rates().size(), 1u);
    ASSERT_EQ(h.engine->scheduler().task_count(), 4u);
    ASSERT_FALSE(h.engine->has_personalization());
}

// Ledger and shop events reach profiles on the next dispatch tick
TEST(test_events_reach_profiles_on_tick) {
    Harness h;
    auto& e = *h.engine;
    ASSERT_EQ(e.ledger().earn("p1", "gems", 50, "iap"), EconomyResult::Success);
    ASSERT_EQ(e.pricing().purchase("xp_booster", "p1"), EconomyResult::Success);
    ASSERT_FALSE(e.profiles().profile("p1").has_value());

    h.advance(1);
    auto p = e.profiles().profile("p1");
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->total_spent, 20);
    ASSERT_EQ(p->purchase_count, 1u);
    ASSERT_EQ(p->segment, profile::Segment::Regular);
    ASSERT_EQ(e.inventory().booster_count("p1", "xp"), 1);
    ASSERT_EQ(e.bus().pending(), 0u);
}

// Inflation cycle output lands in the shop through the adjustment callback
TEST(test_inflation_cycle_reprices_shop) {
    Harness h;
    auto& e = *h.engine;
    for (int i = 0; i < 5; ++i)
        e.ledger().earn("p1", "coins", 300, "quest");
    for (int i = 0; i < 5; ++i)
        e.ledger().spend("p1", "coins", 100, "upkeep");

    h.advance(59);
    ASSERT_NEAR(e.pricing().sink_multiplier("coins"), 1.0, 1e-12);
    h.advance(1);
    ASSERT_NEAR(e.inflation().inflation_rate("coins"), 2.0, 1e-9);
    ASSERT_NEAR(e.pricing().sink_multiplier("coins"), 1.3, 1e-9);
    ASSERT_NEAR(e.pricing().source_multiplier("coins"), 0.7, 1e-9);

    auto q = e.pricing().quote("coin_hat", "p1");
    ASSERT_EQ(q->costs[0].listed, 100);
    ASSERT_EQ(q->costs[0].effective, 130);
}

TEST(test_request_offer_without_client) {
    Harness h;
    auto d = h.engine->request_offer("p1", "xp_booster", "view_shop");
    ASSERT_FALSE(d.advised);
    ASSERT_EQ(d.result, EconomyResult::Success);
    ASSERT_EQ(h.engine->request_offer("p1", "missing", "view_shop").result, EconomyResult::ItemUnknown);
}

TEST(test_request_offer_with_client) {
    Harness h;
    h.engine->set_personalization_client(std::make_unique<FixedAdvice>());
    ASSERT_TRUE(h.engine->has_personalization());

    auto d = h.engine->request_offer("p1", "xp_booster", "view_shop");
    ASSERT_TRUE(d.applied);
    ASSERT_EQ(h.engine->pricing().item("xp_booster")->costs[0].amount, 15);

    // The offer ends with its window
    h.advance(24 * 3600 + 60);
    ASSERT_EQ(h.engine->pricing().item("xp_booster")->costs[0].amount, 20);
}

TEST(test_report_lists_currencies) {
    Harness h;
    h.engine->ledger().earn("p1", "coins", 10, "quest");
    std::string report = h.engine->report();
    ASSERT_TRUE(report.find("=== CURRENCIES ===") != std::string::npos);
    ASSERT_TRUE(report.find("coins") != std::string::npos);
    ASSERT_TRUE(report.find("=== EXCHANGE RATES ===") != std::string::npos);
}

TEST(test_save_and_load) {
    const std::string path = "test_economy_engine_snapshot.json";
    {
        Harness h;
        auto& e = *h.engine;
        e.ledger().earn("p1", "gems", 50, "iap");
        e.ledger().earn("p2", "coins", 700, "quest");
        e.pricing().purchase("xp_booster", "p1");
        e.pricing().apply_timed_discount("coin_hat", 10.0, 2);
        for (int i = 0; i < 5; ++i)
            e.ledger().earn("p3", "coins", 300, "quest");
        for (int i = 0; i < 5; ++i)
            e.ledger().spend("p3", "coins", 100, "upkeep");
        h.advance(60);
        e.save(path);
    }

    Harness restored;
    auto& e = *restored.engine;
    e.load(path);
    std::remove(path.c_str());

    ASSERT_EQ(e.ledger().balance("p1", "gems"), 30);
    ASSERT_EQ(e.ledger().balance("p2", "coins"), 700);
    ASSERT_EQ(e.inventory().booster_count("p1", "xp"), 1);
    ASSERT_EQ(e.pricing().player_purchases("p1", "xp_booster"), 1);
    ASSERT_EQ(e.pricing().item("coin_hat")->costs[0].amount, 90);
    ASSERT_EQ(e.profiles().profile("p1")->total_spent, 20);
    // Restored multipliers are pushed back into the shop
    ASSERT_NEAR(e.pricing().sink_multiplier("coins"), 1.3, 1e-9);
}

TEST(test_load_rejects_partial_state) {
    Harness h;
    bool thrown = false;
    try {
        h.engine->from_json(nlohmann::json{{"ledger", nlohmann::json::object()}});
    } catch (const SnapshotError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

// A bad pricing section must not leave the ledger restored from the same snapshot
TEST(test_rejected_snapshot_keeps_previous_state) {
    Harness other;
    other.engine->ledger().earn("p1", "coins", 500, "quest");
    other.engine->inventory().grant_item("p1", pricing::ItemReward{"coin_hat", 1});
    auto snapshot = other.engine->to_json();
    snapshot["pricing"]["items"]["coin_hat"]["current_purchases"] = -1;

    Harness h;
    auto& e = *h.engine;
    e.ledger().earn("p1", "coins", 7, "quest");
    e.ledger().earn("p2", "gems", 3, "iap");

    bool thrown = false;
    try {
        e.from_json(snapshot);
    } catch (const SnapshotError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_EQ(e.ledger().balance("p1", "coins"), 7);
    ASSERT_EQ(e.ledger().balance("p2", "gems"), 3);
    ASSERT_EQ(e.inventory().item_count("p1", "coin_hat"), 0);
    ASSERT_EQ(e.ledger().transactions("p1", "coins").size(), 1u);

    // Engine stays usable afterwards
    ASSERT_EQ(e.ledger().earn("p1", "coins", 100, "quest"), EconomyResult::Success);
    ASSERT_EQ(e.pricing().purchase("coin_hat", "p1"), EconomyResult::Success);
    ASSERT_EQ(e.ledger().balance("p1", "coins"), 7);
}

// ============================================
// Snapshot envelope
// ============================================

TEST(test_snapshot_store_envelope) {
    const std::string path = "test_snapshot_envelope.json";
    persistence::SnapshotStore store(path);
    ASSERT_FALSE(store.exists());

    store.save(nlohmann::json{{"answer", 42}}, 7);
    ASSERT_TRUE(store.exists());
    ASSERT_EQ(store.load().at("answer").get<int>(), 42);
    std::remove(path.c_str());

    auto rejects = [](const std::string& text) {
        try {
            persistence::SnapshotStore::parse(text);
        } catch (const SnapshotError&) {
            return true;
        }
        return false;
    };
    ASSERT_TRUE(rejects("{ nope"));
    ASSERT_TRUE(rejects(R"({"state": {}})"));
    ASSERT_TRUE(rejects(R"({"version": 2, "state": {}})"));
    ASSERT_TRUE(rejects(R"({"version": 1})"));
    ASSERT_FALSE(rejects(R"({"version": 1, "state": {}})"));

    bool thrown = false;
    try {
        persistence::SnapshotStore("no_such_snapshot.json").load();
    } catch (const SnapshotError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

int main() {
    std::cout << "=== Economy Engine Tests ===\n";

    RUN_TEST(test_builds_from_catalog);
    RUN_TEST(test_events_reach_profiles_on_tick);
    RUN_TEST(test_inflation_cycle_reprices_shop);
    RUN_TEST(test_request_offer_without_client);
    RUN_TEST(test_request_offer_with_client);
    RUN_TEST(test_report_lists_currencies);
    RUN_TEST(test_save_and_load);
    RUN_TEST(test_load_rejects_partial_state);
    RUN_TEST(test_rejected_snapshot_keeps_previous_state);
    RUN_TEST(test_snapshot_store_envelope);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
