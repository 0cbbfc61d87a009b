#include "../include/economy/currency_ledger.hpp"
#include "../include/events/event_bus.hpp"
#include "../include/types.hpp"
#include "../include/util/time_utils.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <random>
#include <thread>
#include <vector>

using namespace econ;
using namespace econ::economy;

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
#define ASSERT_THROWS(expr, type)                                                                                      \
    do {                                                                                                               \
        bool _thrown = false;                                                                                          \
        try {                                                                                                          \
            expr;                                                                                                      \
        } catch (const type&) {                                                                                        \
            _thrown = true;                                                                                            \
        }                                                                                                              \
        assert(_thrown);                                                                                               \
    } while (0)

// coins 0..999999, gems (hard) 0..99999, energy 0..30 (not tradeable), stars 0..9999
struct Economy {
    CurrencyRegistry registry;
    ExchangeRateTable rates;
    events::EventBus bus;
    util::SimulatedClock clock{config::time::NS_PER_DAY};
    std::unique_ptr<CurrencyLedger> ledger;

    explicit Economy(LedgerConfig config = {}) {
        registry.register_currency(make("coins", 999999, false, true));
        registry.register_currency(make("gems", 99999, true, true));
        registry.register_currency(make("energy", 30, false, false));
        registry.register_currency(make("stars", 9999, false, true));

        rates.add(ExchangeRate{"coins", "gems", 0.01, 0.005, 0.02, true, 0});
        rates.add(ExchangeRate{"gems", "coins", 100.0, 50.0, 200.0, true, 0});
        rates.add(ExchangeRate{"stars", "coins", 10.0, 5.0, 20.0, true, 0});

        ledger = std::make_unique<CurrencyLedger>(registry, rates, bus, clock, config);
    }

    static Currency make(const char* id, Amount max, bool hard, bool tradeable) {
        Currency c;
        c.id = id;
        c.name = id;
        c.max_amount = max;
        c.is_hard_currency = hard;
        c.is_tradeable = tradeable;
        return c;
    }
};

// Collects every delivered event
struct Recorder {
    std::vector<events::EventEnvelope> seen;

    void attach(events::EventBus& bus) {
        bus.subscribe([this](const events::EventEnvelope& e) { seen.push_back(e); });
    }

    template <typename T>
    size_t count() const {
        size_t n = 0;
        for (const auto& e : seen) {
            if (std::holds_alternative<T>(e.event))
                ++n;
        }
        return n;
    }
};

// ============================================
// Earn
// ============================================

TEST(test_earn_adds_and_records) {
    Economy econ;
    ASSERT_EQ(econ.ledger->earn("p1", "coins", 1000, "seed"), EconomyResult::Success);
    ASSERT_EQ(econ.ledger->earn("p1", "coins", 500, "level_complete"), EconomyResult::Success);

    ASSERT_EQ(econ.ledger->balance("p1", "coins"), 1500);
    auto history = econ.ledger->transactions("p1", "coins");
    ASSERT_EQ(history.size(), 2u);
    ASSERT_EQ(history.back().amount, 500);
    ASSERT_EQ(history.back().balance_after, 1500);
    ASSERT_EQ(history.back().type, TransactionType::Earn);
    ASSERT_EQ(history.back().tag, "level_complete");
    ASSERT_TRUE(history.back().sequence > history.front().sequence);
}

TEST(test_earn_rejects_non_positive) {
    Economy econ;
    ASSERT_EQ(econ.ledger->earn("p1", "coins", 0, "x"), EconomyResult::InvalidAmount);
    ASSERT_EQ(econ.ledger->earn("p1", "coins", -5, "x"), EconomyResult::InvalidAmount);
    ASSERT_EQ(econ.ledger->balance("p1", "coins"), 0);
    ASSERT_TRUE(econ.ledger->transactions("p1", "coins").empty());
}

TEST(test_unknown_currency_and_player) {
    Economy econ;
    ASSERT_EQ(econ.ledger->earn("p1", "rubies", 10, "x"), EconomyResult::CurrencyUnknown);
    ASSERT_EQ(econ.ledger->spend("p1", "rubies", 10, "x"), EconomyResult::CurrencyUnknown);
    ASSERT_EQ(econ.ledger->balance("p1", "rubies"), 0);
    ASSERT_EQ(econ.ledger->balance("nobody", "coins"), 0);
    ASSERT_EQ(econ.ledger->balances("nobody").size(), 4u);
}

// A raised floor is the starting balance of every wallet
TEST(test_new_wallet_starts_at_floor) {
    CurrencyRegistry registry;
    Currency tickets = Economy::make("tickets", 100, false, false);
    tickets.min_amount = 5;
    registry.register_currency(tickets);
    ExchangeRateTable rates;
    events::EventBus bus;
    util::SimulatedClock clock;
    CurrencyLedger ledger(registry, rates, bus, clock);

    ASSERT_EQ(ledger.balance("nobody", "tickets"), 5);
    ASSERT_EQ(ledger.balance("nobody", "rubies"), 0);
    ASSERT_EQ(ledger.spend("p1", "tickets", 1, "x"), EconomyResult::InsufficientFunds);
    ASSERT_EQ(ledger.earn("p1", "tickets", 10, "x"), EconomyResult::Success);
    ASSERT_EQ(ledger.balance("p1", "tickets"), 15);
}

TEST(test_earn_clamps_to_ceiling) {
    Economy econ;
    ASSERT_EQ(econ.ledger->earn("p1", "energy", 25, "regen"), EconomyResult::Success);
    ASSERT_EQ(econ.ledger->earn("p1", "energy", 10, "regen"), EconomyResult::Success);
    ASSERT_EQ(econ.ledger->balance("p1", "energy"), 30);

    auto history = econ.ledger->transactions("p1", "energy");
    ASSERT_EQ(history.back().amount, 5); // only the applied part

    // Already full: nothing changes, nothing recorded
    ASSERT_EQ(econ.ledger->earn("p1", "energy", 1, "regen"), EconomyResult::BalanceCapped);
    ASSERT_EQ(econ.ledger->transactions("p1", "energy").size(), 2u);
}

// ============================================
// Spend
// ============================================

TEST(test_spend_insufficient_funds) {
    Economy econ;
    econ.ledger->earn("p1", "gems", 10, "iap");
    ASSERT_EQ(econ.ledger->spend("p1", "gems", 15, "shop"), EconomyResult::InsufficientFunds);
    ASSERT_EQ(econ.ledger->balance("p1", "gems"), 10);
    ASSERT_EQ(econ.ledger->transactions("p1", "gems").size(), 1u);
}

TEST(test_spend_records_negative_delta) {
    Economy econ;
    econ.ledger->earn("p1", "gems", 10, "iap");
    ASSERT_EQ(econ.ledger->spend("p1", "gems", 4, "energy_refill"), EconomyResult::Success);
    auto tx = econ.ledger->transactions("p1", "gems").back();
    ASSERT_EQ(tx.amount, -4);
    ASSERT_EQ(tx.balance_after, 6);
    ASSERT_EQ(tx.type, TransactionType::Spend);

    ASSERT_EQ(econ.ledger->spend("p1", "gems", 6, "all_in"), EconomyResult::Success);
    ASSERT_EQ(econ.ledger->balance("p1", "gems"), 0);
    ASSERT_EQ(econ.ledger->spend("p1", "gems", 1, "broke"), EconomyResult::InsufficientFunds);
}

TEST(test_can_afford) {
    Economy econ;
    econ.ledger->earn("p1", "coins", 100, "x");
    ASSERT_TRUE(econ.ledger->can_afford("p1", "coins", 100));
    ASSERT_FALSE(econ.ledger->can_afford("p1", "coins", 101));
    ASSERT_FALSE(econ.ledger->can_afford("p1", "rubies", 1));
}

// ============================================
// Exchange
// ============================================

TEST(test_exchange_converts_at_rate) {
    Economy econ;
    Recorder rec;
    rec.attach(econ.bus);

    econ.ledger->earn("p1", "coins", 500, "x");
    ASSERT_EQ(econ.ledger->quote_exchange("coins", "gems", 300), 3);
    ASSERT_TRUE(econ.ledger->can_exchange("p1", "coins", "gems", 300));
    ASSERT_EQ(econ.ledger->exchange("p1", "coins", "gems", 300), EconomyResult::Success);

    ASSERT_EQ(econ.ledger->balance("p1", "coins"), 200);
    ASSERT_EQ(econ.ledger->balance("p1", "gems"), 3);
    ASSERT_EQ(econ.ledger->transactions("p1", "gems").back().type, TransactionType::Exchange);

    econ.bus.dispatch();
    ASSERT_EQ(rec.count<events::CurrencyExchanged>(), 1u);
    // Exchange legs are not announced as earn/spend
    ASSERT_EQ(rec.count<events::CurrencyEarned>(), 1u); // the initial earn
    ASSERT_EQ(rec.count<events::CurrencySpent>(), 0u);
}

TEST(test_exchange_too_small_refunds) {
    Economy econ;
    econ.ledger->earn("p1", "coins", 100, "x");
    ASSERT_EQ(econ.ledger->exchange("p1", "coins", "gems", 40), EconomyResult::ExchangeTooSmall);
    ASSERT_EQ(econ.ledger->balance("p1", "coins"), 100);
    ASSERT_EQ(econ.ledger->balance("p1", "gems"), 0);

    auto history = econ.ledger->transactions("p1", "coins");
    ASSERT_EQ(history.size(), 3u); // earn, spend, refund
    ASSERT_EQ(history.back().type, TransactionType::Refund);
    ASSERT_EQ(history.back().balance_after, 100);
}

TEST(test_exchange_unavailable) {
    Economy econ;
    econ.ledger->earn("p1", "energy", 20, "x");
    econ.ledger->earn("p1", "gems", 20, "x");
    econ.ledger->earn("p1", "coins", 1000, "x");

    // Not tradeable
    ASSERT_EQ(econ.ledger->exchange("p1", "energy", "coins", 10), EconomyResult::ExchangeUnavailable);
    // No such pair
    ASSERT_EQ(econ.ledger->exchange("p1", "gems", "stars", 10), EconomyResult::ExchangeUnavailable);
    // Inactive pair
    econ.rates.set_active("coins", "gems", false);
    ASSERT_EQ(econ.ledger->exchange("p1", "coins", "gems", 500), EconomyResult::ExchangeUnavailable);
    ASSERT_FALSE(econ.ledger->can_exchange("p1", "coins", "gems", 500));

    ASSERT_EQ(econ.ledger->balance("p1", "coins"), 1000);
    ASSERT_EQ(econ.ledger->transactions("p1", "coins").size(), 1u);
}

TEST(test_exchange_insufficient_has_no_side_effect) {
    Economy econ;
    econ.ledger->earn("p1", "coins", 100, "x");
    ASSERT_EQ(econ.ledger->exchange("p1", "coins", "gems", 500), EconomyResult::InsufficientFunds);
    ASSERT_EQ(econ.ledger->balance("p1", "coins"), 100);
    ASSERT_EQ(econ.ledger->transactions("p1", "coins").size(), 1u);
}

// Target at its ceiling: the spent source is refunded and the credit's error returned
TEST(test_exchange_target_capped_refunds_source) {
    Economy econ;
    econ.ledger->earn("p1", "gems", 99999, "x");
    econ.ledger->earn("p1", "coins", 1000, "x");

    ASSERT_EQ(econ.ledger->exchange("p1", "coins", "gems", 1000), EconomyResult::BalanceCapped);
    ASSERT_EQ(econ.ledger->balance("p1", "coins"), 1000);
    ASSERT_EQ(econ.ledger->balance("p1", "gems"), 99999);
}

// ============================================
// History
// ============================================

TEST(test_history_rings_evict_oldest) {
    LedgerConfig config;
    config.player_ring_capacity = 5;
    config.market_ring_capacity = 8;
    Economy econ(config);

    for (int i = 1; i <= 12; ++i) {
        econ.ledger->earn("p1", "coins", i, "tick");
    }
    auto history = econ.ledger->transactions("p1", "coins");
    ASSERT_EQ(history.size(), 5u);
    ASSERT_EQ(history.front().amount, 8);
    ASSERT_EQ(history.back().amount, 12);

    ASSERT_EQ(econ.ledger->market_transaction_count("coins"), 8u);
    auto recent = econ.ledger->recent_market_transactions("coins", 3);
    ASSERT_EQ(recent.size(), 3u);
    ASSERT_EQ(recent.back().amount, 12);
}

TEST(test_currency_stats) {
    Economy econ;
    econ.ledger->earn("p1", "coins", 300, "x");
    econ.ledger->earn("p2", "coins", 200, "x");
    econ.ledger->spend("p1", "coins", 100, "y");

    auto stats = econ.ledger->currency_stats("coins");
    ASSERT_EQ(stats.total_earned, 500);
    ASSERT_EQ(stats.total_spent, 100);
    ASSERT_EQ(stats.transaction_count, 3u);
    ASSERT_TRUE(stats.average_balance > 0.0);
    ASSERT_EQ(econ.ledger->player_count(), 2u);
}

// ============================================
// Wallet sessions
// ============================================

TEST(test_with_wallet_multi_step) {
    Economy econ;
    econ.ledger->earn("p1", "coins", 100, "x");
    econ.ledger->earn("p1", "gems", 5, "x");

    // Second leg fails; first is compensated inside the same lock
    EconomyResult r = econ.ledger->with_wallet("p1", [](CurrencyLedger::WalletSession& w) {
        EconomyResult first = w.spend("coins", 50, "bundle");
        if (first != EconomyResult::Success)
            return first;
        EconomyResult second = w.spend("gems", 10, "bundle");
        if (second != EconomyResult::Success) {
            w.refund("coins", 50, "bundle_refund");
            return EconomyResult::PurchaseCostFailure;
        }
        return EconomyResult::Success;
    });

    ASSERT_EQ(r, EconomyResult::PurchaseCostFailure);
    ASSERT_EQ(econ.ledger->balance("p1", "coins"), 100);
    ASSERT_EQ(econ.ledger->balance("p1", "gems"), 5);
}

// ============================================
// Events
// ============================================

TEST(test_events_in_order) {
    Economy econ;
    Recorder rec;
    rec.attach(econ.bus);

    econ.ledger->earn("p1", "coins", 100, "quest");
    econ.ledger->spend("p1", "coins", 30, "shop");
    econ.bus.dispatch();

    ASSERT_EQ(rec.seen.size(), 4u);
    ASSERT_TRUE(std::holds_alternative<events::BalanceChanged>(rec.seen[0].event));
    ASSERT_TRUE(std::holds_alternative<events::CurrencyEarned>(rec.seen[1].event));
    ASSERT_TRUE(std::holds_alternative<events::BalanceChanged>(rec.seen[2].event));
    ASSERT_TRUE(std::holds_alternative<events::CurrencySpent>(rec.seen[3].event));

    auto& changed = std::get<events::BalanceChanged>(rec.seen[2].event);
    ASSERT_EQ(changed.old_balance, 100);
    ASSERT_EQ(changed.new_balance, 70);
    for (size_t i = 1; i < rec.seen.size(); ++i) {
        ASSERT_TRUE(rec.seen[i].sequence > rec.seen[i - 1].sequence);
    }
}

TEST(test_failed_operations_publish_nothing) {
    Economy econ;
    econ.ledger->spend("p1", "coins", 10, "x");
    econ.ledger->earn("p1", "coins", -1, "x");
    ASSERT_EQ(econ.bus.pending(), 0u);
}

// ============================================
// Invariants
// ============================================

TEST(test_random_walk_respects_bounds) {
    Economy econ;
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> op(0, 2);
    std::uniform_int_distribution<Amount> amount(-50, 5000);

    for (int i = 0; i < 5000; ++i) {
        Amount a = amount(rng);
        switch (op(rng)) {
        case 0:
            econ.ledger->earn("p1", "gems", a, "walk");
            break;
        case 1:
            econ.ledger->spend("p1", "gems", a, "walk");
            break;
        default:
            econ.ledger->exchange("p1", "coins", "gems", a);
            econ.ledger->earn("p1", "coins", a, "walk");
            break;
        }
        Amount gems = econ.ledger->balance("p1", "gems");
        ASSERT_TRUE(gems >= 0 && gems <= 99999);
        auto history = econ.ledger->transactions("p1", "gems");
        if (!history.empty()) {
            ASSERT_EQ(history.back().balance_after, gems);
        }
    }
}

TEST(test_concurrent_earn_same_player) {
    Economy econ;
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&econ]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                econ.ledger->earn("shared", "coins", 1, "race");
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(econ.ledger->balance("shared", "coins"), THREADS * PER_THREAD);
    ASSERT_EQ(econ.ledger->currency_stats("coins").transaction_count, static_cast<uint64_t>(THREADS * PER_THREAD));
}

// ============================================
// Persistence
// ============================================

TEST(test_snapshot_restores_balances_and_history) {
    Economy source;
    source.ledger->earn("p1", "coins", 700, "x");
    source.ledger->spend("p1", "coins", 200, "y");
    source.ledger->earn("p2", "gems", 9, "z");
    auto j = source.ledger->to_json();

    Economy target;
    target.ledger->from_json(j);
    ASSERT_EQ(target.ledger->balance("p1", "coins"), 500);
    ASSERT_EQ(target.ledger->balance("p2", "gems"), 9);
    ASSERT_EQ(target.ledger->transactions("p1", "coins").size(), 2u);
    ASSERT_EQ(target.ledger->currency_stats("coins").total_spent, 200);

    // Sequence numbers continue after the restored ones
    target.ledger->earn("p1", "coins", 1, "after");
    auto history = target.ledger->transactions("p1", "coins");
    ASSERT_TRUE(history.back().sequence > history[history.size() - 2].sequence);
}

TEST(test_snapshot_rejects_unknown_currency) {
    Economy source;
    source.ledger->earn("p1", "coins", 10, "x");
    auto j = source.ledger->to_json();
    j["players"]["p1"]["balances"]["rubies"] = 5;

    Economy target;
    ASSERT_THROWS(target.ledger->from_json(j), SnapshotError);
}

int main() {
    std::cout << "=== Currency Ledger Tests ===\n";

    RUN_TEST(test_earn_adds_and_records);
    RUN_TEST(test_earn_rejects_non_positive);
    RUN_TEST(test_unknown_currency_and_player);
    RUN_TEST(test_new_wallet_starts_at_floor);
    RUN_TEST(test_earn_clamps_to_ceiling);
    RUN_TEST(test_spend_insufficient_funds);
    RUN_TEST(test_spend_records_negative_delta);
    RUN_TEST(test_can_afford);
    RUN_TEST(test_exchange_converts_at_rate);
    RUN_TEST(test_exchange_too_small_refunds);
    RUN_TEST(test_exchange_unavailable);
    RUN_TEST(test_exchange_insufficient_has_no_side_effect);
    RUN_TEST(test_exchange_target_capped_refunds_source);
    RUN_TEST(test_history_rings_evict_oldest);
    RUN_TEST(test_currency_stats);
    RUN_TEST(test_with_wallet_multi_step);
    RUN_TEST(test_events_in_order);
    RUN_TEST(test_failed_operations_publish_nothing);
    RUN_TEST(test_random_walk_respects_bounds);
    RUN_TEST(test_concurrent_earn_same_player);
    RUN_TEST(test_snapshot_restores_balances_and_history);
    RUN_TEST(test_snapshot_rejects_unknown_currency);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
