#include "../include/benchmark/histogram.hpp"
#include "../include/benchmark/timer.hpp"
#include "../include/config/catalog.hpp"
#include "../include/economy_engine.hpp"
#include "../include/util/time_utils.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace econ;
using namespace econ::benchmark;

// Benchmark configuration
constexpr size_t WARMUP_OPS = 1000;
constexpr size_t BENCH_OPS = 100000;
constexpr size_t PLAYERS = 1000;
constexpr int THREADS = 4;

const char* BENCH_CATALOG = R"({
  "currencies": [
    {"id": "coins", "max": 1000000000},
    {"id": "gems", "hard": true, "max": 1000000000}
  ],
  "exchange_rates": [
    {"from": "coins", "to": "gems", "rate": 0.01, "min_rate": 0.005, "max_rate": 0.02}
  ],
  "items": [
    {"id": "booster", "costs": [{"currency": "coins", "amount": 10}],
     "rewards": [{"type": "booster", "booster": "xp", "quantity": 1}]}
  ]
})";

void print_stats(const char* name, const Histogram<>& hist) {
    std::cout << std::fixed << std::setprecision(1);
    std::cout << name << ":\n";
    std::cout << "  Count: " << hist.count() << " ops\n";
    std::cout << "  Mean:  " << hist.mean() << " ns\n";
    std::cout << "  Min:   " << hist.min() << " ns\n";
    std::cout << "  P50:   " << hist.p50() << " ns\n";
    std::cout << "  P99:   " << hist.p99() << " ns\n";
    std::cout << "  P99.9: " << hist.p999() << " ns\n";
    std::cout << "  Max:   " << hist.max() << " ns\n";
    std::cout << "\n";
}

std::vector<PlayerId> make_players() {
    std::vector<PlayerId> ids;
    ids.reserve(PLAYERS);
    for (size_t i = 0; i < PLAYERS; ++i) {
        ids.push_back("p" + std::to_string(i));
    }
    return ids;
}

template <typename Op>
Histogram<> measure(size_t ops, Op&& op) {
    Histogram<> hist;
    for (size_t i = 0; i < WARMUP_OPS; ++i) {
        op(i);
    }
    for (size_t i = 0; i < ops; ++i) {
        uint64_t start = LatencyTimer::now_ns();
        op(i);
        hist.record(LatencyTimer::now_ns() - start);
    }
    return hist;
}

void bench_earn(EconomyEngine& engine, const std::vector<PlayerId>& players) {
    auto hist = measure(BENCH_OPS, [&](size_t i) {
        if (engine.ledger().earn(players[i % PLAYERS], "coins", 100, "bench") != EconomyResult::Success)
            std::cerr << "earn failed\n";
    });
    engine.flush_events();
    print_stats("Earn", hist);
}

void bench_spend(EconomyEngine& engine, const std::vector<PlayerId>& players) {
    auto hist = measure(BENCH_OPS, [&](size_t i) {
        if (engine.ledger().spend(players[i % PLAYERS], "coins", 10, "bench") != EconomyResult::Success)
            std::cerr << "spend failed\n";
    });
    engine.flush_events();
    print_stats("Spend", hist);
}

void bench_exchange(EconomyEngine& engine, const std::vector<PlayerId>& players) {
    auto hist = measure(BENCH_OPS / 10, [&](size_t i) {
        if (engine.ledger().exchange(players[i % PLAYERS], "coins", "gems", 100) != EconomyResult::Success)
            std::cerr << "exchange failed\n";
    });
    engine.flush_events();
    print_stats("Exchange", hist);
}

void bench_purchase(EconomyEngine& engine, const std::vector<PlayerId>& players) {
    auto hist = measure(BENCH_OPS / 10, [&](size_t i) {
        if (engine.pricing().purchase("booster", players[i % PLAYERS]) != EconomyResult::Success)
            std::cerr << "purchase failed\n";
    });
    engine.flush_events();
    print_stats("Purchase", hist);
}

// Distinct players per thread: wallets never contend
void bench_concurrent_earn(EconomyEngine& engine, const std::vector<PlayerId>& players) {
    std::vector<Histogram<>> per_thread(THREADS);
    std::vector<std::thread> threads;
    ScopedTimer wall;

    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (size_t i = 0; i < BENCH_OPS / THREADS; ++i) {
                const PlayerId& player = players[(i * THREADS + static_cast<size_t>(t)) % PLAYERS];
                uint64_t start = LatencyTimer::now_ns();
                if (engine.ledger().earn(player, "coins", 1, "bench") != EconomyResult::Success)
                    std::cerr << "earn failed\n";
                per_thread[static_cast<size_t>(t)].record(LatencyTimer::now_ns() - start);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    uint64_t elapsed = wall.elapsed_ns();
    engine.flush_events();

    Histogram<> total;
    for (const auto& h : per_thread) {
        total.merge(h);
    }
    print_stats("Concurrent Earn (4 threads)", total);
    std::cout << "  Throughput: " << static_cast<double>(total.count()) * 1e9 / static_cast<double>(elapsed)
              << " ops/s\n\n";
}

int main() {
    std::cout << "=== Economy Ledger Benchmark ===\n\n";

    util::SimulatedClock clock(config::time::NS_PER_DAY);
    EconomyEngine engine(config::CatalogLoader::parse(BENCH_CATALOG), clock);
    auto players = make_players();

    bench_earn(engine, players);
    bench_spend(engine, players);
    bench_exchange(engine, players);
    bench_purchase(engine, players);
    bench_concurrent_earn(engine, players);

    std::cout << "Events published: " << engine.bus().published() << ", delivered: " << engine.bus().delivered()
              << "\n";
    return 0;
}
