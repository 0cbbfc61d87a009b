/**
 * Economy Simulator - drives a synthetic player population through the economy
 *
 * Each simulated hour a share of the population logs in, plays levels
 * (energy -> coins, stars), claims the daily reward, browses the shop and
 * sometimes buys. Spenders top up gems; some players drift away and churn.
 * The scheduler runs once per simulated minute, so inflation cycles,
 * profile sweeps and discount expiry happen exactly as in production.
 *
 * Usage:
 *   economy_sim                                   # 100 players, 30 days
 *   economy_sim -p 1000 -d 90 --seed 7            # Bigger, reproducible
 *   economy_sim --save econ.json                  # Keep the final state
 *   economy_sim --load econ.json -d 7             # Continue from a snapshot
 */

#include "../include/config/catalog.hpp"
#include "../include/economy_engine.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/persistence/snapshot_store.hpp"
#include "../include/presentation/views.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/system.hpp"
#include "../include/util/time_utils.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

using namespace econ;

namespace {

// Behaviour drawn once per player
struct SimPlayer {
    PlayerId id;
    double play_chance = 0.5;  // per hour slot
    double buy_chance = 0.05;  // per session
    bool spender = false;      // tops up gems
    int quit_day = -1;         // -1 = never quits
    int last_claim_day = -1;
};

std::vector<SimPlayer> make_population(int count, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    std::vector<SimPlayer> players;
    players.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        SimPlayer p;
        p.id = "player_" + std::to_string(i);
        p.play_chance = 0.05 + 0.25 * uni(rng);
        p.spender = uni(rng) < 0.15;
        p.buy_chance = p.spender ? 0.3 : 0.05;
        if (uni(rng) < 0.2)
            p.quit_day = static_cast<int>(uni(rng) * 20);
        players.push_back(std::move(p));
    }
    return players;
}

// Denied operations by "op:result"; denials are normal player behaviour
struct Outcomes {
    std::map<std::string, uint64_t> denied;

    EconomyResult add(const char* op, EconomyResult r) {
        if (!succeeded(r))
            denied[std::string(op) + ":" + economy_result_to_string(r)]++;
        return r;
    }
};

const std::vector<pricing::Reward> DAILY_REWARD = {pricing::CurrencyReward{"coins", 100}};

void play_session(EconomyEngine& engine, SimPlayer& player, int day, std::mt19937_64& rng, Outcomes& outcomes,
                  bool verbose) {
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    auto& ledger = engine.ledger();
    auto& shop = engine.pricing();

    engine.profiles().record_event(player.id, profile::ProfileEventType::SessionActivity);

    if (player.last_claim_day != day) {
        EconomyResult claimed = shop.claim_reward(player.id, "daily_login", DAILY_REWARD);
        if (outcomes.add("claim", claimed) == EconomyResult::Success)
            player.last_claim_day = day;
        // Energy regenerates between sessions; a full tank reports BalanceCapped
        outcomes.add("regen", ledger.earn(player.id, "energy", 10, "regen"));
    }

    // Levels: 5 energy each
    int levels = 1 + static_cast<int>(uni(rng) * 4);
    for (int i = 0; i < levels; ++i) {
        if (outcomes.add("level", ledger.spend(player.id, "energy", 5, "level_start")) != EconomyResult::Success)
            break;
        Amount payout = 50 + static_cast<Amount>(uni(rng) * 150);
        outcomes.add("earn", ledger.earn(player.id, "coins", payout, "level_complete"));
        if (uni(rng) < 0.3)
            outcomes.add("earn", ledger.earn(player.id, "stars", 1, "level_rating"));
    }

    if (player.spender && uni(rng) < 0.1) {
        outcomes.add("iap", ledger.earn(player.id, "gems", 100, "iap_gem_bundle"));
    }

    // Surplus coins occasionally converted
    if (ledger.balance(player.id, "coins") > 5000 && uni(rng) < 0.2) {
        outcomes.add("exchange", ledger.exchange(player.id, "coins", "gems", 1000));
    }

    auto shelf = shop.available_items(player.id);
    if (shelf.empty())
        return;
    const auto& pick = shelf[static_cast<size_t>(uni(rng) * static_cast<double>(shelf.size())) % shelf.size()];
    outcomes.add("view", shop.view_item(pick.id, player.id));

    if (uni(rng) < player.buy_chance) {
        EconomyResult r = outcomes.add("purchase", shop.purchase(pick.id, player.id));
        if (verbose) {
            std::cout << "  [day " << day << "] " << player.id << " -> " << pick.id << ": "
                      << economy_result_to_string(r) << "\n";
        }
    }

    if (engine.has_personalization() && uni(rng) < 0.05) {
        outcomes.add("offer", engine.request_offer(player.id, pick.id, "view_shop").result);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args))
        return 1;
    if (args.help) {
        util::print_help();
        return 0;
    }

    logging::AsyncLogger logger;
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Warn);
    logger.start();

    std::atomic<bool> running{true};
    util::install_shutdown_handler(running);

    try {
        config::Catalog catalog = config::CatalogLoader::load(args.catalog);
        if (catalog.economy.inflation.seed == 0)
            catalog.economy.inflation.seed = args.seed;

        // Day 1 so "never" (0) stays distinguishable from the first instant
        util::SimulatedClock clock(config::time::NS_PER_DAY);
        EconomyEngine engine(catalog, clock, &logger);

        if (!args.load_path.empty()) {
            nlohmann::json state = persistence::SnapshotStore(args.load_path, &logger).load();
            clock.set(state.value("clock", clock.now()));
            engine.from_json(state);
            std::cout << "Resumed " << engine.ledger().player_count() << " players from " << args.load_path << "\n";
        }

        std::mt19937_64 rng(args.seed);
        std::uniform_real_distribution<double> uni(0.0, 1.0);
        auto players = make_population(args.players, rng);
        Outcomes outcomes;

        std::cout << "Simulating " << args.players << " players for " << args.days << " days (seed " << args.seed
                  << ")\n";

        for (int day = 0; day < args.days && running.load(); ++day) {
            // Weekend sale on the popular coin chest
            if (day % 7 == 5) {
                outcomes.add("sale", engine.pricing().apply_timed_discount("coin_pack_large", 25.0, 48));
            }

            for (int hour = 0; hour < 24; ++hour) {
                for (auto& p : players) {
                    if (p.quit_day >= 0 && day >= p.quit_day)
                        continue;
                    if (uni(rng) < p.play_chance / 4.0)
                        play_session(engine, p, day, rng, outcomes, args.verbose);
                }
                for (int minute = 0; minute < 60; ++minute) {
                    clock.advance_seconds(60);
                    engine.tick();
                }
            }

            if (args.verbose || (day + 1) % 10 == 0 || day + 1 == args.days) {
                auto counts = engine.profiles().segment_counts();
                std::cout << "Day " << (day + 1) << ": cycle " << engine.inflation().last_cycle() << ", coins sink x"
                          << engine.pricing().sink_multiplier("coins") << ", churned "
                          << counts[profile::Segment::Churned] << "\n";
            }
        }
        engine.flush_events();

        std::cout << "\n" << engine.report() << "\n";
        std::cout << "=== DENIED OPERATIONS ===\n";
        for (const auto& [what, count] : outcomes.denied) {
            std::cout << "  " << what << ": " << count << "\n";
        }
        std::cout << "\n=== SAMPLE WALLETS ===\n";
        for (size_t i = 0; i < std::min<size_t>(3, players.size()); ++i) {
            std::cout << presentation::format_wallet(
                presentation::wallet_view(engine.ledger(), engine.inventory(), players[i].id));
        }

        if (!args.save_path.empty()) {
            engine.save(args.save_path);
            std::cout << "\nSnapshot written to " << args.save_path << "\n";
        }
    } catch (const CatalogError& e) {
        std::cerr << "Catalog error: " << e.what() << "\n";
        logger.stop();
        return 1;
    } catch (const SnapshotError& e) {
        std::cerr << "Snapshot error: " << e.what() << "\n";
        logger.stop();
        return 1;
    }

    logger.stop();
    std::cout << "Logged " << logger.total_logged() << " entries (" << logger.dropped_count() << " dropped)\n";
    return 0;
}
