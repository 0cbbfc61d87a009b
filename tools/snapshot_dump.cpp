/**
 * Dump an economy snapshot for debugging
 *
 * Usage:
 *   snapshot_dump econ.json            # Summary
 *   snapshot_dump econ.json player_7   # Summary + one player's wallet and history
 */
#include "../include/persistence/snapshot_store.hpp"
#include "../include/util/time_utils.hpp"

#include <iomanip>
#include <iostream>
#include <string>

using namespace econ;

namespace {

void dump_summary(const nlohmann::json& state) {
    const auto& ledger = state.at("ledger");
    const auto& players = ledger.at("players");

    std::cout << "[ Ledger ]\n";
    std::cout << "  clock (days):     " << util::ns_to_days(state.value("clock", Timestamp{0})) << "\n";
    std::cout << "  next_sequence:    " << ledger.at("next_sequence") << "\n";
    std::cout << "  players:          " << players.size() << "\n\n";

    std::cout << "[ Currency Markets ]\n";
    for (const auto& [currency, market] : ledger.at("markets").items()) {
        const auto& s = market.at("stats");
        std::cout << "  " << std::left << std::setw(10) << currency << std::right << " earned=" << s.at("earned")
                  << " spent=" << s.at("spent") << " txns=" << s.at("count")
                  << " history=" << market.at("history").size() << "\n";
    }
    std::cout << "\n";

    std::cout << "[ Inflation ]\n";
    const auto& inflation = state.at("inflation");
    std::cout << "  last_cycle:       " << inflation.value("last_cycle", 0) << "\n";
    if (inflation.contains("currencies")) {
        for (const auto& [currency, c] : inflation.at("currencies").items()) {
            std::cout << "  " << std::left << std::setw(10) << currency << std::right << " sink=" << c.value("sink", 1.0)
                      << " source=" << c.value("source", 1.0) << " rate=" << c.value("inflation_rate", 0.0) << "\n";
        }
    }
    std::cout << "\n";

    std::cout << "[ Exchange Rates ]\n";
    for (const auto& r : state.at("rates")) {
        std::cout << "  " << r.at("from").get<std::string>() << " -> " << r.at("to").get<std::string>() << "  "
                  << r.at("rate") << (r.value("active", true) ? "" : " (inactive)") << "\n";
    }
    std::cout << "\n";

    std::cout << "[ Shop ]\n";
    for (const auto& [id, item] : state.at("pricing").at("items").items()) {
        std::cout << "  " << std::left << std::setw(18) << id << std::right
                  << " sold=" << item.value("current_purchases", 0)
                  << (item.value("available", true) ? "" : " (unavailable)")
                  << (item.contains("discount") && !item.at("discount").is_null() ? " (discounted)" : "") << "\n";
    }
    std::cout << "\n";

    std::cout << "[ Profiles ]\n";
    std::cout << "  profiles:         " << state.at("profiles").at("profiles").size() << "\n";
}

void dump_player(const nlohmann::json& state, const std::string& player) {
    const auto& players = state.at("ledger").at("players");
    auto it = players.find(player);
    if (it == players.end()) {
        std::cout << "\nPlayer " << player << " not in snapshot\n";
        return;
    }

    std::cout << "\n=== PLAYER " << player << " ===\n";
    for (const auto& [currency, amount] : it->at("balances").items()) {
        std::cout << "  " << std::left << std::setw(10) << currency << std::right << amount << "\n";
    }
    std::cout << "\n  Recent transactions:\n";
    for (const auto& [currency, history] : it->at("history").items()) {
        for (const auto& tx : history) {
            std::cout << "    #" << tx.at("seq") << " " << std::left << std::setw(9)
                      << tx.at("type").get<std::string>() << std::right << " " << std::setw(8) << tx.at("amount")
                      << " " << currency << " -> " << tx.at("balance_after") << "  "
                      << tx.at("tag").get<std::string>() << "\n";
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: snapshot_dump <snapshot.json> [player]\n";
        return 1;
    }

    try {
        persistence::SnapshotStore store(argv[1]);
        nlohmann::json state = store.load();
        std::cout << "\n=== ECONOMY SNAPSHOT " << argv[1] << " (v" << persistence::SNAPSHOT_VERSION << ") ===\n\n";
        dump_summary(state);
        if (argc > 2)
            dump_player(state, argv[2]);
    } catch (const SnapshotError& e) {
        std::cerr << "Snapshot error: " << e.what() << "\n";
        return 1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Unexpected snapshot layout: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
