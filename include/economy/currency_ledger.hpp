#pragma once

/**
 * CurrencyLedger - Single Source of Truth for player balances
 *
 * Owns every balance and its transaction history. Nothing else may change
 * a balance; other components go through earn/spend/exchange or, for
 * multi-step operations, through with_wallet().
 *
 * Key Invariants (MUST ALWAYS HOLD):
 *   min_amount <= balance <= max_amount
 *   every balance change appends exactly one Transaction whose amount is the
 *   applied delta and whose balance_after is the new balance
 *
 * Locking:
 *   one mutex per player wallet; per-currency market history has its own
 *   mutex. Order is always player -> market history -> rate table -> bus.
 *
 * Usage:
 *   CurrencyLedger ledger(registry, rates, bus, clock, {});
 *   ledger.earn("p1", "coins", 500, "level_complete");
 *   ledger.exchange("p1", "coins", "gems", 300);
 *
 *   // Multi-cost purchase, all under one player lock
 *   ledger.with_wallet("p1", [&](CurrencyLedger::WalletSession& w) {
 *       return w.spend("gems", 20, "shop_purchase_x");
 *   });
 */

#include "../config/defaults.hpp"
#include "../events/event_bus.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"
#include "currency.hpp"
#include "exchange_rates.hpp"
#include "transaction.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace econ {
namespace economy {

// Economy-wide running totals per currency
struct CurrencyStats {
    Amount total_earned = 0; // all inflow (earn, exchange credit, refund)
    Amount total_spent = 0;  // all outflow
    double average_balance = 0;
    uint64_t transaction_count = 0;
    Timestamp last_updated = 0;
};

struct LedgerConfig {
    size_t player_ring_capacity = config::history::PLAYER_RING_CAPACITY;
    size_t market_ring_capacity = config::history::MARKET_RING_CAPACITY;
};

class CurrencyLedger {
    struct PlayerEntry;

public:
    /**
     * WalletSession - one player's wallet, locked for the session lifetime
     *
     * Only obtainable through with_wallet(); never outlives the lock.
     */
    class WalletSession {
    public:
        Amount balance(const CurrencyId& currency) const;

        // announce = false defers CurrencyEarned/CurrencySpent to the caller (purchases publish them on commit)
        EconomyResult earn(const CurrencyId& currency, Amount amount, const std::string& source, bool announce = true);
        EconomyResult spend(const CurrencyId& currency, Amount amount, const std::string& reason,
                            const std::string& category = "", bool announce = true);

        // Compensating credit; recorded as TransactionType::Refund
        EconomyResult refund(const CurrencyId& currency, Amount amount, const std::string& tag);

        const PlayerId& player() const;

    private:
        friend class CurrencyLedger;
        WalletSession(CurrencyLedger& ledger, PlayerEntry& entry) : ledger_(ledger), entry_(entry) {}

        CurrencyLedger& ledger_;
        PlayerEntry& entry_;
    };

    CurrencyLedger(const CurrencyRegistry& registry, const ExchangeRateTable& rates, events::EventBus& bus,
                   const util::Clock& clock, LedgerConfig config = {}, logging::AsyncLogger* logger = nullptr);

    CurrencyLedger(const CurrencyLedger&) = delete;
    CurrencyLedger& operator=(const CurrencyLedger&) = delete;

    // ========================================
    // Reads (always safe)
    // ========================================

    // 0 for unknown currency or player
    Amount balance(const PlayerId& player, const CurrencyId& currency) const;
    std::map<CurrencyId, Amount> balances(const PlayerId& player) const;

    bool can_afford(const PlayerId& player, const CurrencyId& currency, Amount amount) const;
    bool can_exchange(const PlayerId& player, const CurrencyId& from, const CurrencyId& to, Amount amount) const;

    // round(amount * rate), 0 when no active rate
    Amount quote_exchange(const CurrencyId& from, const CurrencyId& to, Amount amount) const;

    // ========================================
    // Mutations
    // ========================================
    EconomyResult earn(const PlayerId& player, const CurrencyId& currency, Amount amount, const std::string& source);
    EconomyResult spend(const PlayerId& player, const CurrencyId& currency, Amount amount, const std::string& reason);
    EconomyResult exchange(const PlayerId& player, const CurrencyId& from, const CurrencyId& to, Amount amount);

    template <typename Fn>
    auto with_wallet(const PlayerId& player, Fn&& fn) {
        PlayerEntry& entry = entry_for(player);
        std::lock_guard<std::mutex> lock(entry.mutex);
        WalletSession session(*this, entry);
        return fn(session);
    }

    // ========================================
    // History
    // ========================================
    std::vector<Transaction> transactions(const PlayerId& player, const CurrencyId& currency) const;
    std::vector<Transaction> recent_market_transactions(const CurrencyId& currency, size_t n) const;
    size_t market_transaction_count(const CurrencyId& currency) const;
    CurrencyStats currency_stats(const CurrencyId& currency) const;

    std::vector<PlayerId> players() const;
    size_t player_count() const;

    const CurrencyRegistry& registry() const { return registry_; }

    // ========================================
    // Persistence (call while no requests are in flight)
    // ========================================
    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j); // throws SnapshotError

private:
    struct PlayerEntry {
        explicit PlayerEntry(PlayerId id) : player(std::move(id)) {}

        mutable std::mutex mutex;
        PlayerId player;
        std::map<CurrencyId, Amount> balances;
        std::map<CurrencyId, TransactionRing> history;
    };

    struct MarketHistory {
        explicit MarketHistory(size_t capacity) : ring(capacity) {}

        mutable std::mutex mutex;
        TransactionRing ring;
        CurrencyStats stats;
    };

    const CurrencyRegistry& registry_;
    const ExchangeRateTable& rates_;
    events::EventBus& bus_;
    const util::Clock& clock_;
    LedgerConfig config_;
    logging::AsyncLogger* logger_;

    mutable std::shared_mutex players_mutex_;
    std::map<PlayerId, std::unique_ptr<PlayerEntry>> players_;

    mutable std::shared_mutex markets_mutex_;
    std::map<CurrencyId, std::unique_ptr<MarketHistory>> markets_;

    std::atomic<Sequence> next_sequence_{0};

    PlayerEntry& entry_for(const PlayerId& player);
    const PlayerEntry* find_entry(const PlayerId& player) const;
    MarketHistory& market_for(const CurrencyId& currency);

    // Called with entry.mutex held
    static Amount balance_locked(const PlayerEntry& entry, const Currency& currency);
    EconomyResult credit_locked(PlayerEntry& entry, const Currency& currency, Amount amount, TransactionType type,
                                const std::string& tag, bool announce = true);
    EconomyResult debit_locked(PlayerEntry& entry, const Currency& currency, Amount amount, const std::string& reason,
                               const std::string& category, bool announce);
    void record_locked(PlayerEntry& entry, const Currency& currency, TransactionType type, Amount delta,
                       const std::string& tag, Amount balance_after, Timestamp now);
    EconomyResult exchange_locked(PlayerEntry& entry, const CurrencyId& from, const CurrencyId& to, Amount amount);
};

} // namespace economy
} // namespace econ
