#include "../../include/economy/currency_ledger.hpp"
#include "../../include/persistence/json_codec.hpp"

#include <cmath>

namespace econ {
namespace economy {

namespace LogCategory = logging::LogCategory;

CurrencyLedger::CurrencyLedger(const CurrencyRegistry& registry, const ExchangeRateTable& rates,
                               events::EventBus& bus, const util::Clock& clock, LedgerConfig config,
                               logging::AsyncLogger* logger)
    : registry_(registry), rates_(rates), bus_(bus), clock_(clock), config_(config), logger_(logger) {
    for (const auto& id : registry_.ids()) {
        markets_.emplace(id, std::make_unique<MarketHistory>(config_.market_ring_capacity));
    }
}

// =============================================================================
// Entry lookup
// =============================================================================

CurrencyLedger::PlayerEntry& CurrencyLedger::entry_for(const PlayerId& player) {
    {
        std::shared_lock lock(players_mutex_);
        auto it = players_.find(player);
        if (it != players_.end())
            return *it->second;
    }
    std::unique_lock lock(players_mutex_);
    auto& slot = players_[player];
    if (!slot) {
        slot = std::make_unique<PlayerEntry>(player);
    }
    return *slot;
}

const CurrencyLedger::PlayerEntry* CurrencyLedger::find_entry(const PlayerId& player) const {
    std::shared_lock lock(players_mutex_);
    auto it = players_.find(player);
    return it != players_.end() ? it->second.get() : nullptr;
}

CurrencyLedger::MarketHistory& CurrencyLedger::market_for(const CurrencyId& currency) {
    {
        std::shared_lock lock(markets_mutex_);
        auto it = markets_.find(currency);
        if (it != markets_.end())
            return *it->second;
    }
    std::unique_lock lock(markets_mutex_);
    auto& slot = markets_[currency];
    if (!slot) {
        slot = std::make_unique<MarketHistory>(config_.market_ring_capacity);
    }
    return *slot;
}

// =============================================================================
// Reads
// =============================================================================

Amount CurrencyLedger::balance_locked(const PlayerEntry& entry, const Currency& currency) {
    auto it = entry.balances.find(currency.id);
    return it != entry.balances.end() ? it->second : currency.min_amount;
}

Amount CurrencyLedger::balance(const PlayerId& player, const CurrencyId& currency) const {
    const Currency* def = registry_.find(currency);
    if (!def)
        return 0;
    const PlayerEntry* entry = find_entry(player);
    if (!entry)
        return def->min_amount;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return balance_locked(*entry, *def);
}

std::map<CurrencyId, Amount> CurrencyLedger::balances(const PlayerId& player) const {
    std::map<CurrencyId, Amount> out;
    const PlayerEntry* entry = find_entry(player);
    std::unique_lock<std::mutex> lock;
    if (entry)
        lock = std::unique_lock<std::mutex>(entry->mutex);
    for (const Currency* c : registry_.all()) {
        out[c->id] = entry ? balance_locked(*entry, *c) : c->min_amount;
    }
    return out;
}

bool CurrencyLedger::can_afford(const PlayerId& player, const CurrencyId& currency, Amount amount) const {
    const Currency* def = registry_.find(currency);
    if (!def || amount < 0)
        return false;
    return balance(player, currency) - amount >= def->min_amount;
}

bool CurrencyLedger::can_exchange(const PlayerId& player, const CurrencyId& from, const CurrencyId& to,
                                  Amount amount) const {
    const Currency* src = registry_.find(from);
    const Currency* dst = registry_.find(to);
    if (!src || !dst || !src->is_tradeable || !dst->is_tradeable)
        return false;
    auto rate = rates_.find(from, to);
    if (!rate || !rate->is_active)
        return false;
    return amount > 0 && can_afford(player, from, amount) && quote_exchange(from, to, amount) > 0;
}

Amount CurrencyLedger::quote_exchange(const CurrencyId& from, const CurrencyId& to, Amount amount) const {
    auto rate = rates_.find(from, to);
    if (!rate || !rate->is_active || amount <= 0)
        return 0;
    return static_cast<Amount>(std::llround(static_cast<double>(amount) * rate->rate));
}

// =============================================================================
// Core mutations (entry.mutex held)
// =============================================================================

void CurrencyLedger::record_locked(PlayerEntry& entry, const Currency& currency, TransactionType type, Amount delta,
                                   const std::string& tag, Amount balance_after, Timestamp now) {
    Transaction tx;
    tx.sequence = ++next_sequence_;
    tx.type = type;
    tx.player = entry.player;
    tx.currency = currency.id;
    tx.amount = delta;
    tx.tag = tag;
    tx.timestamp = now;
    tx.balance_after = balance_after;

    auto ring = entry.history.find(currency.id);
    if (ring == entry.history.end()) {
        ring = entry.history.emplace(currency.id, TransactionRing(config_.player_ring_capacity)).first;
    }
    ring->second.push(tx);

    MarketHistory& market = market_for(currency.id);
    std::lock_guard<std::mutex> lock(market.mutex);
    market.ring.push(tx);
    if (delta > 0) {
        market.stats.total_earned += delta;
    } else {
        market.stats.total_spent += -delta;
    }
    market.stats.average_balance = (static_cast<double>(balance_after) + market.stats.average_balance) / 2.0;
    market.stats.transaction_count++;
    market.stats.last_updated = now;
}

EconomyResult CurrencyLedger::credit_locked(PlayerEntry& entry, const Currency& currency, Amount amount,
                                            TransactionType type, const std::string& tag, bool announce) {
    if (amount <= 0)
        return EconomyResult::InvalidAmount;

    Amount old_balance = balance_locked(entry, currency);
    // Excess above the ceiling is discarded
    Amount headroom = currency.max_amount - old_balance;
    Amount credited = amount < headroom ? amount : headroom;
    if (credited <= 0) {
        ECON_LOGF_DEBUG(logger_, LogCategory::Ledger, "%s %s at ceiling, credit of %lld dropped",
                        entry.player.c_str(), currency.id.c_str(), static_cast<long long>(amount));
        return EconomyResult::BalanceCapped;
    }

    Amount new_balance = old_balance + credited;
    entry.balances[currency.id] = new_balance;

    Timestamp now = clock_.now();
    record_locked(entry, currency, type, credited, tag, new_balance, now);

    bus_.publish(events::BalanceChanged{entry.player, currency.id, old_balance, new_balance}, now);
    if (type == TransactionType::Earn && announce) {
        bus_.publish(events::CurrencyEarned{entry.player, currency.id, credited, tag}, now);
    }
    return EconomyResult::Success;
}

EconomyResult CurrencyLedger::debit_locked(PlayerEntry& entry, const Currency& currency, Amount amount,
                                           const std::string& reason, const std::string& category, bool announce) {
    if (amount <= 0)
        return EconomyResult::InvalidAmount;

    Amount old_balance = balance_locked(entry, currency);
    if (old_balance - amount < currency.min_amount)
        return EconomyResult::InsufficientFunds;

    Amount new_balance = old_balance - amount;
    entry.balances[currency.id] = new_balance;

    Timestamp now = clock_.now();
    record_locked(entry, currency, TransactionType::Spend, -amount, reason, new_balance, now);

    bus_.publish(events::BalanceChanged{entry.player, currency.id, old_balance, new_balance}, now);
    if (announce) {
        bus_.publish(events::CurrencySpent{entry.player, currency.id, amount, reason, category}, now);
    }
    return EconomyResult::Success;
}

EconomyResult CurrencyLedger::exchange_locked(PlayerEntry& entry, const CurrencyId& from, const CurrencyId& to,
                                              Amount amount) {
    const Currency* src = registry_.find(from);
    const Currency* dst = registry_.find(to);
    if (!src || !dst)
        return EconomyResult::CurrencyUnknown;
    if (amount <= 0)
        return EconomyResult::InvalidAmount;

    auto rate = rates_.find(from, to);
    if (!rate || !rate->is_active || !src->is_tradeable || !dst->is_tradeable) {
        return EconomyResult::ExchangeUnavailable;
    }

    EconomyResult spent = debit_locked(entry, *src, amount, "exchange_to_" + to, "", false);
    if (spent != EconomyResult::Success)
        return spent;

    Amount converted = static_cast<Amount>(std::llround(static_cast<double>(amount) * rate->rate));
    if (converted <= 0) {
        EconomyResult refunded = credit_locked(entry, *src, amount, TransactionType::Refund, "exchange_refund");
        if (refunded != EconomyResult::Success) {
            ECON_LOGF_ERROR(logger_, LogCategory::Exchange, "refund of %lld %s to %s failed: %s",
                            static_cast<long long>(amount), from.c_str(), entry.player.c_str(),
                            economy_result_to_string(refunded));
        }
        return EconomyResult::ExchangeTooSmall;
    }

    EconomyResult credited = credit_locked(entry, *dst, converted, TransactionType::Exchange, "exchange_from_" + from);
    if (credited != EconomyResult::Success) {
        EconomyResult refunded = credit_locked(entry, *src, amount, TransactionType::Refund, "exchange_refund");
        if (refunded != EconomyResult::Success) {
            ECON_LOGF_ERROR(logger_, LogCategory::Exchange, "refund of %lld %s to %s failed: %s",
                            static_cast<long long>(amount), from.c_str(), entry.player.c_str(),
                            economy_result_to_string(refunded));
        }
        return credited;
    }

    bus_.publish(events::CurrencyExchanged{entry.player, from, to, amount, converted, rate->rate}, clock_.now());
    ECON_LOGF_DEBUG(logger_, LogCategory::Exchange, "%s exchanged %lld %s -> %lld %s @ %.4f", entry.player.c_str(),
                    static_cast<long long>(amount), from.c_str(), static_cast<long long>(converted), to.c_str(),
                    rate->rate);
    return EconomyResult::Success;
}

// =============================================================================
// Public mutations
// =============================================================================

EconomyResult CurrencyLedger::earn(const PlayerId& player, const CurrencyId& currency, Amount amount,
                                   const std::string& source) {
    return with_wallet(player, [&](WalletSession& w) { return w.earn(currency, amount, source); });
}

EconomyResult CurrencyLedger::spend(const PlayerId& player, const CurrencyId& currency, Amount amount,
                                    const std::string& reason) {
    return with_wallet(player, [&](WalletSession& w) { return w.spend(currency, amount, reason); });
}

EconomyResult CurrencyLedger::exchange(const PlayerId& player, const CurrencyId& from, const CurrencyId& to,
                                       Amount amount) {
    PlayerEntry& entry = entry_for(player);
    std::lock_guard<std::mutex> lock(entry.mutex);
    return exchange_locked(entry, from, to, amount);
}

// =============================================================================
// WalletSession
// =============================================================================

const PlayerId& CurrencyLedger::WalletSession::player() const {
    return entry_.player;
}

Amount CurrencyLedger::WalletSession::balance(const CurrencyId& currency) const {
    const Currency* def = ledger_.registry_.find(currency);
    return def ? balance_locked(entry_, *def) : 0;
}

EconomyResult CurrencyLedger::WalletSession::earn(const CurrencyId& currency, Amount amount,
                                                  const std::string& source, bool announce) {
    const Currency* def = ledger_.registry_.find(currency);
    if (!def)
        return EconomyResult::CurrencyUnknown;
    return ledger_.credit_locked(entry_, *def, amount, TransactionType::Earn, source, announce);
}

EconomyResult CurrencyLedger::WalletSession::spend(const CurrencyId& currency, Amount amount,
                                                   const std::string& reason, const std::string& category,
                                                   bool announce) {
    const Currency* def = ledger_.registry_.find(currency);
    if (!def)
        return EconomyResult::CurrencyUnknown;
    return ledger_.debit_locked(entry_, *def, amount, reason, category, announce);
}

EconomyResult CurrencyLedger::WalletSession::refund(const CurrencyId& currency, Amount amount,
                                                    const std::string& tag) {
    const Currency* def = ledger_.registry_.find(currency);
    if (!def)
        return EconomyResult::CurrencyUnknown;
    return ledger_.credit_locked(entry_, *def, amount, TransactionType::Refund, tag);
}

// =============================================================================
// History
// =============================================================================

std::vector<Transaction> CurrencyLedger::transactions(const PlayerId& player, const CurrencyId& currency) const {
    const PlayerEntry* entry = find_entry(player);
    if (!entry)
        return {};
    std::lock_guard<std::mutex> lock(entry->mutex);
    auto it = entry->history.find(currency);
    return it != entry->history.end() ? it->second.snapshot() : std::vector<Transaction>{};
}

std::vector<Transaction> CurrencyLedger::recent_market_transactions(const CurrencyId& currency, size_t n) const {
    std::shared_lock map_lock(markets_mutex_);
    auto it = markets_.find(currency);
    if (it == markets_.end())
        return {};
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->ring.recent(n);
}

size_t CurrencyLedger::market_transaction_count(const CurrencyId& currency) const {
    std::shared_lock map_lock(markets_mutex_);
    auto it = markets_.find(currency);
    if (it == markets_.end())
        return 0;
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->ring.size();
}

CurrencyStats CurrencyLedger::currency_stats(const CurrencyId& currency) const {
    std::shared_lock map_lock(markets_mutex_);
    auto it = markets_.find(currency);
    if (it == markets_.end())
        return {};
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->stats;
}

std::vector<PlayerId> CurrencyLedger::players() const {
    std::shared_lock lock(players_mutex_);
    std::vector<PlayerId> out;
    out.reserve(players_.size());
    for (const auto& [id, entry] : players_) {
        out.push_back(id);
    }
    return out;
}

size_t CurrencyLedger::player_count() const {
    std::shared_lock lock(players_mutex_);
    return players_.size();
}

// =============================================================================
// Persistence
// =============================================================================

nlohmann::json CurrencyLedger::to_json() const {
    nlohmann::json players = nlohmann::json::object();
    {
        std::shared_lock lock(players_mutex_);
        for (const auto& [id, entry] : players_) {
            std::lock_guard<std::mutex> entry_lock(entry->mutex);
            nlohmann::json history = nlohmann::json::object();
            for (const auto& [currency, ring] : entry->history) {
                history[currency] = ring.snapshot();
            }
            players[id] = {{"balances", entry->balances}, {"history", history}};
        }
    }

    nlohmann::json markets = nlohmann::json::object();
    {
        std::shared_lock lock(markets_mutex_);
        for (const auto& [currency, market] : markets_) {
            std::lock_guard<std::mutex> market_lock(market->mutex);
            markets[currency] = {{"stats", market->stats}, {"history", market->ring.snapshot()}};
        }
    }

    return {{"next_sequence", next_sequence_.load()}, {"players", players}, {"markets", markets}};
}

void CurrencyLedger::from_json(const nlohmann::json& j) {
    try {
        std::map<PlayerId, std::unique_ptr<PlayerEntry>> players;
        for (const auto& [id, pj] : j.at("players").items()) {
            auto entry = std::make_unique<PlayerEntry>(id);
            for (const auto& [currency, amount_json] : pj.at("balances").items()) {
                const Currency* def = registry_.find(currency);
                if (!def) {
                    throw SnapshotError("balance for unknown currency '" + currency + "'");
                }
                Amount amount = amount_json.get<Amount>();
                if (!def->contains(amount)) {
                    throw SnapshotError("balance " + std::to_string(amount) + " of '" + currency +
                                        "' outside bounds for player '" + id + "'");
                }
                entry->balances[currency] = amount;
            }
            for (const auto& [currency, txs] : pj.at("history").items()) {
                TransactionRing ring(config_.player_ring_capacity);
                for (const auto& tx : txs) {
                    ring.push(tx.get<Transaction>());
                }
                entry->history.emplace(currency, std::move(ring));
            }
            players.emplace(id, std::move(entry));
        }

        std::map<CurrencyId, std::unique_ptr<MarketHistory>> markets;
        for (const auto& id : registry_.ids()) {
            markets.emplace(id, std::make_unique<MarketHistory>(config_.market_ring_capacity));
        }
        for (const auto& [currency, mj] : j.at("markets").items()) {
            if (!registry_.contains(currency)) {
                throw SnapshotError("market history for unknown currency '" + currency + "'");
            }
            auto& market = markets[currency];
            market->stats = mj.at("stats").get<CurrencyStats>();
            for (const auto& tx : mj.at("history")) {
                market->ring.push(tx.get<Transaction>());
            }
        }

        std::unique_lock players_lock(players_mutex_);
        std::unique_lock markets_lock(markets_mutex_);
        players_ = std::move(players);
        markets_ = std::move(markets);
        next_sequence_.store(j.at("next_sequence").get<Sequence>());
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("ledger: ") + e.what());
    }

    ECON_LOGF_INFO(logger_, LogCategory::Persistence, "ledger restored: %zu players", player_count());
}

} // namespace economy
} // namespace econ
