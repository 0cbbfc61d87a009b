#include "../../include/inflation/inflation_controller.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace econ {
namespace inflation {

namespace LogCategory = logging::LogCategory;

InflationController::InflationController(const economy::CurrencyLedger& ledger, economy::ExchangeRateTable& rates,
                                         events::EventBus& bus, const util::Clock& clock, InflationConfig config,
                                         logging::AsyncLogger* logger)
    : ledger_(ledger), rates_(rates), bus_(bus), clock_(clock), config_(config), logger_(logger),
      seed_(config.seed != 0 ? config.seed : std::random_device{}()) {}

void InflationController::set_adjustment_callback(AdjustmentCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

double InflationController::compute_inflation_rate(const std::vector<economy::Transaction>& window) {
    Amount earned = 0;
    Amount spent = 0;
    for (const auto& tx : window) {
        if (tx.is_inflow()) {
            earned += tx.amount;
        } else if (tx.is_outflow()) {
            spent += -tx.amount;
        }
    }
    if (spent == 0)
        return 0.0;
    return static_cast<double>(earned - spent) / static_cast<double>(spent);
}

Pressure InflationController::classify(double rate) const {
    if (rate > config_.threshold)
        return Pressure::Inflation;
    if (rate < -config_.threshold)
        return Pressure::Deflation;
    return Pressure::Neutral;
}

Multipliers InflationController::step(const Multipliers& base, Pressure pressure, double rate) const {
    double size = std::min(config_.max_step, std::abs(rate) * config_.gain);
    Multipliers out = base;
    if (pressure == Pressure::Inflation) {
        out.sink = base.sink * (1.0 + size);
        out.source = base.source * (1.0 - size);
    } else if (pressure == Pressure::Deflation) {
        out.sink = base.sink * (1.0 - size);
        out.source = base.source * (1.0 + size);
    }
    out.sink = std::clamp(out.sink, config_.multiplier_min, config_.multiplier_max);
    out.source = std::clamp(out.source, config_.multiplier_min, config_.multiplier_max);
    return out;
}

// =============================================================================
// Cycle
// =============================================================================

CycleReport InflationController::run_cycle(uint64_t cycle) {
    CycleReport report;
    report.cycle = cycle;
    Timestamp now = clock_.now();

    struct Adjustment {
        CurrencyId currency;
        double rate;
        Multipliers applied;
    };
    std::vector<Adjustment> adjustments;

    for (const auto& currency : ledger_.registry().ids()) {
        // Market history is read before taking our own lock
        if (ledger_.market_transaction_count(currency) < config_.min_transactions)
            continue;
        auto window = ledger_.recent_market_transactions(currency, config_.window);
        double rate = compute_inflation_rate(window);
        Pressure pressure = classify(rate);
        report.currencies_checked++;

        std::lock_guard<std::mutex> lock(mutex_);
        CurrencyState& s = state_[currency];
        if (s.cycle != cycle) {
            s.before_cycle = s.current;
            s.cycle = cycle;
        }
        s.inflation_rate = rate;
        Multipliers next = step(s.before_cycle, pressure, rate);
        bool changed = next.sink != s.current.sink || next.source != s.current.source;
        s.current = next;

        if (pressure != Pressure::Neutral || changed) {
            adjustments.push_back({currency, rate, next});
        }
    }

    report.rates_drifted = drift_rates(cycle, now);

    AdjustmentCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_cycle_ = std::max(last_cycle_, cycle);
        callback = callback_;
    }

    for (const auto& adj : adjustments) {
        if (callback) {
            callback(adj.currency, adj.applied.sink, adj.applied.source);
        }
        bus_.publish(events::MultipliersAdjusted{adj.currency, adj.rate, adj.applied.sink, adj.applied.source}, now);
        ECON_LOGF_INFO(logger_, LogCategory::Inflation, "cycle %llu %s rate=%.3f (%s) sink=%.3f source=%.3f",
                       static_cast<unsigned long long>(cycle), adj.currency.c_str(), adj.rate,
                       pressure_to_string(classify(adj.rate)), adj.applied.sink, adj.applied.source);
    }
    report.currencies_adjusted = adjustments.size();
    return report;
}

CycleReport InflationController::run_next_cycle() {
    uint64_t next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next = last_cycle_ + 1;
    }
    return run_cycle(next);
}

size_t InflationController::drift_rates(uint64_t cycle, Timestamp now) {
    if (config_.rate_drift <= 0.0)
        return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    bool rerun = cycle == drift_cycle_ && !rates_before_drift_.empty();
    if (!rerun) {
        rates_before_drift_.clear();
        for (const auto& r : rates_.all()) {
            rates_before_drift_[{r.from, r.to}] = r.rate;
        }
        drift_cycle_ = cycle;
    }

    std::mt19937_64 rng(seed_ ^ (cycle * 0x9E3779B97F4A7C15ULL));
    std::uniform_real_distribution<double> delta(-config_.rate_drift, config_.rate_drift);
    size_t drifted = 0;
    rates_.update_all(
        [&](const economy::ExchangeRate& r) {
            auto it = rates_before_drift_.find({r.from, r.to});
            double base = it != rates_before_drift_.end() ? it->second : r.rate;
            ++drifted;
            return base * (1.0 + delta(rng));
        },
        now);
    return drifted;
}

// =============================================================================
// Reads
// =============================================================================

double InflationController::inflation_rate(const CurrencyId& currency) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.find(currency);
    return it != state_.end() ? it->second.inflation_rate : 0.0;
}

Multipliers InflationController::multipliers(const CurrencyId& currency) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.find(currency);
    return it != state_.end() ? it->second.current : Multipliers{};
}

std::map<CurrencyId, Multipliers> InflationController::all_multipliers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<CurrencyId, Multipliers> out;
    for (const auto& [id, s] : state_) {
        out[id] = s.current;
    }
    return out;
}

uint64_t InflationController::last_cycle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_cycle_;
}

// =============================================================================
// Persistence
// =============================================================================

bool InflationController::in_band(const Multipliers& m) const {
    return m.sink >= config_.multiplier_min && m.sink <= config_.multiplier_max &&
           m.source >= config_.multiplier_min && m.source <= config_.multiplier_max;
}

nlohmann::json InflationController::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json currencies = nlohmann::json::object();
    for (const auto& [id, s] : state_) {
        currencies[id] = {{"sink", s.current.sink},
                          {"source", s.current.source},
                          {"before_sink", s.before_cycle.sink},
                          {"before_source", s.before_cycle.source},
                          {"inflation_rate", s.inflation_rate},
                          {"cycle", s.cycle}};
    }
    nlohmann::json pre_drift = nlohmann::json::array();
    for (const auto& [key, rate] : rates_before_drift_) {
        pre_drift.push_back({{"from", key.first}, {"to", key.second}, {"rate", rate}});
    }
    return {{"last_cycle", last_cycle_},
            {"currencies", currencies},
            {"drift_cycle", drift_cycle_},
            {"rates_before_drift", pre_drift}};
}

void InflationController::from_json(const nlohmann::json& j) {
    std::map<CurrencyId, CurrencyState> restored;
    std::map<economy::ExchangeRateTable::Key, double> pre_drift;
    uint64_t last_cycle = 0;
    uint64_t drift_cycle = 0;
    try {
        last_cycle = j.at("last_cycle").get<uint64_t>();
        drift_cycle = j.value("drift_cycle", uint64_t{0});
        if (j.contains("rates_before_drift")) {
            for (const auto& rj : j.at("rates_before_drift")) {
                pre_drift[{rj.at("from").get<CurrencyId>(), rj.at("to").get<CurrencyId>()}] =
                    rj.at("rate").get<double>();
            }
        }
        for (const auto& [id, cj] : j.at("currencies").items()) {
            if (!ledger_.registry().contains(id)) {
                throw SnapshotError("multipliers for unknown currency '" + id + "'");
            }
            CurrencyState s;
            s.current.sink = cj.at("sink").get<double>();
            s.current.source = cj.at("source").get<double>();
            s.inflation_rate = cj.at("inflation_rate").get<double>();
            s.cycle = cj.at("cycle").get<uint64_t>();
            // Reruns of `cycle` step from these; older snapshots lack them
            s.before_cycle.sink = cj.value("before_sink", s.current.sink);
            s.before_cycle.source = cj.value("before_source", s.current.source);
            if (!in_band(s.current) || !in_band(s.before_cycle)) {
                throw SnapshotError("multipliers for '" + id + "' outside configured band");
            }
            restored.emplace(id, s);
        }
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("inflation: ") + e.what());
    }

    AdjustmentCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = std::move(restored);
        last_cycle_ = last_cycle;
        drift_cycle_ = drift_cycle;
        rates_before_drift_ = std::move(pre_drift);
        callback = callback_;
    }
    if (callback) {
        for (const auto& [id, m] : all_multipliers()) {
            callback(id, m.sink, m.source);
        }
    }
}

} // namespace inflation
} // namespace econ
