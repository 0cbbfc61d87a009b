#pragma once

/**
 * InflationController - discrete-time feedback loop over currency flow
 *
 * Each cycle, per currency with enough economy-wide history:
 *   rate = (earned - spent) / spent over the last `window` transactions
 *   rate >  +threshold  -> sink multiplier up, source multiplier down
 *   rate <  -threshold  -> the reverse
 * step = min(max_step, |rate| * gain); multipliers stay in [min, max].
 *
 * Every active exchange rate also drifts by a bounded random delta and is
 * re-clamped to its band by the rate table.
 *
 * Cycles are idempotent: run_cycle(n) twice computes both times from the
 * values stored before cycle n started, and the drift RNG is reseeded from
 * (seed, n), so the second call reproduces the first.
 */

#include "../config/defaults.hpp"
#include "../economy/currency_ledger.hpp"
#include "../economy/exchange_rates.hpp"
#include "../events/event_bus.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace econ {
namespace inflation {

struct InflationConfig {
    size_t min_transactions = config::inflation::MIN_TRANSACTIONS;
    size_t window = config::inflation::WINDOW;
    double threshold = config::inflation::THRESHOLD;
    double gain = config::inflation::GAIN;
    double max_step = config::inflation::MAX_STEP_PCT;
    double multiplier_min = config::inflation::MULTIPLIER_MIN;
    double multiplier_max = config::inflation::MULTIPLIER_MAX;
    double rate_drift = config::inflation::RATE_DRIFT_PCT;
    uint64_t seed = 0; // 0 = seed from std::random_device
};

struct Multipliers {
    double sink = 1.0;   // scales shop costs
    double source = 1.0; // scales currency rewards
};

enum class Pressure : uint8_t { Neutral = 0, Inflation, Deflation };

inline const char* pressure_to_string(Pressure p) {
    switch (p) {
    case Pressure::Neutral:
        return "neutral";
    case Pressure::Inflation:
        return "inflation";
    case Pressure::Deflation:
        return "deflation";
    }
    return "unknown";
}

struct CycleReport {
    uint64_t cycle = 0;
    size_t currencies_checked = 0;
    size_t currencies_adjusted = 0;
    size_t rates_drifted = 0;
};

class InflationController {
public:
    using AdjustmentCallback = std::function<void(const CurrencyId&, double sink, double source)>;

    InflationController(const economy::CurrencyLedger& ledger, economy::ExchangeRateTable& rates,
                        events::EventBus& bus, const util::Clock& clock, InflationConfig config = {},
                        logging::AsyncLogger* logger = nullptr);

    InflationController(const InflationController&) = delete;
    InflationController& operator=(const InflationController&) = delete;

    void set_adjustment_callback(AdjustmentCallback callback);

    // Run (or re-run) cycle number `cycle`
    CycleReport run_cycle(uint64_t cycle);

    // Next cycle after the last one run; used by the scheduler
    CycleReport run_next_cycle();

    // (earned - spent) / spent; 0 when nothing was spent
    static double compute_inflation_rate(const std::vector<economy::Transaction>& window);
    Pressure classify(double rate) const;

    // Last computed rate; 0 for currencies never evaluated
    double inflation_rate(const CurrencyId& currency) const;
    Multipliers multipliers(const CurrencyId& currency) const;
    std::map<CurrencyId, Multipliers> all_multipliers() const;

    uint64_t last_cycle() const;
    const InflationConfig& config() const { return config_; }

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j); // throws SnapshotError

private:
    struct CurrencyState {
        Multipliers current;
        Multipliers before_cycle;
        uint64_t cycle = 0; // cycle that produced `current`
        double inflation_rate = 0.0;
    };

    const economy::CurrencyLedger& ledger_;
    economy::ExchangeRateTable& rates_;
    events::EventBus& bus_;
    const util::Clock& clock_;
    InflationConfig config_;
    logging::AsyncLogger* logger_;
    uint64_t seed_;

    mutable std::mutex mutex_;
    std::map<CurrencyId, CurrencyState> state_;
    uint64_t last_cycle_ = 0;
    uint64_t drift_cycle_ = 0;
    std::map<economy::ExchangeRateTable::Key, double> rates_before_drift_;
    AdjustmentCallback callback_;

    Multipliers step(const Multipliers& base, Pressure pressure, double rate) const;
    size_t drift_rates(uint64_t cycle, Timestamp now);
    bool in_band(const Multipliers& m) const;
};

} // namespace inflation
} // namespace econ
