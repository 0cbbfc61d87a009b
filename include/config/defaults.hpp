#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Centralized configuration defaults for the economy core.
 *
 * All default values are defined here to avoid duplication across:
 * - EconomyConfig (catalog "economy" section)
 * - CurrencyLedger / InflationController / PlayerProfileStore
 * - PricingEngine and the personalization path
 *
 * Naming:
 * - _PCT suffix: percentage as decimal (0.10 = 10%)
 * - _NS suffix: simulated nanoseconds
 * - _DAYS suffix: whole days
 */

namespace econ::config {

// =============================================================================
// Time
// =============================================================================
namespace time {
constexpr uint64_t NS_PER_SECOND = 1'000'000'000ULL;
constexpr uint64_t NS_PER_MINUTE = 60 * NS_PER_SECOND;
constexpr uint64_t NS_PER_HOUR = 60 * NS_PER_MINUTE;
constexpr uint64_t NS_PER_DAY = 24 * NS_PER_HOUR;
} // namespace time

// =============================================================================
// Transaction History
// =============================================================================
namespace history {
// Per player, per currency ring
constexpr size_t PLAYER_RING_CAPACITY = 100;

// Economy-wide ring per currency (inflation input)
constexpr size_t MARKET_RING_CAPACITY = 1000;
} // namespace history

// =============================================================================
// Inflation Control
// =============================================================================
namespace inflation {
constexpr uint64_t CYCLE_INTERVAL_NS = 60 * time::NS_PER_SECOND;

// Minimum transactions before a currency is evaluated
constexpr size_t MIN_TRANSACTIONS = 10;

// Window of most recent transactions used for the rate
constexpr size_t WINDOW = 10;

// |rate| above this triggers an adjustment (hysteresis band)
constexpr double THRESHOLD = 0.10;

// Step = min(MAX_STEP_PCT, |rate| * GAIN)
constexpr double GAIN = 0.5;
constexpr double MAX_STEP_PCT = 0.30;

// Sink/source multiplier clamp
constexpr double MULTIPLIER_MIN = 0.5;
constexpr double MULTIPLIER_MAX = 2.0;

// Exchange rate drift per cycle (+/-)
constexpr double RATE_DRIFT_PCT = 0.05;
} // namespace inflation

// =============================================================================
// Player Profiles
// =============================================================================
namespace profile {
constexpr uint64_t SWEEP_INTERVAL_NS = 300 * time::NS_PER_SECOND;

// Segment thresholds on total hard-currency spend
constexpr double CASUAL_BELOW = 10.0;
constexpr double REGULAR_BELOW = 100.0;

constexpr int32_t CHURNED_AFTER_DAYS = 30;
constexpr int32_t DORMANT_AFTER_DAYS = 14;
constexpr int32_t IDLE_AFTER_DAYS = 7;

// Engagement weights
constexpr double PURCHASE_POINTS = 10.0;
constexpr double PURCHASE_POINTS_CAP = 50.0;
constexpr double REWARD_POINTS = 2.0;
constexpr double REWARD_POINTS_CAP = 20.0;
constexpr double RECENT_DAY_BONUS = 20.0;
constexpr double RECENT_WEEK_BONUS = 10.0;
constexpr double FREQUENCY_BONUS = 10.0;

// Churn weights
constexpr double CHURNED_RISK = 50.0;
constexpr double DORMANT_RISK = 30.0;
constexpr double IDLE_RISK = 15.0;
constexpr double LOW_ENGAGEMENT_BELOW = 20.0;
constexpr double LOW_ENGAGEMENT_RISK = 30.0;
constexpr double LOW_SPEND_BELOW = 5.0;
constexpr double LOW_SPEND_RISK = 20.0;

constexpr double SCORE_MAX = 100.0;
} // namespace profile

// =============================================================================
// Pricing
// =============================================================================
namespace pricing {
constexpr uint64_t DISCOUNT_SWEEP_INTERVAL_NS = 60 * time::NS_PER_SECOND;

constexpr double MAX_DISCOUNT_PCT = 95.0;

// Listed cost never drops below one unit
constexpr int64_t MIN_COST = 1;

constexpr int32_t DEFAULT_PLAYER_LEVEL = 1;
} // namespace pricing

// =============================================================================
// Personalization (remote collaborator)
// =============================================================================
namespace personalization {
// Largest discount a remote price factor may imply (50%)
constexpr double MAX_PERSONAL_DISCOUNT_PCT = 50.0;
constexpr int32_t OFFER_DURATION_HOURS = 24;

constexpr long CONNECT_TIMEOUT_S = 5;
constexpr long REQUEST_TIMEOUT_S = 10;
} // namespace personalization

// =============================================================================
// Scheduler
// =============================================================================
namespace scheduler {
constexpr uint64_t DISPATCH_INTERVAL_NS = 1 * time::NS_PER_SECOND;

// Real-time driver poll period
constexpr uint32_t DRIVER_SLEEP_MS = 50;
} // namespace scheduler

} // namespace econ::config
