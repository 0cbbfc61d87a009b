#pragma once

/**
 * Player economic profile and its derived scores
 *
 * Raw counters are updated by PlayerProfileStore; engagement, churn risk and
 * segment are pure functions of those counters plus the current time, so a
 * sweep can recompute them without any new event.
 */

#include "../config/defaults.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <algorithm>
#include <map>
#include <string>

namespace econ {
namespace profile {

enum class Segment : uint8_t { New = 0, Casual, Regular, Whale, Churned };

inline const char* segment_to_string(Segment s) {
    switch (s) {
    case Segment::New:
        return "New";
    case Segment::Casual:
        return "Casual";
    case Segment::Regular:
        return "Regular";
    case Segment::Whale:
        return "Whale";
    case Segment::Churned:
        return "Churned";
    }
    return "Unknown";
}

inline Segment segment_from_string(const std::string& s) {
    if (s == "New")
        return Segment::New;
    if (s == "Casual")
        return Segment::Casual;
    if (s == "Regular")
        return Segment::Regular;
    if (s == "Whale")
        return Segment::Whale;
    if (s == "Churned")
        return Segment::Churned;
    throw SnapshotError("unknown segment: " + s);
}

enum class ProfileEventType : uint8_t {
    CurrencyEarned = 0,
    CurrencySpent,
    ItemPurchased,
    RewardClaimed,
    SessionActivity,
    ItemViewed
};

inline const char* profile_event_to_string(ProfileEventType type) {
    switch (type) {
    case ProfileEventType::CurrencyEarned:
        return "currency_earned";
    case ProfileEventType::CurrencySpent:
        return "currency_spent";
    case ProfileEventType::ItemPurchased:
        return "item_purchased";
    case ProfileEventType::RewardClaimed:
        return "reward_claimed";
    case ProfileEventType::SessionActivity:
        return "session_activity";
    case ProfileEventType::ItemViewed:
        return "item_viewed";
    }
    return "unknown";
}

// Context attached to a profile event; unused fields stay empty
struct EventTags {
    CurrencyId currency;
    bool hard_currency = false;
    std::string category;
    ItemId item;
    std::string reward_id;
};

struct PlayerProfile {
    PlayerId player;

    // Raw counters
    Amount total_spent = 0; // hard currency only
    Amount total_earned = 0;
    uint32_t purchase_count = 0;
    uint32_t rewards_claimed = 0;
    Timestamp first_purchase = 0; // 0 = never
    Timestamp last_purchase = 0;
    Timestamp last_active = 0;
    std::map<std::string, Amount> spend_by_category;

    // Derived
    double average_purchase_value = 0.0;
    double purchase_frequency = 0.0; // purchases per day
    double lifetime_value = 0.0;
    double engagement_score = 0.0;
    double churn_risk = 0.0;
    Segment segment = Segment::New;

    bool has_purchased() const { return purchase_count > 0; }
};

// ============================================================================
// Scoring (pure)
// ============================================================================

inline double days_inactive(const PlayerProfile& p, Timestamp now) {
    return util::ns_to_days(util::elapsed_ns(p.last_active, now));
}

inline double purchase_frequency(const PlayerProfile& p) {
    if (p.first_purchase == 0 || p.purchase_count == 0)
        return 0.0;
    double days = util::ns_to_days(util::elapsed_ns(p.first_purchase, p.last_active));
    if (days <= 0.0)
        return 0.0;
    return static_cast<double>(p.purchase_count) / days;
}

inline double engagement_score(const PlayerProfile& p, Timestamp now) {
    using namespace config::profile;
    double score = 0.0;
    score += std::min(p.purchase_count * PURCHASE_POINTS, PURCHASE_POINTS_CAP);
    score += std::min(p.rewards_claimed * REWARD_POINTS, REWARD_POINTS_CAP);

    double idle = days_inactive(p, now);
    if (idle < 1.0) {
        score += RECENT_DAY_BONUS;
    } else if (idle < IDLE_AFTER_DAYS) {
        score += RECENT_WEEK_BONUS;
    }

    if (p.purchase_frequency > 1.0)
        score += FREQUENCY_BONUS;

    return std::clamp(score, 0.0, SCORE_MAX);
}

inline double churn_risk(const PlayerProfile& p, Timestamp now) {
    using namespace config::profile;
    double risk = 0.0;

    double idle = days_inactive(p, now);
    if (idle > CHURNED_AFTER_DAYS) {
        risk += CHURNED_RISK;
    } else if (idle > DORMANT_AFTER_DAYS) {
        risk += DORMANT_RISK;
    } else if (idle > IDLE_AFTER_DAYS) {
        risk += IDLE_RISK;
    }

    if (p.engagement_score < LOW_ENGAGEMENT_BELOW)
        risk += LOW_ENGAGEMENT_RISK;
    if (static_cast<double>(p.total_spent) < LOW_SPEND_BELOW)
        risk += LOW_SPEND_RISK;

    return std::clamp(risk, 0.0, SCORE_MAX);
}

inline Segment classify_segment(const PlayerProfile& p, Timestamp now) {
    using namespace config::profile;
    if (days_inactive(p, now) > CHURNED_AFTER_DAYS)
        return Segment::Churned;

    double spent = static_cast<double>(p.total_spent);
    if (p.total_spent == 0)
        return Segment::New;
    if (spent < CASUAL_BELOW)
        return Segment::Casual;
    if (spent < REGULAR_BELOW)
        return Segment::Regular;
    return Segment::Whale;
}

// Recompute every derived field; engagement feeds churn so order matters
inline void recompute(PlayerProfile& p, Timestamp now) {
    p.average_purchase_value =
        p.purchase_count > 0 ? static_cast<double>(p.total_spent) / static_cast<double>(p.purchase_count) : 0.0;
    p.purchase_frequency = purchase_frequency(p);
    p.lifetime_value = static_cast<double>(p.total_spent);
    p.engagement_score = engagement_score(p, now);
    p.churn_risk = churn_risk(p, now);
    p.segment = classify_segment(p, now);
}

} // namespace profile
} // namespace econ
