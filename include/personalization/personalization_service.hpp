#pragma once

/**
 * PersonalizationService - asks the remote collaborator for advice and
 * turns a price factor into a bounded timed discount.
 *
 *   discount = (1 - factor) * 100, clamped to [0, max_personal_discount]
 *   factor >= 1 (or not a number) is ignored
 *
 * The remote call happens with no economy lock held.
 */

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../pricing/pricing_engine.hpp"
#include "../profile/profile_store.hpp"
#include "personalization_client.hpp"

#include <optional>
#include <string>

namespace econ {
namespace personalization {

struct PersonalizationConfig {
    double max_personal_discount_pct = config::personalization::MAX_PERSONAL_DISCOUNT_PCT;
    int32_t offer_duration_hours = config::personalization::OFFER_DURATION_HOURS;
};

struct OfferDecision {
    bool advised = false; // remote answered
    bool applied = false; // a discount window was started
    double discount_percent = 0.0;
    std::optional<OfferType> offer;
    EconomyResult result = EconomyResult::Success;
};

class PersonalizationService {
public:
    PersonalizationService(PersonalizationClient& client, const profile::PlayerProfileStore& profiles,
                           pricing::PricingEngine& pricing, PersonalizationConfig config = {},
                           logging::AsyncLogger* logger = nullptr)
        : client_(client), profiles_(profiles), pricing_(pricing), config_(config), logger_(logger) {}

    // Discount implied by a factor; nullopt when the factor must be ignored
    static std::optional<double> discount_for_factor(double factor, double max_discount_pct) {
        if (!(factor < 1.0))
            return std::nullopt;
        double pct = (1.0 - factor) * 100.0;
        if (pct > max_discount_pct)
            pct = max_discount_pct;
        return pct;
    }

    PersonalizationContext build_context(const PlayerId& player, const ItemId& item, const std::string& action) const {
        PersonalizationContext ctx;
        ctx.player = player;
        ctx.item = item;
        ctx.action = action;
        if (auto p = profiles_.profile(player)) {
            ctx.segment = p->segment;
            ctx.recent_spend = p->total_spent;
            ctx.churn_risk = p->churn_risk;
        }
        return ctx;
    }

    OfferDecision request_offer(const PlayerId& player, const ItemId& item, const std::string& action) {
        OfferDecision decision;
        if (!pricing_.item(item)) {
            decision.result = EconomyResult::ItemUnknown;
            return decision;
        }

        auto advice = client_.request(build_context(player, item, action));
        if (!advice)
            return decision;
        decision.advised = true;
        decision.offer = advice->offer;

        if (!advice->price_factor)
            return decision;
        auto pct = discount_for_factor(*advice->price_factor, config_.max_personal_discount_pct);
        if (!pct || *pct <= 0.0) {
            ECON_LOGF_DEBUG(logger_, logging::LogCategory::Personalization, "factor %.3f for %s ignored",
                            *advice->price_factor, item.c_str());
            return decision;
        }

        decision.result = pricing_.apply_timed_discount(item, *pct, config_.offer_duration_hours);
        decision.applied = decision.result == EconomyResult::Success;
        decision.discount_percent = decision.applied ? *pct : 0.0;
        ECON_LOGF_INFO(logger_, logging::LogCategory::Personalization, "%s: %.1f%% offer on %s (%s)", player.c_str(),
                       *pct, item.c_str(), economy_result_to_string(decision.result));
        return decision;
    }

private:
    PersonalizationClient& client_;
    const profile::PlayerProfileStore& profiles_;
    pricing::PricingEngine& pricing_;
    PersonalizationConfig config_;
    logging::AsyncLogger* logger_;
};

} // namespace personalization
} // namespace econ
