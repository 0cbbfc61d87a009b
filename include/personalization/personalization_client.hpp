#pragma once

/**
 * Remote personalization contract
 *
 * The core sends a read-only context bundle and may get back a price
 * factor and/or an offer type. Advice is only ever applied through
 * PricingEngine::apply_timed_discount, so it cannot bypass affordability
 * or price bounds.
 *
 * Wire format (JSON):
 *   request  {"player","segment","recent_spend","churn_risk","action","item"}
 *   response {"price_factor": 0.8, "offer_type": "retention"}  (both optional)
 */

#include "../profile/player_profile.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace econ {
namespace personalization {

enum class OfferType : uint8_t { Discount = 0, Bundle, Retention, FirstPurchase, Upsell };

inline const char* offer_type_to_string(OfferType t) {
    switch (t) {
    case OfferType::Discount:
        return "discount";
    case OfferType::Bundle:
        return "bundle";
    case OfferType::Retention:
        return "retention";
    case OfferType::FirstPurchase:
        return "first_purchase";
    case OfferType::Upsell:
        return "upsell";
    }
    return "unknown";
}

inline std::optional<OfferType> offer_type_from_string(const std::string& s) {
    if (s == "discount")
        return OfferType::Discount;
    if (s == "bundle")
        return OfferType::Bundle;
    if (s == "retention")
        return OfferType::Retention;
    if (s == "first_purchase")
        return OfferType::FirstPurchase;
    if (s == "upsell")
        return OfferType::Upsell;
    return std::nullopt;
}

struct PersonalizationContext {
    PlayerId player;
    profile::Segment segment = profile::Segment::New;
    Amount recent_spend = 0;
    double churn_risk = 0.0;
    std::string action; // e.g. "view_shop", "session_start"
    ItemId item;
};

struct PersonalizationAdvice {
    std::optional<double> price_factor; // 0.8 = pay 80%
    std::optional<OfferType> offer;
};

inline nlohmann::json context_to_json(const PersonalizationContext& ctx) {
    return {{"player", ctx.player},
            {"segment", profile::segment_to_string(ctx.segment)},
            {"recent_spend", ctx.recent_spend},
            {"churn_risk", ctx.churn_risk},
            {"action", ctx.action},
            {"item", ctx.item}};
}

// Unknown offer types and non-numeric factors are dropped, not errors
inline PersonalizationAdvice advice_from_json(const nlohmann::json& j) {
    PersonalizationAdvice advice;
    if (!j.is_object())
        return advice;
    auto factor = j.find("price_factor");
    if (factor != j.end() && factor->is_number()) {
        advice.price_factor = factor->get<double>();
    }
    auto offer = j.find("offer_type");
    if (offer != j.end() && offer->is_string()) {
        advice.offer = offer_type_from_string(offer->get<std::string>());
    }
    return advice;
}

class PersonalizationClient {
public:
    virtual ~PersonalizationClient() = default;

    // nullopt when the service is unreachable or has no advice
    virtual std::optional<PersonalizationAdvice> request(const PersonalizationContext& context) = 0;
};

} // namespace personalization
} // namespace econ
