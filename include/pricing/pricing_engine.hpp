#pragma once

/**
 * PricingEngine - shop catalog, eligibility, discounts and purchases
 *
 * Purchase is all-or-nothing. Inside the buyer's wallet lock:
 *   1. eligibility (ItemUnavailable) and affordability (InsufficientFunds)
 *   2. spend every effective cost; on failure refund and PurchaseCostFailure
 *   3. grant every reward; on failure revoke, refund, InsufficientInventory
 *   4. commit counters and publish CurrencySpent + ItemPurchased
 *
 * Effective cost = max(1, round(listed * sink multiplier)). Multipliers
 * come from the inflation controller through set_multipliers() and are
 * never written into the catalog.
 *
 * Lock order: wallet -> item -> purchase history -> multipliers -> bus.
 * The discount sweep takes item locks only.
 */

#include "../config/defaults.hpp"
#include "../economy/currency.hpp"
#include "../economy/currency_ledger.hpp"
#include "../events/event_bus.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"
#include "inventory.hpp"
#include "shop_item.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace econ {
namespace pricing {

struct PricingConfig {
    double max_discount_pct = config::pricing::MAX_DISCOUNT_PCT;
    int32_t default_player_level = config::pricing::DEFAULT_PLAYER_LEVEL;
};

// Price of one cost line as the player would pay it now
struct QuotedCost {
    CurrencyId currency;
    Amount listed = 0;
    Amount original = 0;
    Amount effective = 0;
};

struct PriceQuote {
    ItemId item;
    std::vector<QuotedCost> costs;
    double discount_percent = 0.0; // 0 when no active window
    EconomyResult eligibility = EconomyResult::Success;
    bool affordable = false;

    bool purchasable() const { return eligibility == EconomyResult::Success && affordable; }
};

class PricingEngine {
public:
    using LevelProvider = std::function<int32_t(const PlayerId&)>;

    PricingEngine(economy::CurrencyLedger& ledger, ItemInventory& inventory, events::EventBus& bus,
                  const util::Clock& clock, PricingConfig config = {}, logging::AsyncLogger* logger = nullptr);

    PricingEngine(const PricingEngine&) = delete;
    PricingEngine& operator=(const PricingEngine&) = delete;

    // ========================================
    // Catalog (startup; throws CatalogError)
    // ========================================
    void add_category(const ShopCategory& category);
    void add_item(ShopItem item);

    // Called without engine locks held; must not call back into the engine
    void set_level_provider(LevelProvider provider);

    // Adjustment callback target for the inflation controller
    void set_multipliers(const CurrencyId& currency, double sink, double source);
    double sink_multiplier(const CurrencyId& currency) const;
    double source_multiplier(const CurrencyId& currency) const;

    // ========================================
    // Queries
    // ========================================
    EconomyResult check_eligibility(const ItemId& item, const PlayerId& player) const;
    bool can_afford(const ItemId& item, const PlayerId& player) const;
    bool can_purchase(const ItemId& item, const PlayerId& player) const;
    std::optional<PriceQuote> quote(const ItemId& item, const PlayerId& player) const;

    std::optional<ShopItem> item(const ItemId& id) const;
    std::vector<ShopItem> items() const;
    // Eligible items: recommended, then popular, then display order
    std::vector<ShopItem> available_items(const PlayerId& player) const;
    std::vector<ShopItem> items_in_category(const std::string& category) const;
    std::vector<ShopCategory> categories() const; // by display order, active only
    int32_t player_purchases(const PlayerId& player, const ItemId& item) const;
    size_t item_count() const;

    // ========================================
    // Mutations
    // ========================================
    EconomyResult purchase(const ItemId& item, const PlayerId& player);

    // Grant rewards outside a purchase (quests, daily login); all-or-nothing
    EconomyResult claim_reward(const PlayerId& player, const std::string& reward_id,
                               const std::vector<Reward>& rewards);

    // Publishes ItemViewed for shop analytics
    EconomyResult view_item(const ItemId& item, const PlayerId& player);

    void set_item_available(const ItemId& item, bool available);

    /**
     * Start a discount window of `percent` for `hours`. Any active window
     * is reverted first. InvalidAmount for percent outside
     * (0, max_discount_pct] or non-positive hours.
     */
    EconomyResult apply_timed_discount(const ItemId& item, double percent, int32_t hours,
                                       int32_t max_purchases = UNLIMITED);
    bool end_discount(const ItemId& item);

    // Revert every expired or capped window; returns windows ended
    size_t expire_discounts(Timestamp now);

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j); // throws SnapshotError

private:
    struct ItemEntry {
        explicit ItemEntry(ShopItem i) : item(std::move(i)) {}

        mutable std::mutex mutex;
        ShopItem item;
    };

    struct Multiplier {
        double sink = 1.0;
        double source = 1.0;
    };

    // Rewards handed out so far in one grant pass, for revocation
    struct Granted {
        std::vector<CurrencyReward> currency;
        std::vector<ItemReward> items;
        std::vector<BoosterReward> boosters;
    };

    economy::CurrencyLedger& ledger_;
    ItemInventory& inventory_;
    events::EventBus& bus_;
    const util::Clock& clock_;
    PricingConfig config_;
    logging::AsyncLogger* logger_;

    mutable std::shared_mutex catalog_mutex_;
    std::map<ItemId, std::unique_ptr<ItemEntry>> items_;
    std::vector<ShopCategory> categories_;
    LevelProvider level_provider_;

    mutable std::mutex history_mutex_;
    std::map<PlayerId, std::map<ItemId, int32_t>> purchases_;

    mutable std::mutex multipliers_mutex_;
    std::map<CurrencyId, Multiplier> multipliers_;

    ItemEntry* find(const ItemId& id) const;
    int32_t level_of(const PlayerId& player) const;

    // Called with entry.mutex held
    EconomyResult eligibility_locked(const ShopItem& item, const PlayerId& player, int32_t level,
                                     Timestamp now) const;
    std::vector<QuotedCost> costs_locked(const ShopItem& item, Timestamp now) const;
    void revert_discount_locked(ShopItem& item);

    EconomyResult grant_locked(economy::CurrencyLedger::WalletSession& wallet, const std::vector<Reward>& rewards,
                               const std::string& tag, Granted& granted);
    void revoke_locked(economy::CurrencyLedger::WalletSession& wallet, const Granted& granted,
                       const std::string& tag);
    // Currency grants are announced only once the purchase or claim commits
    void publish_earned(const PlayerId& player, const Granted& granted, const std::string& tag, Timestamp now);
};

} // namespace pricing
} // namespace econ
