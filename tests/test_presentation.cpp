#include "../include/economy/currency_ledger.hpp"
#include "../include/events/event_bus.hpp"
#include "../include/presentation/views.hpp"
#include "../include/pricing/inventory.hpp"
#include "../include/pricing/pricing_engine.hpp"
#include "../include/profile/profile_store.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

using namespace econ;
using namespace econ::presentation;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "Running " << #name << "... ";                                                                    \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

struct Store {
    economy::CurrencyRegistry registry;
    economy::ExchangeRateTable rates;
    events::EventBus bus;
    util::SimulatedClock clock{config::time::NS_PER_DAY};
    pricing::ItemInventory inventory;
    std::unique_ptr<economy::CurrencyLedger> ledger;
    std::unique_ptr<pricing::PricingEngine> shop;

    Store() {
        economy::Currency coins;
        coins.id = "coins";
        coins.name = "Coins";
        registry.register_currency(coins);
        economy::Currency gems;
        gems.id = "gems";
        gems.name = "Gems";
        gems.is_hard_currency = true;
        registry.register_currency(gems);

        rates.add(economy::ExchangeRate{"gems", "coins", 100.0, 50.0, 200.0, true, 0});

        ledger = std::make_unique<economy::CurrencyLedger>(registry, rates, bus, clock);
        shop = std::make_unique<pricing::PricingEngine>(*ledger, inventory, bus, clock);

        pricing::ShopItem bundle;
        bundle.id = "bundle";
        bundle.name = "Bundle";
        bundle.is_popular = true;
        bundle.costs = {{"gems", 40, 0}};
        bundle.rewards = {pricing::CurrencyReward{"coins", 100}, pricing::ItemReward{"sword", 1},
                          pricing::BoosterReward{"xp", 2, 60}};
        shop->add_item(bundle);

        pricing::ShopItem vip;
        vip.id = "vip";
        vip.name = "VIP";
        vip.costs = {{"gems", 10, 0}};
        vip.rewards = {pricing::ItemReward{"crown", 1}};
        vip.eligibility.min_level = 10;
        shop->add_item(vip);
    }
};

TEST(test_wallet_view_in_registry_order) {
    Store s;
    s.ledger->earn("p1", "gems", 5, "iap");
    s.inventory.grant_item("p1", pricing::ItemReward{"sword", 1});

    WalletView view = wallet_view(*s.ledger, s.inventory, "p1");
    ASSERT_EQ(view.balances.size(), 2u);
    ASSERT_EQ(view.balances[0].currency, "coins");
    ASSERT_EQ(view.balances[1].amount, 5);
    ASSERT_TRUE(view.balances[1].hard_currency);
    ASSERT_EQ(view.items.at("sword"), 1);

    std::string text = format_wallet(view);
    ASSERT_TRUE(text.find("Gems: 5 (hard)") != std::string::npos);
    ASSERT_TRUE(text.find("item sword x1") != std::string::npos);
}

TEST(test_shop_item_view) {
    Store s;
    s.shop->apply_timed_discount("bundle", 25.0, 1);

    auto view = shop_item_view(*s.shop, "bundle", "p1");
    ASSERT_TRUE(view.has_value());
    ASSERT_EQ(view->price[0].listed, 30);
    ASSERT_EQ(view->price[0].original, 40);
    ASSERT_NEAR(view->discount_percent, 25.0, 1e-9);
    ASSERT_EQ(view->discount_expires_at, s.clock.now() + util::hours_to_ns(1));
    ASSERT_FALSE(view->affordable);
    ASSERT_TRUE(view->popular);
    ASSERT_EQ(view->rewards, "100 coins, 1x sword, 2x xp (60s)");

    ASSERT_FALSE(shop_item_view(*s.shop, "ghost", "p1").has_value());
}

TEST(test_shop_view_lists_eligible_items) {
    Store s;
    auto items = shop_view(*s.shop, "p1");
    ASSERT_EQ(items.size(), 1u);
    ASSERT_EQ(items[0].id, "bundle");

    s.shop->set_level_provider([](const PlayerId&) { return 12; });
    ASSERT_EQ(shop_view(*s.shop, "p1").size(), 2u);
}

TEST(test_profile_summary) {
    Store s;
    profile::PlayerProfileStore profiles(s.registry, s.clock);
    ASSERT_FALSE(profile_summary(profiles, "p1", s.clock.now()).has_value());

    profile::EventTags tags;
    tags.currency = "gems";
    tags.hard_currency = true;
    profiles.record_event("p1", profile::ProfileEventType::CurrencySpent, 12, tags);

    auto summary = profile_summary(profiles, "p1", s.clock.now() + 2 * config::time::NS_PER_DAY);
    ASSERT_EQ(summary->segment, profile::Segment::Regular);
    ASSERT_EQ(summary->total_spent, 12);
    ASSERT_NEAR(summary->days_inactive, 2.0, 1e-9);
}

TEST(test_rate_views) {
    Store s;
    auto views = rate_views(s.rates);
    ASSERT_EQ(views.size(), 1u);
    ASSERT_NEAR(views[0].rate, 100.0, 1e-12);
    ASSERT_TRUE(format_rates(views).find("gems") != std::string::npos);
}

int main() {
    std::cout << "=== Presentation Tests ===\n";

    RUN_TEST(test_wallet_view_in_registry_order);
    RUN_TEST(test_shop_item_view);
    RUN_TEST(test_shop_view_lists_eligible_items);
    RUN_TEST(test_profile_summary);
    RUN_TEST(test_rate_views);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
