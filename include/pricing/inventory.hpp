#pragma once

/**
 * ItemInventory - per-player non-currency holdings (items and boosters)
 *
 * Stacks may be capped per item id; a grant that would exceed the cap is
 * rejected whole with InsufficientInventory. Grants are reversible through
 * revoke() so a failed purchase can undo what it already handed out.
 */

#include "../types.hpp"
#include "shop_item.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <mutex>
#include <string>

namespace econ {
namespace pricing {

class ItemInventory {
public:
    // Cap applies to items and boosters sharing the id
    void set_stack_cap(const std::string& id, int64_t cap) {
        std::lock_guard<std::mutex> lock(mutex_);
        caps_[id] = cap;
    }

    EconomyResult grant_item(const PlayerId& player, const ItemReward& reward) {
        return add(items_, player, reward.item, reward.quantity);
    }

    EconomyResult grant_booster(const PlayerId& player, const BoosterReward& reward) {
        return add(boosters_, player, reward.booster, reward.quantity);
    }

    // Compensation path; never fails for quantities previously granted
    void revoke_item(const PlayerId& player, const ItemReward& reward) {
        remove(items_, player, reward.item, reward.quantity);
    }
    void revoke_booster(const PlayerId& player, const BoosterReward& reward) {
        remove(boosters_, player, reward.booster, reward.quantity);
    }

    int64_t item_count(const PlayerId& player, const ItemId& item) const { return count(items_, player, item); }
    int64_t booster_count(const PlayerId& player, const std::string& booster) const {
        return count(boosters_, player, booster);
    }

    std::map<std::string, int64_t> items(const PlayerId& player) const { return holdings_of(items_, player); }
    std::map<std::string, int64_t> boosters(const PlayerId& player) const { return holdings_of(boosters_, player); }

    nlohmann::json to_json() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {{"items", items_}, {"boosters", boosters_}};
    }

    void from_json(const nlohmann::json& j) {
        Holdings items;
        Holdings boosters;
        try {
            items = j.at("items").get<Holdings>();
            boosters = j.at("boosters").get<Holdings>();
        } catch (const nlohmann::json::exception& e) {
            throw SnapshotError(std::string("inventory: ") + e.what());
        }
        std::lock_guard<std::mutex> lock(mutex_);
        items_ = std::move(items);
        boosters_ = std::move(boosters);
    }

private:
    using Holdings = std::map<PlayerId, std::map<std::string, int64_t>>;

    mutable std::mutex mutex_;
    Holdings items_;
    Holdings boosters_;
    std::map<std::string, int64_t> caps_;

    EconomyResult add(Holdings& holdings, const PlayerId& player, const std::string& id, int64_t quantity) {
        if (quantity <= 0)
            return EconomyResult::InvalidAmount;
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t held = 0;
        auto p = holdings.find(player);
        if (p != holdings.end()) {
            auto it = p->second.find(id);
            held = it != p->second.end() ? it->second : 0;
        }
        auto cap = caps_.find(id);
        if (cap != caps_.end() && held + quantity > cap->second)
            return EconomyResult::InsufficientInventory;
        holdings[player][id] = held + quantity;
        return EconomyResult::Success;
    }

    void remove(Holdings& holdings, const PlayerId& player, const std::string& id, int64_t quantity) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto p = holdings.find(player);
        if (p == holdings.end())
            return;
        auto it = p->second.find(id);
        if (it == p->second.end())
            return;
        it->second -= std::min(it->second, quantity);
        if (it->second == 0)
            p->second.erase(it);
    }

    int64_t count(const Holdings& holdings, const PlayerId& player, const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto p = holdings.find(player);
        if (p == holdings.end())
            return 0;
        auto it = p->second.find(id);
        return it != p->second.end() ? it->second : 0;
    }

    std::map<std::string, int64_t> holdings_of(const Holdings& holdings, const PlayerId& player) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto p = holdings.find(player);
        return p != holdings.end() ? p->second : std::map<std::string, int64_t>{};
    }
};

} // namespace pricing
} // namespace econ
