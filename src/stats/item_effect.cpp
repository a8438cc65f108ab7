/// @file item_effect.cpp
/// @brief Implements stat effects and the item catalog

#include "stats/item_effect.hpp"

#include <stdexcept>

namespace statgauge {

StatDeltaEffect::StatDeltaEffect(std::string name, std::vector<std::pair<StatKind, int>> deltas)
    : name_(std::move(name)), deltas_(std::move(deltas)) {}

bool StatDeltaEffect::can_apply(const PlayerStats& stats) const {
    for (const auto& [kind, delta] : deltas_) {
        int value = stat_value(stats, kind);
        if (delta > 0 && value < stat_max(stats, kind)) {
            return true;
        }
        if (delta < 0 && value > 0) {
            return true;
        }
    }
    return false;
}

void StatDeltaEffect::apply(PlayerStats& stats) const {
    for (const auto& [kind, delta] : deltas_) {
        (void)adjust_stat(stats, kind, delta);
    }
}

void ItemCatalog::add(ItemDef item) {
    if (item.id.empty()) {
        throw std::invalid_argument("Item id must not be empty");
    }
    if (index_.count(item.id) != 0) {
        throw std::invalid_argument("Duplicate item id: " + item.id);
    }
    if (item.usable && item.effect == nullptr) {
        throw std::invalid_argument("Usable item requires an effect: " + item.id);
    }
    index_[item.id] = items_.size();
    items_.push_back(std::move(item));
}

const ItemDef* ItemCatalog::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &items_[it->second];
}

bool ItemCatalog::can_use(const std::string& id, const PlayerStats& stats) const {
    const ItemDef* item = find(id);
    return item != nullptr && item->usable && item->effect->can_apply(stats);
}

bool ItemCatalog::use_item(const std::string& id, PlayerStats& stats) const {
    if (!can_use(id, stats)) {
        return false;
    }
    find(id)->effect->apply(stats);
    return true;
}

ItemCatalog default_item_catalog() {
    ItemCatalog catalog;

    catalog.add({"health_potion", "Health Potion",
                 "A magical potion that restores 25 health points.", true,
                 std::make_shared<StatDeltaEffect>(
                     "Health Effect", std::vector<std::pair<StatKind, int>>{{StatKind::HEALTH, 25}}),
                 ItemCategory::CONSUMABLE});

    catalog.add({"energy_potion", "Energy Potion",
                 "A refreshing potion that restores 25 energy points.", true,
                 std::make_shared<StatDeltaEffect>(
                     "Energy Effect", std::vector<std::pair<StatKind, int>>{{StatKind::ENERGY, 25}}),
                 ItemCategory::CONSUMABLE});

    catalog.add({"bread", "Fresh Bread",
                 "Simple but nourishing bread. Restores 10 health and 10 energy.", true,
                 std::make_shared<StatDeltaEffect>(
                     "Food Effect", std::vector<std::pair<StatKind, int>>{{StatKind::HEALTH, 10},
                                                                          {StatKind::ENERGY, 10}}),
                 ItemCategory::CONSUMABLE});

    catalog.add({"apple", "Fresh Apple", "A crisp, juicy apple. Restores 5 health.", true,
                 std::make_shared<StatDeltaEffect>(
                     "Apple Effect", std::vector<std::pair<StatKind, int>>{{StatKind::HEALTH, 5}}),
                 ItemCategory::CONSUMABLE});

    // Equipment: listed but has no use effect
    catalog.add({"basic_sword", "Iron Sword", "A simple but sturdy iron sword.", false, nullptr,
                 ItemCategory::WEAPON});
    catalog.add({"leather_armor", "Leather Armor",
                 "Basic leather armor that provides modest protection.", false, nullptr,
                 ItemCategory::ARMOR});

    return catalog;
}

} // namespace statgauge
