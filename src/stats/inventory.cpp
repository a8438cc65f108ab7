/// @file inventory.cpp
/// @brief Implements item stock and consumption

#include "stats/inventory.hpp"

#include <stdexcept>

namespace statgauge {

void Inventory::add(const std::string& id, int count) {
    if (id.empty()) {
        throw std::invalid_argument("Item id must not be empty");
    }
    if (count < 0) {
        throw std::invalid_argument("Item count must not be negative: " + id);
    }
    if (count > 0) {
        counts_[id] += count;
    }
}

bool Inventory::remove(const std::string& id, int count) {
    auto it = counts_.find(id);
    if (it == counts_.end() || count < 0 || it->second < count) {
        return false;
    }
    it->second -= count;
    if (it->second == 0) {
        counts_.erase(it);
    }
    return true;
}

int Inventory::count(const std::string& id) const {
    auto it = counts_.find(id);
    return it != counts_.end() ? it->second : 0;
}

bool Inventory::can_use(const ItemCatalog& catalog, const std::string& id,
                        const PlayerStats& stats) const {
    return count(id) > 0 && catalog.can_use(id, stats);
}

bool Inventory::use_item(const ItemCatalog& catalog, const std::string& id, PlayerStats& stats) {
    if (!can_use(catalog, id, stats)) {
        return false;
    }
    if (!catalog.use_item(id, stats)) {
        return false;
    }
    return remove(id);
}

Inventory starting_inventory() {
    Inventory inventory;
    inventory.add("health_potion", 2);
    inventory.add("energy_potion", 1);
    inventory.add("bread", 3);
    return inventory;
}

} // namespace statgauge
