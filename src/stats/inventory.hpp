/// @file inventory.hpp
/// @brief Item stock carried by the character.

#pragma once

#include "stats/item_effect.hpp"
#include "stats/player_stats.hpp"

#include <string>
#include <unordered_map>

namespace statgauge {

/// Counts of carried items keyed by catalog id. Using an item consumes one.
class Inventory {
  public:
    /// Adds count of an item.
    /// @throws std::invalid_argument on an empty id or a negative count
    void add(const std::string& id, int count = 1);

    /// Removes up to count of an item.
    /// @return true if at least count were held (and removed)
    bool remove(const std::string& id, int count = 1);

    /// Number held, 0 for items never added
    [[nodiscard]] int count(const std::string& id) const;

    /// Whether one is held and the catalog says it can be used now
    [[nodiscard]] bool can_use(const ItemCatalog& catalog, const std::string& id,
                               const PlayerStats& stats) const;

    /// Applies the item's effect and consumes one. Nothing happens when the
    /// stock is empty or the effect would not change anything.
    /// @return true if the item was used
    bool use_item(const ItemCatalog& catalog, const std::string& id, PlayerStats& stats);

  private:
    std::unordered_map<std::string, int> counts_;
};

/// Two health potions, one energy potion and three loaves of bread
Inventory starting_inventory();

} // namespace statgauge
