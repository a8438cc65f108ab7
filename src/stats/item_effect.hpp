/// @file item_effect.hpp
/// @brief Item effects as a capability interface, plus the item catalog.
///
/// Effects are attached to item definitions when the catalog is built, so the
/// full set is known up front and nothing is looked up by name at use time.

#pragma once

#include "stats/player_stats.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace statgauge {

/// Something that can be done to a character's stats
class ItemEffect {
  public:
    virtual ~ItemEffect() = default;

    /// Whether apply() would change anything
    [[nodiscard]] virtual bool can_apply(const PlayerStats& stats) const = 0;

    /// Applies the effect. Stats stay within their bounds.
    virtual void apply(PlayerStats& stats) const = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

/// Adds a signed amount to one or more stats (restores, drains, corruption).
class StatDeltaEffect : public ItemEffect {
  public:
    StatDeltaEffect(std::string name, std::vector<std::pair<StatKind, int>> deltas);

    /// True if at least one delta would move its stat (headroom for a
    /// positive delta, a non-zero value for a negative one)
    [[nodiscard]] bool can_apply(const PlayerStats& stats) const override;
    void apply(PlayerStats& stats) const override;
    [[nodiscard]] const std::string& name() const override { return name_; }

  private:
    std::string name_;
    std::vector<std::pair<StatKind, int>> deltas_;
};

enum class ItemCategory { CONSUMABLE, WEAPON, ARMOR, MISCELLANEOUS };

/// A catalog entry
struct ItemDef {
    std::string id;
    std::string name;
    std::string description;
    bool usable = false;
    std::shared_ptr<const ItemEffect> effect; ///< Null for items with no use effect
    ItemCategory category = ItemCategory::MISCELLANEOUS;
};

/// Item definitions keyed by id, in registration order.
class ItemCatalog {
  public:
    /// Registers an item.
    /// @throws std::invalid_argument on an empty or duplicate id, or a usable
    ///         item without an effect
    void add(ItemDef item);

    /// Definition for id, or nullptr
    [[nodiscard]] const ItemDef* find(const std::string& id) const;

    /// Whether the item exists, is usable and its effect can apply
    [[nodiscard]] bool can_use(const std::string& id, const PlayerStats& stats) const;

    /// Uses the item if can_use() holds.
    /// @return true if the effect was applied
    bool use_item(const std::string& id, PlayerStats& stats) const;

    [[nodiscard]] const std::vector<ItemDef>& items() const { return items_; }

  private:
    std::vector<ItemDef> items_;
    std::unordered_map<std::string, size_t> index_;
};

/// Potions, food and starting equipment
ItemCatalog default_item_catalog();

} // namespace statgauge
