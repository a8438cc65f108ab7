/// @file action_panel.hpp
/// @brief Buttons that apply item effects and hazards to the character.
///
/// All UI is drawn with Raylib primitives. The panel only reports which
/// button was pressed; the main loop applies the effect and pushes the new
/// stats to the animator.

#pragma once

#include "stats/inventory.hpp"
#include "stats/item_effect.hpp"

#include <raylib.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace statgauge {

/// One button on the panel
struct HudAction {
    std::string label;
    std::string item_id; ///< Catalog id for items; empty for hazards
    std::shared_ptr<const ItemEffect> effect;
};

/// Result of drawing the action panel
struct ActionPanelResult {
    std::optional<size_t> pressed; ///< Index into the action list
    float panel_height = 0.0f;
};

/// Draws one button per action; actions whose effect cannot apply, and items
/// that are out of stock, are drawn disabled and cannot be pressed. Item
/// buttons show the carried count.
/// @param actions   Buttons, in display order
/// @param stats     Used to decide which buttons are enabled
/// @param inventory Stock for item actions
/// @param status  One-line message shown under the buttons (may be empty)
/// @return The pressed action (if any) and rendered panel height
ActionPanelResult draw_action_panel(const std::vector<HudAction>& actions, const PlayerStats& stats,
                                    const Inventory& inventory, const std::string& status,
                                    float panel_x, float panel_y, float panel_w);

} // namespace statgauge
