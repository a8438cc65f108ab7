/// @file ui_scale.hpp
/// @brief Responsive HUD metrics derived from the current window dimensions.
///
/// Single source of truth for panel widths, fonts and spacing so the HUD
/// adapts to the window without threading sizes through every draw call.

#pragma once

#include <algorithm>
#include <cmath>

namespace statgauge {

/// Recalculated once per frame from the window size.
struct UIScale {
    float factor = 1.0f;   ///< Master scale: blend of screen_h / 720 and screen_w / 1280
    float panel_w = 360.0f; ///< HUD panel width
    float margin = 12.0f;  ///< Outer margin around panels

    int font_normal = 16;
    int font_small = 13;
    int font_big = 22;

    float padding = 10.0f;
    float row_gap = 8.0f;
    float bar_height = 18.0f;
    float button_height = 30.0f;
};

/// Updates the global UI scale from the current screen dimensions.
/// Call once per frame, before drawing any panel.
void update_ui_scale(int screen_w, int screen_h);

/// Current UI scale values
const UIScale& ui_scale();

} // namespace statgauge
