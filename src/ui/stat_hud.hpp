/// @file stat_hud.hpp
/// @brief Character stat panel: one labelled, animated bar per stat.

#pragma once

#include "animation/gauge_animator.hpp"
#include "rendering/progress_bar.hpp"
#include "stats/player_stats.hpp"

#include <string>
#include <vector>

namespace statgauge {

/// Owns the ProgressBar bindings for the five stat gauges. Bars are created
/// once and never move, so the animator may hold pointers to them for the
/// lifetime of the HUD.
class StatHud {
  public:
    /// Builds one bar per entry of default_stat_gauges()
    StatHud();

    StatHud(const StatHud&) = delete;
    StatHud& operator=(const StatHud&) = delete;

    /// Registers every bar with the animator under its stat_key()
    void attach(GaugeAnimator& animator);

    /// Draws the panel.
    /// @param name     Character name shown in the header
    /// @param stats    Source of the "value/max" readouts
    /// @param panel_x  Left edge in screen coords
    /// @param panel_y  Top edge in screen coords
    /// @param panel_w  Panel width
    /// @return Rendered panel height, for dynamic stacking
    float draw(const std::string& name, const PlayerStats& stats, float panel_x, float panel_y,
               float panel_w) const;

  private:
    struct Row {
        StatKind kind;
        GaugeStyle style;
        ProgressBar bar;
    };

    std::vector<Row> rows_;
};

} // namespace statgauge
