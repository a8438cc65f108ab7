/// @file stat_gauges.hpp
/// @brief Default HUD gauge styles and the stats -> animator bridge.

#pragma once

#include "animation/gauge_animator.hpp"
#include "animation/gauge_state.hpp"
#include "stats/player_stats.hpp"

#include <vector>

namespace statgauge {

struct StatGaugePreset {
    StatKind kind;
    GaugeStyle style;
};

/// Styles for the five HUD gauges, in display order. Health pulses when low,
/// discord pulses when high, the rest never pulse.
std::vector<StatGaugePreset> default_stat_gauges();

/// Sends every stat to its gauge (keyed by stat_key())
void push_stats(GaugeAnimator& animator, const PlayerStats& stats);

} // namespace statgauge
