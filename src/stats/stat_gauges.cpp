/// @file stat_gauges.cpp
/// @brief Default gauge palette and thresholds

#include "stats/stat_gauges.hpp"

#include <utility>

namespace statgauge {

namespace {

// --- Bar palette ---
const Rgba HEALTH_COLOR = {0.86f, 0.2f, 0.2f, 1.0f};
const Rgba HEALTH_LOW_COLOR = {0.7f, 0.12f, 0.12f, 1.0f};
const Rgba ENERGY_COLOR = {0.2f, 0.59f, 0.86f, 1.0f};
const Rgba MAGIC_COLOR = {0.59f, 0.2f, 0.86f, 1.0f};
const Rgba FRIENDSHIP_COLOR = {0.86f, 0.59f, 0.2f, 1.0f};
const Rgba DISCORD_COLOR = {0.47f, 0.2f, 0.59f, 1.0f};
const Rgba DISCORD_HIGH_COLOR = {0.31f, 0.12f, 0.39f, 1.0f};

constexpr float DIM_FACTOR = 0.7f;
constexpr float BRIGHTEN_FACTOR = 1.2f;

StatGaugePreset make_preset(StatKind kind, Rgba normal, Rgba low, Rgba high, float low_threshold,
                            float high_threshold, CriticalPredicate critical) {
    StatGaugePreset preset{kind, {}};
    preset.style.normal_color = normal;
    preset.style.low_color = low;
    preset.style.high_color = high;
    preset.style.thresholds = {low_threshold, high_threshold};
    preset.style.critical = std::move(critical);
    return preset;
}

} // namespace

std::vector<StatGaugePreset> default_stat_gauges() {
    return {
        make_preset(StatKind::HEALTH, HEALTH_COLOR, HEALTH_LOW_COLOR, HEALTH_COLOR, 0.25f, 0.75f,
                    critical_when_low()),
        make_preset(StatKind::ENERGY, ENERGY_COLOR, multiply_color(ENERGY_COLOR, DIM_FACTOR),
                    ENERGY_COLOR, 0.25f, 0.75f, never_critical()),
        make_preset(StatKind::MAGIC, MAGIC_COLOR, multiply_color(MAGIC_COLOR, DIM_FACTOR),
                    MAGIC_COLOR, 0.25f, 0.75f, never_critical()),
        make_preset(StatKind::FRIENDSHIP, FRIENDSHIP_COLOR,
                    multiply_color(FRIENDSHIP_COLOR, DIM_FACTOR),
                    brighten_color(FRIENDSHIP_COLOR, BRIGHTEN_FACTOR), 0.25f, 0.8f,
                    never_critical()),
        make_preset(StatKind::DISCORD, DISCORD_COLOR, DISCORD_COLOR, DISCORD_HIGH_COLOR, 0.25f,
                    0.6f, critical_when_high()),
    };
}

void push_stats(GaugeAnimator& animator, const PlayerStats& stats) {
    for (StatKind kind : ALL_STATS) {
        animator.set_target(stat_key(kind), static_cast<float>(stat_value(stats, kind)),
                            static_cast<float>(stat_max(stats, kind)));
    }
}

} // namespace statgauge
