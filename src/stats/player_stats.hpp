/// @file player_stats.hpp
/// @brief The five bounded character stats shown on the HUD.

#pragma once

#include <array>

namespace statgauge {

enum class StatKind { HEALTH, ENERGY, MAGIC, FRIENDSHIP, DISCORD };

constexpr std::array<StatKind, 5> ALL_STATS = {StatKind::HEALTH, StatKind::ENERGY,
                                               StatKind::MAGIC, StatKind::FRIENDSHIP,
                                               StatKind::DISCORD};

/// Current values and their maxima. Values are kept in [0, max] by adjust_stat().
struct PlayerStats {
    int health = 100;
    int max_health = 100;
    int energy = 100;
    int max_energy = 100;
    int magic = 50;
    int max_magic = 50;
    int friendship = 50;
    int max_friendship = 100;
    int corruption = 0;
    int max_corruption = 100;
};

/// Gauge key for a stat ("health", "energy", "magic", "friendship", "discord")
const char* stat_key(StatKind kind);

/// Human-readable label for HUD rows
const char* stat_label(StatKind kind);

[[nodiscard]] int stat_value(const PlayerStats& stats, StatKind kind);
[[nodiscard]] int stat_max(const PlayerStats& stats, StatKind kind);

/// Adds delta to the stat, clamped to [0, max].
/// @return The change actually applied
int adjust_stat(PlayerStats& stats, StatKind kind, int delta);

} // namespace statgauge
