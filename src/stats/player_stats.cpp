/// @file player_stats.cpp
/// @brief Stat lookup and clamped adjustment

#include "stats/player_stats.hpp"

#include <algorithm>

namespace statgauge {

namespace {

int& value_ref(PlayerStats& stats, StatKind kind) {
    switch (kind) {
    case StatKind::HEALTH:
        return stats.health;
    case StatKind::ENERGY:
        return stats.energy;
    case StatKind::MAGIC:
        return stats.magic;
    case StatKind::FRIENDSHIP:
        return stats.friendship;
    case StatKind::DISCORD:
        return stats.corruption;
    }
    return stats.health;
}

} // namespace

const char* stat_key(StatKind kind) {
    switch (kind) {
    case StatKind::HEALTH:
        return "health";
    case StatKind::ENERGY:
        return "energy";
    case StatKind::MAGIC:
        return "magic";
    case StatKind::FRIENDSHIP:
        return "friendship";
    case StatKind::DISCORD:
        return "discord";
    }
    return "";
}

const char* stat_label(StatKind kind) {
    switch (kind) {
    case StatKind::HEALTH:
        return "Health";
    case StatKind::ENERGY:
        return "Energy";
    case StatKind::MAGIC:
        return "Magic";
    case StatKind::FRIENDSHIP:
        return "Harmony";
    case StatKind::DISCORD:
        return "Discord";
    }
    return "";
}

int stat_value(const PlayerStats& stats, StatKind kind) {
    switch (kind) {
    case StatKind::HEALTH:
        return stats.health;
    case StatKind::ENERGY:
        return stats.energy;
    case StatKind::MAGIC:
        return stats.magic;
    case StatKind::FRIENDSHIP:
        return stats.friendship;
    case StatKind::DISCORD:
        return stats.corruption;
    }
    return 0;
}

int stat_max(const PlayerStats& stats, StatKind kind) {
    switch (kind) {
    case StatKind::HEALTH:
        return stats.max_health;
    case StatKind::ENERGY:
        return stats.max_energy;
    case StatKind::MAGIC:
        return stats.max_magic;
    case StatKind::FRIENDSHIP:
        return stats.max_friendship;
    case StatKind::DISCORD:
        return stats.max_corruption;
    }
    return 0;
}

int adjust_stat(PlayerStats& stats, StatKind kind, int delta) {
    int& value = value_ref(stats, kind);
    int before = value;
    value = std::clamp(value + delta, 0, std::max(0, stat_max(stats, kind)));
    return value - before;
}

} // namespace statgauge
