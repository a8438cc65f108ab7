/// @file test_item_effect.cpp
/// @brief Tests for stat adjustment, item effects and the catalog

#include <catch2/catch_test_macros.hpp>

#include "stats/item_effect.hpp"
#include "stats/player_stats.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace statgauge;

TEST_CASE("adjust_stat clamps to [0, max] and reports the applied change", "[stats]") {
    PlayerStats stats;
    CHECK(adjust_stat(stats, StatKind::HEALTH, 30) == 0);
    CHECK(stats.health == 100);

    CHECK(adjust_stat(stats, StatKind::HEALTH, -130) == -100);
    CHECK(stats.health == 0);

    CHECK(adjust_stat(stats, StatKind::DISCORD, 40) == 40);
    CHECK(stat_value(stats, StatKind::DISCORD) == 40);
    CHECK(stat_max(stats, StatKind::MAGIC) == 50);
}

TEST_CASE("Stat keys match the HUD gauges", "[stats]") {
    CHECK(std::string(stat_key(StatKind::HEALTH)) == "health");
    CHECK(std::string(stat_key(StatKind::FRIENDSHIP)) == "friendship");
    CHECK(std::string(stat_key(StatKind::DISCORD)) == "discord");
    CHECK(std::string(stat_label(StatKind::FRIENDSHIP)) == "Harmony");
}

TEST_CASE("Restoring effects need headroom", "[items]") {
    ItemCatalog catalog = default_item_catalog();
    PlayerStats stats;

    CHECK_FALSE(catalog.can_use("health_potion", stats));
    CHECK_FALSE(catalog.use_item("health_potion", stats));
    CHECK(stats.health == 100);

    adjust_stat(stats, StatKind::HEALTH, -10);
    CHECK(catalog.can_use("health_potion", stats));
    CHECK(catalog.use_item("health_potion", stats));
    CHECK(stats.health == 100);
}

TEST_CASE("Bread restores health and energy", "[items]") {
    ItemCatalog catalog = default_item_catalog();
    PlayerStats stats;
    stats.health = 50;
    stats.energy = 95;

    CHECK(catalog.use_item("bread", stats));
    CHECK(stats.health == 60);
    CHECK(stats.energy == 100);

    // Usable while any one of its stats has room
    stats.energy = 100;
    CHECK(catalog.can_use("bread", stats));
}

TEST_CASE("Equipment and unknown ids cannot be used", "[items]") {
    ItemCatalog catalog = default_item_catalog();
    PlayerStats stats;
    stats.health = 10;

    const ItemDef* sword = catalog.find("basic_sword");
    REQUIRE(sword != nullptr);
    CHECK_FALSE(sword->usable);
    CHECK(sword->effect == nullptr);
    CHECK_FALSE(catalog.use_item("basic_sword", stats));

    CHECK(catalog.find("mithril_crown") == nullptr);
    CHECK_FALSE(catalog.use_item("mithril_crown", stats));
    CHECK(stats.health == 10);
}

TEST_CASE("Default catalog lists items in registration order", "[items]") {
    ItemCatalog catalog = default_item_catalog();
    REQUIRE(catalog.items().size() == 6);
    CHECK(catalog.items().front().id == "health_potion");
    CHECK(catalog.items().back().id == "leather_armor");
}

TEST_CASE("Catalog rejects malformed definitions", "[items]") {
    ItemCatalog catalog;
    auto effect = std::make_shared<StatDeltaEffect>(
        "Heal", std::vector<std::pair<StatKind, int>>{{StatKind::HEALTH, 5}});

    catalog.add({"salve", "Salve", "", true, effect});
    CHECK_THROWS_AS(catalog.add({"salve", "Another Salve", "", true, effect}),
                    std::invalid_argument);
    CHECK_THROWS_AS(catalog.add({"", "Nameless", "", true, effect}), std::invalid_argument);
    CHECK_THROWS_AS(catalog.add({"empty_flask", "Empty Flask", "", true, nullptr}),
                    std::invalid_argument);
    CHECK(catalog.items().size() == 1);
}

TEST_CASE("Draining effects stop at zero", "[items]") {
    StatDeltaEffect drain("Drain", {{StatKind::MAGIC, -30}});
    PlayerStats stats;
    stats.magic = 20;

    CHECK(drain.can_apply(stats));
    drain.apply(stats);
    CHECK(stats.magic == 0);
    CHECK_FALSE(drain.can_apply(stats));
    CHECK(drain.name() == "Drain");
}
