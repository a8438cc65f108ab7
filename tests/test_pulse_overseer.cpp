/// @file test_pulse_overseer.cpp
/// @brief Tests for the critical-band opacity pulse

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "animation/pulse_overseer.hpp"
#include "recording_binding.hpp"
#include "timing/frame_clock.hpp"

#include <cmath>
#include <utility>

using namespace statgauge;
using statgauge::testing::RecordingBinding;
using Catch::Approx;

namespace {

constexpr double PI = 3.14159265358979323846;

GaugeAnimationState make_state(RecordingBinding* binding, float value, CriticalPredicate critical) {
    GaugeAnimationState state;
    state.binding = binding;
    state.current_value = value;
    state.target_value = value;
    state.max_value = 100.0f;
    state.style.critical = std::move(critical);
    return state;
}

} // namespace

TEST_CASE("pulse_opacity follows 0.85 + 0.15 sin(2t)", "[pulse]") {
    CHECK(pulse_opacity(0.0) == Approx(0.85f));
    CHECK(pulse_opacity(PI / 4.0) == Approx(1.0f));
    CHECK(pulse_opacity(3.0 * PI / 4.0) == Approx(PULSE_MIN_OPACITY));
}

TEST_CASE("pulse_opacity stays within [0.70, 1.00]", "[pulse]") {
    for (int i = 0; i < 500; i++) {
        float opacity = pulse_opacity(i * 0.037);
        CHECK(opacity >= PULSE_MIN_OPACITY - 1e-6f);
        CHECK(opacity <= 1.0f + 1e-6f);
    }
}

TEST_CASE("Only critical gauges pulse", "[pulse]") {
    RecordingBinding low_health;
    RecordingBinding fine_health;
    RecordingBinding high_discord;
    RecordingBinding calm_discord;

    GaugeMap gauges;
    gauges.emplace("low", make_state(&low_health, 10.0f, critical_when_low()));
    gauges.emplace("fine", make_state(&fine_health, 60.0f, critical_when_low()));
    gauges.emplace("surge", make_state(&high_discord, 80.0f, critical_when_high()));
    gauges.emplace("calm", make_state(&calm_discord, 20.0f, critical_when_high()));

    PulseOverseer pulse(&gauges);
    FrameClock clock;
    clock.advance(static_cast<float>(3.0 * PI / 4.0));

    CHECK(pulse.tick(clock));
    REQUIRE(low_health.opacities.size() == 1);
    CHECK(low_health.opacities.back() == Approx(PULSE_MIN_OPACITY).margin(1e-4));
    CHECK(high_discord.opacities.back() == Approx(PULSE_MIN_OPACITY).margin(1e-4));
    CHECK(fine_health.opacities.back() == 1.0f);
    CHECK(calm_discord.opacities.back() == 1.0f);
}

TEST_CASE("A gauge leaving its critical band is restored to full opacity", "[pulse]") {
    RecordingBinding bar;
    GaugeMap gauges;
    gauges.emplace("health", make_state(&bar, 5.0f, critical_when_low()));

    PulseOverseer pulse(&gauges);
    FrameClock clock;
    clock.advance(2.0f);
    pulse.tick(clock);
    CHECK(bar.opacities.back() < 1.0f);

    gauges.at("health").current_value = 90.0f;
    clock.advance(0.1f);
    pulse.tick(clock);
    CHECK(bar.opacities.back() == 1.0f);
}

TEST_CASE("Pulse touches opacity only and skips binding-less gauges", "[pulse]") {
    RecordingBinding bar;
    GaugeMap gauges;
    gauges.emplace("health", make_state(&bar, 5.0f, critical_when_low()));
    gauges.emplace("orphan", make_state(nullptr, 5.0f, critical_when_low()));
    gauges.emplace("plain", make_state(nullptr, 5.0f, nullptr));

    PulseOverseer pulse(&gauges);
    FrameClock clock;
    for (int i = 0; i < 10; i++) {
        clock.advance(0.1f);
        CHECK(pulse.tick(clock));
    }

    CHECK(bar.opacities.size() == 10);
    CHECK(bar.values.empty());
    CHECK(bar.maxes.empty());
    CHECK(bar.colors.empty());
}
