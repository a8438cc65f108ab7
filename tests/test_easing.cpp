/// @file test_easing.cpp
/// @brief Tests for easing curves and scalar helpers

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "animation/easing.hpp"

using namespace statgauge;
using Catch::Approx;

TEST_CASE("Easing curves hit both endpoints exactly", "[easing]") {
    CHECK(linear(0.0f) == 0.0f);
    CHECK(linear(1.0f) == 1.0f);
    CHECK(ease_in_out(0.0f) == 0.0f);
    CHECK(ease_in_out(1.0f) == 1.0f);
    CHECK(ease_out(0.0f) == 0.0f);
    CHECK(ease_out(1.0f) == 1.0f);
}

TEST_CASE("ease_in_out is symmetric and slow at the ends", "[easing]") {
    CHECK(ease_in_out(0.5f) == Approx(0.5f));
    CHECK(ease_in_out(0.25f) == Approx(1.0f - ease_in_out(0.75f)));
    CHECK(ease_in_out(0.1f) < 0.1f);
    CHECK(ease_in_out(0.9f) > 0.9f);
}

TEST_CASE("Easing curves are monotonic on [0, 1]", "[easing]") {
    float prev_in_out = 0.0f;
    float prev_out = 0.0f;
    for (int i = 1; i <= 100; i++) {
        float t = static_cast<float>(i) / 100.0f;
        CHECK(ease_in_out(t) >= prev_in_out);
        CHECK(ease_out(t) >= prev_out);
        prev_in_out = ease_in_out(t);
        prev_out = ease_out(t);
    }
}

TEST_CASE("Easing curves clamp progress outside [0, 1]", "[easing]") {
    CHECK(ease_in_out(-0.5f) == 0.0f);
    CHECK(ease_in_out(1.5f) == 1.0f);
    CHECK(linear(2.0f) == 1.0f);
    CHECK(clamp01(-3.0f) == 0.0f);
    CHECK(clamp01(0.4f) == Approx(0.4f));
}

TEST_CASE("lerp reaches its endpoints", "[easing]") {
    CHECK(lerp(10.0f, 30.0f, 0.0f) == 10.0f);
    CHECK(lerp(10.0f, 30.0f, 1.0f) == 30.0f);
    CHECK(lerp(10.0f, 30.0f, 0.25f) == Approx(15.0f));
    CHECK(lerp(30.0f, 10.0f, 0.5f) == Approx(20.0f));
}
