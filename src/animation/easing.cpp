/// @file easing.cpp
/// @brief Implements the easing curves

#include "animation/easing.hpp"

#include <algorithm>

namespace statgauge {

float clamp01(float t) {
    return std::clamp(t, 0.0f, 1.0f);
}

float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

float linear(float t) {
    return clamp01(t);
}

float ease_in_out(float t) {
    t = clamp01(t);
    return t * t * (3.0f - 2.0f * t);
}

float ease_out(float t) {
    t = clamp01(t);
    return 1.0f - (1.0f - t) * (1.0f - t);
}

} // namespace statgauge
