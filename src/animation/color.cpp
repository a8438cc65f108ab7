/// @file color.cpp
/// @brief Implements color interpolation and threshold mapping

#include "animation/color.hpp"

#include <algorithm>

namespace statgauge {

Rgba lerp_color(const Rgba& a, const Rgba& b, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return {a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t,
            a.a + (b.a - a.a) * t};
}

Rgba multiply_color(const Rgba& color, float multiplier) {
    return {color.r * multiplier, color.g * multiplier, color.b * multiplier, color.a};
}

Rgba brighten_color(const Rgba& color, float multiplier) {
    return {std::clamp(color.r * multiplier, 0.0f, 1.0f),
            std::clamp(color.g * multiplier, 0.0f, 1.0f),
            std::clamp(color.b * multiplier, 0.0f, 1.0f), color.a};
}

Rgba threshold_color(float fraction, float low_threshold, float high_threshold,
                     const Rgba& low_color, const Rgba& normal_color, const Rgba& high_color) {
    if (fraction <= low_threshold) {
        // At the threshold itself t is 1, including a threshold of 0
        float t = fraction >= low_threshold
                      ? 1.0f
                      : fraction / std::max(THRESHOLD_EPSILON, low_threshold);
        return lerp_color(low_color, normal_color, t);
    }
    if (fraction >= high_threshold) {
        float t = (fraction - high_threshold) / std::max(THRESHOLD_EPSILON, 1.0f - high_threshold);
        return lerp_color(normal_color, high_color, t);
    }
    return normal_color;
}

} // namespace statgauge
