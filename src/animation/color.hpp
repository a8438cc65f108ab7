/// @file color.hpp
/// @brief Float RGBA colors and the threshold color mapping used by gauge fills.

#pragma once

namespace statgauge {

/// Linear float color, components nominally in [0, 1]
struct Rgba {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;
};

/// Guards the threshold divisions when a threshold sits at 0 or 1
constexpr float THRESHOLD_EPSILON = 1e-4f;

/// Component-wise interpolation; t is clamped to [0, 1]
Rgba lerp_color(const Rgba& a, const Rgba& b, float t);

/// Scales RGB by multiplier, alpha untouched
Rgba multiply_color(const Rgba& color, float multiplier);

/// Scales RGB by multiplier and clamps each channel to [0, 1], alpha untouched
Rgba brighten_color(const Rgba& color, float multiplier);

/// Maps a fill fraction to a display color.
///
/// - fraction <= low_threshold:  low_color -> normal_color over [0, low_threshold]
/// - fraction >= high_threshold: normal_color -> high_color over [high_threshold, 1]
/// - otherwise: normal_color
///
/// Both branches yield normal_color exactly at their threshold, so the mapping
/// is continuous for any 0 <= low_threshold < high_threshold <= 1.
Rgba threshold_color(float fraction, float low_threshold, float high_threshold,
                     const Rgba& low_color, const Rgba& normal_color, const Rgba& high_color);

} // namespace statgauge
