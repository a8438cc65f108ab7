/// @file easing.hpp
/// @brief Interpolation curves mapping normalized progress [0, 1] to [0, 1].

#pragma once

#include <functional>

namespace statgauge {

/// An easing curve. Must map 0 -> 0 and 1 -> 1.
using EasingCurve = std::function<float(float)>;

/// Identity curve
float linear(float t);

/// Cubic Hermite with zero end tangents (3t^2 - 2t^3). Default for gauge transitions.
float ease_in_out(float t);

/// Quadratic deceleration
float ease_out(float t);

/// Clamps t into [0, 1]
float clamp01(float t);

/// Linear interpolation between a and b (t is not clamped)
float lerp(float a, float b, float t);

} // namespace statgauge
