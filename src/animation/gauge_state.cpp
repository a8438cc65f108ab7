/// @file gauge_state.cpp
/// @brief Threshold normalization and the stock critical predicates

#include "animation/gauge_state.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace statgauge {

namespace {

constexpr float MIN_THRESHOLD_GAP = 0.01f;

float sanitize_fraction(float f, float fallback) {
    if (!std::isfinite(f)) {
        return fallback;
    }
    return std::clamp(f, 0.0f, 1.0f);
}

} // namespace

GaugeThresholds normalize_thresholds(GaugeThresholds thresholds) {
    const GaugeThresholds defaults;
    float low = sanitize_fraction(thresholds.low, defaults.low);
    float high = sanitize_fraction(thresholds.high, defaults.high);
    if (low > high) {
        std::swap(low, high);
    }
    if (high - low < MIN_THRESHOLD_GAP) {
        // Widen upward when there is room, otherwise push low down
        if (low + MIN_THRESHOLD_GAP <= 1.0f) {
            high = low + MIN_THRESHOLD_GAP;
        } else {
            high = 1.0f;
            low = 1.0f - MIN_THRESHOLD_GAP;
        }
    }
    return {low, high};
}

CriticalPredicate critical_when_low() {
    return [](float fraction, const GaugeThresholds& t) { return fraction <= t.low; };
}

CriticalPredicate critical_when_high() {
    return [](float fraction, const GaugeThresholds& t) { return fraction >= t.high; };
}

CriticalPredicate never_critical() {
    return [](float, const GaugeThresholds&) { return false; };
}

Rgba style_color(const GaugeStyle& style, float fraction) {
    return threshold_color(fraction, style.thresholds.low, style.thresholds.high,
                           style.low_color, style.normal_color, style.high_color);
}

bool is_critical(const GaugeStyle& style, float fraction) {
    return style.critical && style.critical(fraction, style.thresholds);
}

} // namespace statgauge
