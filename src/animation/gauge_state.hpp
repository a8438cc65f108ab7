/// @file gauge_state.hpp
/// @brief Per-gauge animation state, registration-time style and the visual sink.
///
/// The animator owns one GaugeAnimationState per key. Rendering is kept out of
/// this layer entirely: the state only ever writes through a VisualBinding,
/// which the UI layer owns.

#pragma once

#include "animation/color.hpp"
#include "timing/task_scheduler.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace statgauge {

/// Sink representing one rendered bar. Owned by the UI layer; the animator
/// writes through it but never controls its lifetime.
class VisualBinding {
  public:
    virtual ~VisualBinding() = default;

    /// The value currently shown, if the sink has one
    [[nodiscard]] virtual std::optional<float> displayed_value() const = 0;

    virtual void set_value(float value) = 0;
    virtual void set_max(float max_value) = 0;
    virtual void set_fill_color(const Rgba& color) = 0;
    virtual void set_opacity(float opacity) = 0;
};

/// Low/high fractions that bound the normal color band
struct GaugeThresholds {
    float low = 0.25f;
    float high = 0.75f;
};

/// Clamps both thresholds into [0, 1] and restores low < high (swapping
/// reversed values, separating equal ones).
GaugeThresholds normalize_thresholds(GaugeThresholds thresholds);

/// Decides whether a gauge at the given fill fraction is in its critical band
using CriticalPredicate = std::function<bool(float fraction, const GaugeThresholds& thresholds)>;

/// Critical when fraction <= low threshold (e.g. health)
CriticalPredicate critical_when_low();

/// Critical when fraction >= high threshold (e.g. discord)
CriticalPredicate critical_when_high();

/// Never critical
CriticalPredicate never_critical();

/// Registration-time configuration of a gauge
struct GaugeStyle {
    Rgba normal_color;
    Rgba low_color;
    Rgba high_color;
    GaugeThresholds thresholds;
    CriticalPredicate critical; ///< Empty means never critical
};

/// Color for a fill fraction under this style
Rgba style_color(const GaugeStyle& style, float fraction);

/// True if the style's predicate reports the fraction as critical
bool is_critical(const GaugeStyle& style, float fraction);

/// Mutable animation record for one gauge
struct GaugeAnimationState {
    VisualBinding* binding = nullptr; ///< Null only for gauges auto-created by set_target
    GaugeStyle style;

    float current_value = 0.0f; ///< Last written value
    float target_value = 0.0f;  ///< Most recently requested value
    float max_value = 100.0f;   ///< Always >= 1

    TaskHandle transition; ///< In-flight transition, if any

    /// True while a transition is scheduled. Follows the handle, so a task
    /// cancelled behind the animator's back reads as stopped.
    [[nodiscard]] bool is_animating() const { return transition.is_running(); }

    /// current_value / max_value
    [[nodiscard]] float fraction() const { return current_value / max_value; }
};

using GaugeMap = std::unordered_map<std::string, GaugeAnimationState>;

} // namespace statgauge
