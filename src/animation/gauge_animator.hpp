/// @file gauge_animator.hpp
/// @brief Drives named gauges through eased value/color transitions.
///
/// The animator owns one GaugeAnimationState per key and spawns its work on a
/// caller-supplied TaskScheduler:
///   - one transition task per key while its value is moving
///   - one pulse task for the whole animator, started on first registration
///     and restarted by set_target if something else cancelled it
///
/// Every operation clamps or ignores bad input instead of failing; this sits
/// on the per-frame visual path and must never take other gauges down with it.

#pragma once

#include "animation/easing.hpp"
#include "animation/gauge_state.hpp"
#include "timing/task_scheduler.hpp"

#include <cstddef>
#include <string>

namespace statgauge {

/// Per-animator configuration
struct AnimatorSettings {
    float duration = 0.6f;              ///< Seconds per transition
    EasingCurve curve = ease_in_out;    ///< Progress -> eased progress
    bool enable_pulse = true;           ///< Start the critical-band pulse
    bool enable_color_transitions = true; ///< Write threshold colors while animating
    bool verbose_logging = false;       ///< Informational messages on stderr
};

class GaugeAnimator {
  public:
    /// @param scheduler Ticks every task this animator spawns. Must outlive the animator.
    explicit GaugeAnimator(TaskScheduler& scheduler, AnimatorSettings settings = {});

    /// Cancels every outstanding task (see shutdown_all)
    ~GaugeAnimator();

    GaugeAnimator(const GaugeAnimator&) = delete;
    GaugeAnimator& operator=(const GaugeAnimator&) = delete;

    /// Creates or replaces the gauge for key. Current and target values are
    /// taken from the binding's displayed value (0 if none), max starts at 100.
    /// No transition is started. Ignored (with a warning) for an empty key or
    /// null binding.
    void register_gauge(const std::string& key, VisualBinding* binding, const GaugeStyle& style);

    /// Moves the gauge toward value over the configured duration, replacing
    /// any transition already in flight for key. max_value below 1 is raised
    /// to 1 and value is clamped into [0, max_value]. An unknown key gets a
    /// binding-less gauge with the default style.
    void set_target(const std::string& key, float value, float max_value);

    /// Cancels the gauge's transition and forgets it. No-op for unknown keys.
    void unregister_gauge(const std::string& key);

    /// Cancels all transitions and the pulse, then forgets every gauge.
    /// Idempotent.
    void shutdown_all();

    /// State for key, or nullptr
    [[nodiscard]] const GaugeAnimationState* find(const std::string& key) const;

    [[nodiscard]] size_t gauge_count() const { return gauges_.size(); }
    [[nodiscard]] bool is_pulse_running() const { return pulse_.is_running(); }
    [[nodiscard]] const AnimatorSettings& settings() const { return settings_; }

  private:
    void start_transition(GaugeAnimationState& state);
    void ensure_pulse();

    TaskScheduler& scheduler_;
    AnimatorSettings settings_;
    GaugeMap gauges_;
    TaskHandle pulse_;
};

} // namespace statgauge
