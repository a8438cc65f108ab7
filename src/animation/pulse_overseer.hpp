/// @file pulse_overseer.hpp
/// @brief Continuous opacity pulse for gauges sitting in their critical band.

#pragma once

#include "animation/gauge_state.hpp"
#include "timing/task_scheduler.hpp"

namespace statgauge {

/// Lowest opacity reached by the pulse
constexpr float PULSE_MIN_OPACITY = 0.70f;

/// Pulse opacity at a global time: 0.85 + 0.15 * sin(2t), in [0.70, 1.00]
float pulse_opacity(double elapsed_seconds);

/// Frame task that runs for the lifetime of its animator. Each tick it writes
/// opacity = pulse_opacity(elapsed) to every critical gauge and 1.0 to the
/// rest. It only touches opacity, never value or color, so it composes with
/// transition tasks in either order within a frame.
class PulseOverseer : public FrameTask {
  public:
    /// @param gauges Non-owning; must outlive the task or the task must be
    ///               cancelled before the map is destroyed
    explicit PulseOverseer(const GaugeMap* gauges);

    bool tick(const FrameClock& clock) override;

  private:
    const GaugeMap* gauges_;
};

} // namespace statgauge
