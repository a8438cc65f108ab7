/// @file frame_clock.hpp
/// @brief Frame time source shared by every frame task.

#pragma once

#include <cstdint>

namespace statgauge {

/// Accumulates per-frame delta time. Advanced once per frame by the main loop
/// before the task scheduler ticks.
class FrameClock {
  public:
    /// Advances one frame. Negative deltas are treated as zero so elapsed time
    /// never decreases.
    /// @param delta_time Seconds since last frame
    void advance(float delta_time);

    /// Seconds covered by the most recent frame
    [[nodiscard]] float delta() const { return delta_; }

    /// Seconds accumulated since construction
    [[nodiscard]] double elapsed() const { return elapsed_; }

    /// Number of advance() calls since construction
    [[nodiscard]] uint64_t frame() const { return frame_; }

  private:
    float delta_ = 0.0f;
    double elapsed_ = 0.0;
    uint64_t frame_ = 0;
};

} // namespace statgauge
