/// @file frame_clock.cpp
/// @brief Implements the frame clock

#include "timing/frame_clock.hpp"

#include <cmath>

namespace statgauge {

void FrameClock::advance(float delta_time) {
    if (!std::isfinite(delta_time) || delta_time < 0.0f) {
        delta_time = 0.0f;
    }
    delta_ = delta_time;
    elapsed_ += static_cast<double>(delta_time);
    frame_++;
}

} // namespace statgauge
