/// @file pulse_overseer.cpp
/// @brief Implements the critical-band pulse

#include "animation/pulse_overseer.hpp"

#include <cmath>

namespace statgauge {

namespace {

constexpr float PULSE_CENTER = 0.85f;
constexpr float PULSE_AMPLITUDE = 0.15f;
constexpr double PULSE_SPEED = 2.0; ///< Radians per second

} // namespace

float pulse_opacity(double elapsed_seconds) {
    return PULSE_CENTER +
           PULSE_AMPLITUDE * static_cast<float>(std::sin(PULSE_SPEED * elapsed_seconds));
}

PulseOverseer::PulseOverseer(const GaugeMap* gauges) : gauges_(gauges) {}

bool PulseOverseer::tick(const FrameClock& clock) {
    float pulse = pulse_opacity(clock.elapsed());
    for (const auto& [key, state] : *gauges_) {
        (void)key;
        if (state.binding == nullptr) {
            continue;
        }
        state.binding->set_opacity(is_critical(state.style, state.fraction()) ? pulse : 1.0f);
    }
    return true; // Runs until cancelled
}

} // namespace statgauge
