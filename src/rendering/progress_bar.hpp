/// @file progress_bar.hpp
/// @brief Raylib-drawn bar widget that receives gauge animation output.

#pragma once

#include "animation/gauge_state.hpp"

#include <raylib.h>

#include <optional>

namespace statgauge {

/// Converts a float color to Raylib's 8-bit color
Color to_raylib(const Rgba& color);

/// A rounded track with a proportional fill. Stores whatever the animator
/// last wrote and draws it on demand.
class ProgressBar : public VisualBinding {
  public:
    ProgressBar() = default;

    [[nodiscard]] std::optional<float> displayed_value() const override { return value_; }

    void set_value(float value) override { value_ = value; }
    void set_max(float max_value) override { max_ = max_value; }
    void set_fill_color(const Rgba& color) override { fill_ = color; }
    void set_opacity(float opacity) override { opacity_ = opacity; }

    [[nodiscard]] float value() const { return value_; }
    [[nodiscard]] float max() const { return max_; }

    /// Draws track, fill and border inside bounds (screen space)
    void draw(Rectangle bounds) const;

  private:
    float value_ = 0.0f;
    float max_ = 100.0f;
    Rgba fill_;
    float opacity_ = 1.0f;
};

} // namespace statgauge
