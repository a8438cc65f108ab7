/// @file recording_binding.hpp
/// @brief VisualBinding that records every write, for animator tests

#pragma once

#include "animation/gauge_state.hpp"

#include <optional>
#include <vector>

namespace statgauge::testing {

class RecordingBinding : public VisualBinding {
  public:
    RecordingBinding() = default;
    explicit RecordingBinding(float shown) : shown_(shown) {}

    [[nodiscard]] std::optional<float> displayed_value() const override { return shown_; }

    void set_value(float value) override {
        values.push_back(value);
        shown_ = value;
    }
    void set_max(float max_value) override { maxes.push_back(max_value); }
    void set_fill_color(const Rgba& color) override { colors.push_back(color); }
    void set_opacity(float opacity) override { opacities.push_back(opacity); }

    /// Forget every recorded write (the displayed value is kept)
    void clear() {
        values.clear();
        maxes.clear();
        colors.clear();
        opacities.clear();
    }

    [[nodiscard]] size_t write_count() const {
        return values.size() + maxes.size() + colors.size() + opacities.size();
    }

    std::vector<float> values;
    std::vector<float> maxes;
    std::vector<Rgba> colors;
    std::vector<float> opacities;

  private:
    std::optional<float> shown_;
};

} // namespace statgauge::testing
