/// @file ui_scale.cpp
/// @brief Computes per-frame responsive HUD metrics from the window size.

#include "ui/ui_scale.hpp"

namespace statgauge {

namespace {

UIScale g_scale;

int scaled_font(float base, float factor) {
    int v = static_cast<int>(std::round(base * factor));
    return std::clamp(v, static_cast<int>(base * 0.65f), static_cast<int>(base * 1.6f));
}

} // namespace

void update_ui_scale(int screen_w, int screen_h) {
    constexpr float BASELINE_H = 720.0f;
    constexpr float BASELINE_W = 1280.0f;

    float sw = static_cast<float>(screen_w);
    float sh = static_cast<float>(screen_h);

    // Height-dominant blend
    float hf = sh / BASELINE_H;
    float wf = sw / BASELINE_W;
    g_scale.factor = std::clamp(hf * 0.7f + wf * 0.3f, 0.6f, 1.8f);
    float f = g_scale.factor;

    g_scale.panel_w = std::clamp(sw * 0.32f, 260.0f, 520.0f);
    g_scale.margin = std::clamp(12.0f * f, 6.0f, 20.0f);

    g_scale.font_normal = scaled_font(16.0f, f);
    g_scale.font_small = scaled_font(13.0f, f);
    g_scale.font_big = scaled_font(22.0f, f);

    g_scale.padding = std::round(10.0f * f);
    g_scale.row_gap = std::round(8.0f * f);
    g_scale.bar_height = std::clamp(18.0f * f, 10.0f, 30.0f);
    g_scale.button_height = std::clamp(30.0f * f, 22.0f, 46.0f);
}

const UIScale& ui_scale() {
    return g_scale;
}

} // namespace statgauge
