/// @file progress_bar.cpp
/// @brief Draws the gauge bar with Raylib primitives

#include "rendering/progress_bar.hpp"

#include <algorithm>

namespace statgauge {

namespace {

const Color TRACK_COLOR = {0, 0, 0, 77};        // Black at 30%
const Color BORDER_COLOR = {255, 255, 255, 51}; // White at 20%

constexpr float TRACK_ROUNDNESS = 0.5f; // Raylib roundness parameter (0.0–1.0)
constexpr int CORNER_SEGMENTS = 6;
constexpr float BORDER_THICKNESS = 1.0f;
constexpr float FILL_INSET = 2.0f;

unsigned char to_byte(float v) {
    return static_cast<unsigned char>(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
}

/// Apply alpha modulation to a color
Color with_alpha(Color c, float alpha) {
    auto a = static_cast<unsigned char>(static_cast<float>(c.a) * std::clamp(alpha, 0.0f, 1.0f));
    return {c.r, c.g, c.b, a};
}

} // namespace

Color to_raylib(const Rgba& color) {
    return {to_byte(color.r), to_byte(color.g), to_byte(color.b), to_byte(color.a)};
}

void ProgressBar::draw(Rectangle bounds) const {
    DrawRectangleRounded(bounds, TRACK_ROUNDNESS, CORNER_SEGMENTS, TRACK_COLOR);

    float fraction = max_ > 0.0f ? std::clamp(value_ / max_, 0.0f, 1.0f) : 0.0f;
    float inner_w = bounds.width - 2.0f * FILL_INSET;
    float fill_w = inner_w * fraction;
    if (fill_w >= 1.0f) {
        Rectangle fill_rect = {bounds.x + FILL_INSET, bounds.y + FILL_INSET, fill_w,
                               bounds.height - 2.0f * FILL_INSET};
        DrawRectangleRounded(fill_rect, TRACK_ROUNDNESS, CORNER_SEGMENTS,
                             with_alpha(to_raylib(fill_), opacity_));
    }

    DrawRectangleRoundedLines(bounds, TRACK_ROUNDNESS, CORNER_SEGMENTS, BORDER_THICKNESS,
                                BORDER_COLOR);
}

} // namespace statgauge
