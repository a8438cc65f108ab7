/// @file stat_hud.cpp
/// @brief Implements the stat panel

#include "ui/stat_hud.hpp"

#include "rendering/hud_font.hpp"
#include "stats/stat_gauges.hpp"
#include "ui/ui_scale.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace statgauge {

namespace {

const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TITLE_COLOR = {230, 230, 240, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color VALUE_COLOR = {220, 220, 230, 255};
const Color CRITICAL_COLOR = {255, 120, 110, 255};

} // namespace

StatHud::StatHud() {
    std::vector<StatGaugePreset> presets = default_stat_gauges();
    rows_.reserve(presets.size());
    for (StatGaugePreset& preset : presets) {
        rows_.push_back({preset.kind, std::move(preset.style), ProgressBar{}});
    }
}

void StatHud::attach(GaugeAnimator& animator) {
    for (Row& row : rows_) {
        animator.register_gauge(stat_key(row.kind), &row.bar, row.style);
    }
}

float StatHud::draw(const std::string& name, const PlayerStats& stats, float panel_x,
                    float panel_y, float panel_w) const {
    const auto& sc = ui_scale();
    float row_h = static_cast<float>(sc.font_small) + 4.0f + sc.bar_height + sc.row_gap;
    float panel_h = sc.padding * 2.0f + static_cast<float>(sc.font_big) + sc.row_gap +
                    row_h * static_cast<float>(rows_.size());

    DrawRectangleRec({panel_x, panel_y, panel_w, panel_h}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, panel_h}, 1.0f, BORDER_COLOR);

    float cx = panel_x + sc.padding;
    float cy = panel_y + sc.padding;
    float inner_w = panel_w - 2.0f * sc.padding;

    DrawHudText(name.c_str(), static_cast<int>(cx), static_cast<int>(cy), sc.font_big,
                TITLE_COLOR);
    cy += static_cast<float>(sc.font_big) + sc.row_gap;

    for (const Row& row : rows_) {
        int value = stat_value(stats, row.kind);
        int max_value = stat_max(stats, row.kind);

        DrawHudText(stat_label(row.kind), static_cast<int>(cx), static_cast<int>(cy),
                    sc.font_small, LABEL_COLOR);

        char readout[32];
        std::snprintf(readout, sizeof(readout), "%d/%d", value, max_value);
        float shown_fraction = row.bar.value() / std::max(1.0f, row.bar.max());
        int rw = MeasureHudText(readout, sc.font_small);
        DrawHudText(readout, static_cast<int>(cx + inner_w) - rw, static_cast<int>(cy),
                    sc.font_small, is_critical(row.style, shown_fraction) ? CRITICAL_COLOR
                                                                          : VALUE_COLOR);
        cy += static_cast<float>(sc.font_small) + 4.0f;

        row.bar.draw({cx, cy, inner_w, sc.bar_height});
        cy += sc.bar_height + sc.row_gap;
    }

    return panel_h;
}

} // namespace statgauge
