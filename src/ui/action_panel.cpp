/// @file action_panel.cpp
/// @brief Implements the action panel with custom-drawn Raylib buttons

#include "ui/action_panel.hpp"

#include "rendering/hud_font.hpp"
#include "ui/ui_scale.hpp"

#include <string>

namespace statgauge {

namespace {

constexpr int BUTTON_COLUMNS = 2;

const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color HEADER_COLOR = {180, 205, 240, 255};
const Color BUTTON_BG = {50, 50, 65, 255};
const Color BUTTON_BG_HOVER = {65, 65, 85, 255};
const Color BUTTON_BG_DISABLED = {38, 38, 46, 255};
const Color BUTTON_TEXT = {220, 220, 230, 255};
const Color BUTTON_TEXT_DISABLED = {100, 100, 115, 255};
const Color STATUS_COLOR = {180, 180, 100, 255};

/// Draw a button. Returns true if clicked this frame.
bool draw_button(const char* text, Rectangle rect, bool enabled, int font_size) {
    Vector2 mouse = GetMousePosition();
    bool hovered = enabled && CheckCollisionPointRec(mouse, rect);
    bool clicked = hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    Color bg = !enabled ? BUTTON_BG_DISABLED : (hovered ? BUTTON_BG_HOVER : BUTTON_BG);
    DrawRectangleRec(rect, bg);
    DrawRectangleLinesEx(rect, 1.0f, BORDER_COLOR);

    int tw = MeasureHudText(text, font_size);
    DrawHudText(text, static_cast<int>(rect.x + (rect.width - static_cast<float>(tw)) / 2.0f),
                static_cast<int>(rect.y + (rect.height - static_cast<float>(font_size)) / 2.0f),
                font_size, enabled ? BUTTON_TEXT : BUTTON_TEXT_DISABLED);

    return clicked;
}

} // namespace

ActionPanelResult draw_action_panel(const std::vector<HudAction>& actions, const PlayerStats& stats,
                                    const Inventory& inventory, const std::string& status,
                                    float panel_x, float panel_y, float panel_w) {
    const auto& sc = ui_scale();
    size_t button_rows = (actions.size() + BUTTON_COLUMNS - 1) / BUTTON_COLUMNS;
    float panel_h = sc.padding * 2.0f + static_cast<float>(sc.font_normal) + sc.row_gap +
                    static_cast<float>(button_rows) * (sc.button_height + sc.row_gap) +
                    static_cast<float>(sc.font_small);

    DrawRectangleRec({panel_x, panel_y, panel_w, panel_h}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, panel_h}, 1.0f, BORDER_COLOR);

    float cx = panel_x + sc.padding;
    float cy = panel_y + sc.padding;
    float inner_w = panel_w - 2.0f * sc.padding;
    float button_w = (inner_w - sc.row_gap * (BUTTON_COLUMNS - 1)) / BUTTON_COLUMNS;

    DrawHudText("Actions", static_cast<int>(cx), static_cast<int>(cy), sc.font_normal,
                HEADER_COLOR);
    cy += static_cast<float>(sc.font_normal) + sc.row_gap;

    ActionPanelResult result;
    for (size_t i = 0; i < actions.size(); i++) {
        const HudAction& action = actions[i];
        size_t col = i % BUTTON_COLUMNS;
        size_t row = i / BUTTON_COLUMNS;
        Rectangle rect = {cx + static_cast<float>(col) * (button_w + sc.row_gap),
                          cy + static_cast<float>(row) * (sc.button_height + sc.row_gap), button_w,
                          sc.button_height};
        bool enabled = action.effect != nullptr && action.effect->can_apply(stats);
        std::string text = action.label;
        if (!action.item_id.empty()) {
            int held = inventory.count(action.item_id);
            enabled = enabled && held > 0;
            text += " x" + std::to_string(held);
        }
        if (draw_button(text.c_str(), rect, enabled, sc.font_small)) {
            result.pressed = i;
        }
    }
    cy += static_cast<float>(button_rows) * (sc.button_height + sc.row_gap);

    if (!status.empty()) {
        DrawHudText(status.c_str(), static_cast<int>(cx), static_cast<int>(cy), sc.font_small,
                    STATUS_COLOR);
    }

    result.panel_height = panel_h;
    return result;
}

} // namespace statgauge
