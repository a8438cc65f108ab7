/// @file main.cpp
/// @brief statgauge entry point: animated character stat HUD
///
/// Shows five animated stat bars and a panel of items and hazards. Using an
/// item or triggering a hazard changes the character's stats, which the
/// gauge animator eases toward over a short transition while critical bars
/// pulse. Supports both native desktop and Emscripten/WASM builds.

#include "animation/gauge_animator.hpp"
#include "rendering/hud_font.hpp"
#include "stats/inventory.hpp"
#include "stats/item_effect.hpp"
#include "stats/player_stats.hpp"
#include "stats/stat_gauges.hpp"
#include "timing/frame_clock.hpp"
#include "timing/task_scheduler.hpp"
#include "ui/action_panel.hpp"
#include "ui/shortcuts.hpp"
#include "ui/stat_hud.hpp"
#include "ui/ui_scale.hpp"

#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <algorithm>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 640;
constexpr int MIN_HEIGHT = 480;
constexpr int TARGET_FPS = 60;
constexpr const char* CHARACTER_NAME = "Wandering Pony";

const Color BACKGROUND_COLOR = {25, 25, 30, 255};
const Color HINT_COLOR = {140, 140, 140, 255};

using statgauge::StatKind;

std::shared_ptr<const statgauge::ItemEffect>
make_hazard(const char* name, std::vector<std::pair<StatKind, int>> deltas) {
    return std::make_shared<statgauge::StatDeltaEffect>(name, std::move(deltas));
}

/// One button per usable consumable, followed by the demo hazards
std::vector<statgauge::HudAction> build_actions(const statgauge::ItemCatalog& catalog) {
    std::vector<statgauge::HudAction> actions;
    for (const statgauge::ItemDef& item : catalog.items()) {
        if (item.usable && item.category == statgauge::ItemCategory::CONSUMABLE) {
            actions.push_back({item.name, item.id, item.effect});
        }
    }
    actions.push_back({"Take a Hit", "", make_hazard("Hit", {{StatKind::HEALTH, -20}})});
    actions.push_back({"Long Walk", "", make_hazard("Walk", {{StatKind::ENERGY, -20}})});
    actions.push_back({"Cast Spell", "", make_hazard("Spell", {{StatKind::MAGIC, -15}})});
    actions.push_back({"Kind Word", "", make_hazard("Kindness", {{StatKind::FRIENDSHIP, 10}})});
    actions.push_back({"Discord Surge", "", make_hazard("Surge", {{StatKind::DISCORD, 20}})});
    actions.push_back({"Cleanse", "", make_hazard("Cleanse", {{StatKind::DISCORD, -25}})});
    return actions;
}

/// All mutable state needed by the frame loop, bundled so it can be passed
/// through Emscripten's void* callback. Declaration order matters: the
/// animator is destroyed first, while the scheduler and the HUD bars it
/// writes to are still alive.
struct FrameState {
    statgauge::PlayerStats stats;
    statgauge::ItemCatalog catalog = statgauge::default_item_catalog();
    statgauge::Inventory inventory = statgauge::starting_inventory();
    std::vector<statgauge::HudAction> actions;
    std::string status;

    statgauge::FrameClock clock;
    statgauge::TaskScheduler scheduler;
    statgauge::StatHud hud;
    std::unique_ptr<statgauge::GaugeAnimator> animator;
};

/// Applies the pressed action and reports the outcome in the status line
void apply_action(FrameState& state, const statgauge::HudAction& action) {
    bool applied = false;
    if (!action.item_id.empty()) {
        applied = state.inventory.use_item(state.catalog, action.item_id, state.stats);
    } else if (action.effect != nullptr && action.effect->can_apply(state.stats)) {
        action.effect->apply(state.stats);
        applied = true;
    }

    state.status = applied ? action.label : "Nothing happens.";
    if (applied) {
        if (state.animator->settings().verbose_logging) {
            std::fprintf(stderr, "[statgauge] Applied '%s'\n", action.label.c_str());
        }
        statgauge::push_stats(*state.animator, state.stats);
    }
}

/// One frame of the application, called each tick by the native loop or by
/// emscripten_set_main_loop_arg.
void frame_tick(FrameState& state) {
    state.clock.advance(GetFrameTime());
    state.scheduler.tick(state.clock);

    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();
    statgauge::update_ui_scale(screen_w, screen_h);
    const auto& sc = statgauge::ui_scale();

    // --- Keyboard shortcuts: 1-9 then 0 trigger actions, R restores the character ---
    std::optional<size_t> pressed;
    for (int key = KEY_ZERO; key <= KEY_NINE; key++) {
        if (IsKeyPressed(key)) {
            if (auto index = statgauge::action_for_digit(key - KEY_ZERO, state.actions.size())) {
                pressed = index;
            }
        }
    }
    if (IsKeyPressed(KEY_R)) {
        state.stats = statgauge::PlayerStats{};
        state.inventory = statgauge::starting_inventory();
        state.status = "Fully restored.";
        statgauge::push_stats(*state.animator, state.stats);
    }

    // --- Draw ---
    BeginDrawing();
    ClearBackground(BACKGROUND_COLOR);

    float panel_x = sc.margin;
    float panel_y = sc.margin;
    float hud_h = state.hud.draw(CHARACTER_NAME, state.stats, panel_x, panel_y, sc.panel_w);

    float actions_y = panel_y + hud_h + sc.margin;
    statgauge::ActionPanelResult result =
        statgauge::draw_action_panel(state.actions, state.stats, state.inventory, state.status,
                                     panel_x, actions_y, sc.panel_w);
    if (result.pressed) {
        pressed = result.pressed;
    }

    // Hint sits under the panels, or at the bottom edge if they run long
    float hint_y = std::min(actions_y + result.panel_height + sc.margin,
                            static_cast<float>(screen_h - sc.font_small) - sc.margin);
    statgauge::DrawHudText("1-9, 0: actions   R: restore", static_cast<int>(sc.margin),
                           static_cast<int>(hint_y), sc.font_small, HINT_COLOR);

    EndDrawing();

    // --- Process actions (take effect next frame) ---
    if (pressed) {
        apply_action(state, state.actions[*pressed]);
    }
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback: unwraps the void* to FrameState.
void emscripten_frame(void* arg) {
    auto* state = static_cast<FrameState*>(arg);
    frame_tick(*state);
}
#endif

} // namespace

int main() {
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "statgauge: Character Stats");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);
    statgauge::init_hud_font();

    FrameState state;
    state.actions = build_actions(state.catalog);
    state.animator = std::make_unique<statgauge::GaugeAnimator>(state.scheduler);
    state.hud.attach(*state.animator);
    statgauge::push_stats(*state.animator, state.stats);

#ifdef __EMSCRIPTEN__
    // Emscripten takes ownership of the main loop; we pass state via void*.
    // 0 = use requestAnimationFrame (browser-native vsync), 1 = simulate infinite loop.
    emscripten_set_main_loop_arg(emscripten_frame, &state, 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(state);
    }
#endif

    // Cancel all gauge tasks before the bars go away
    state.animator.reset();
    statgauge::cleanup_hud_font();
    CloseWindow();
    return 0;
}
