/// @file hud_font.hpp
/// @brief HUD font loading and text helpers.
///
/// Loads a TTF once at startup; the helpers mirror Raylib's DrawText() and
/// MeasureText() so call sites never pass a Font handle around.

#pragma once

#include <raylib.h>

namespace statgauge {

/// Load the HUD font. Must be called *after* InitWindow().
/// Tries resources/fonts/Hack-Regular.ttf, then /usr/share/fonts/TTF/Hack-Regular.ttf,
/// then falls back to the Raylib default bitmap font.
void init_hud_font();

/// Unload the font if one was loaded. Call before CloseWindow().
void cleanup_hud_font();

/// DrawText() with the HUD font
void DrawHudText(const char* text, int posX, int posY, int fontSize, Color color);

/// MeasureText() with the HUD font
int MeasureHudText(const char* text, int fontSize);

} // namespace statgauge
