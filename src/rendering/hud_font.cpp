/// @file hud_font.cpp
/// @brief Loads and manages the HUD font.

#include "rendering/hud_font.hpp"

#include <cstdio>

namespace statgauge {

namespace {

constexpr int FONT_BASE_SIZE = 48; // Large base so downscaled text stays crisp
constexpr int FONT_GLYPHS = 256;

const char* const FONT_PATHS[] = {
    "resources/fonts/Hack-Regular.ttf",
    "/usr/share/fonts/TTF/Hack-Regular.ttf",
};

bool g_font_loaded = false;
Font g_font = {};

bool try_load(const char* path) {
    if (!FileExists(path)) {
        return false;
    }
    g_font = LoadFontEx(path, FONT_BASE_SIZE, nullptr, FONT_GLYPHS);
    if (g_font.glyphCount <= 0) {
        return false;
    }
    SetTextureFilter(g_font.texture, TEXTURE_FILTER_BILINEAR);
    return true;
}

float spacing_for(int fontSize) {
    return static_cast<float>(fontSize) / 10.0f;
}

} // namespace

void init_hud_font() {
    for (const char* path : FONT_PATHS) {
        if (try_load(path)) {
            g_font_loaded = true;
            return;
        }
    }
    g_font = GetFontDefault();
    g_font_loaded = false;
    std::fprintf(stderr, "[statgauge] HUD font not found, using Raylib default.\n");
}

void cleanup_hud_font() {
    if (g_font_loaded) {
        UnloadFont(g_font);
        g_font_loaded = false;
    }
}

void DrawHudText(const char* text, int posX, int posY, int fontSize, Color color) {
    DrawTextEx(g_font, text, {static_cast<float>(posX), static_cast<float>(posY)},
               static_cast<float>(fontSize), spacing_for(fontSize), color);
}

int MeasureHudText(const char* text, int fontSize) {
    Vector2 size = MeasureTextEx(g_font, text, static_cast<float>(fontSize), spacing_for(fontSize));
    return static_cast<int>(size.x);
}

} // namespace statgauge
