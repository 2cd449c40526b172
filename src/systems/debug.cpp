#include "debug.hpp"
#include "../debug_panel.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <string>

namespace {

struct Style {
    static constexpr int   kMargin     = 10;
    static constexpr int   kPad        = 8;
    static constexpr int   kWidth      = 250;
    static constexpr int   kRowHeight  = 15;
    static constexpr int   kGap        = 4;   // above each section divider
    static constexpr int   kValueX     = 120; // value column, from content left
    static constexpr int   kFontRow    = 10;
    static constexpr int   kFontHeader = 11;

    static constexpr Color kBackground = {18,  18,  22,  215};
    static constexpr Color kBorder     = {85,  85,  95,  200};
    static constexpr Color kTitle      = {150, 150, 160, 255};
    static constexpr Color kSection    = {120, 200, 230, 255};
    static constexpr Color kLabel      = {185, 185, 185, 255};
    static constexpr Color kValue      = RAYWHITE;
};

int overlay_height(const DebugPanel& panel) {
    const int sections = static_cast<int>(panel.sections().size());
    const int lines    = 1 + sections + static_cast<int>(panel.row_count());
    return 2 * Style::kPad + lines * Style::kRowHeight + sections * Style::kGap;
}

void draw_row(int x, int y, const std::string& label, const std::string& value) {
    DrawText(label.c_str(), x, y, Style::kFontRow, Style::kLabel);
    DrawText(value.c_str(), x + Style::kValueX, y, Style::kFontRow, Style::kValue);
}

} // namespace

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (const auto* input = world.try_resource<InputRecord>()) {
        if (input->keys[KEY_F3].pressed) panel->toggle();
    }
    if (!panel->visible) return;

    // Top-right corner, clear of the HUD text on the left.
    const int left = GetScreenWidth() - Style::kWidth - Style::kMargin;
    const int top  = Style::kMargin;
    const int h    = overlay_height(*panel);
    DrawRectangle(left, top, Style::kWidth, h, Style::kBackground);
    DrawRectangleLines(left, top, Style::kWidth, h, Style::kBorder);

    const int x = left + Style::kPad;
    int       y = top + Style::kPad;
    DrawText("DEBUG  [F3]", x, y, Style::kFontHeader, Style::kTitle);
    y += Style::kRowHeight;

    for (const auto& section : panel->sections()) {
        y += Style::kGap;
        DrawLine(x, y - 2, left + Style::kWidth - Style::kPad, y - 2, Style::kBorder);
        DrawText(section.title.c_str(), x, y, Style::kFontHeader, Style::kSection);
        y += Style::kRowHeight;

        for (const auto& row : section.rows) {
            draw_row(x + Style::kGap, y, row.label, row.fn());
            y += Style::kRowHeight;
        }
    }
}
