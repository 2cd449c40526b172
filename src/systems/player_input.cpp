#include "player_input.hpp"
#include "../components.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <cmath>
#include <vector>

using namespace ecs;

namespace {

struct Binding {
    InputAction action;
    int         key;
    int         gamepad_button;
};

const Binding kBindings[] = {
    {InputAction::Sprint,  KEY_LEFT_SHIFT,   GAMEPAD_BUTTON_LEFT_THUMB},
    {InputAction::Crouch,  KEY_LEFT_CONTROL, GAMEPAD_BUTTON_RIGHT_FACE_RIGHT},
    {InputAction::Jump,    KEY_SPACE,        GAMEPAD_BUTTON_RIGHT_FACE_DOWN},
    {InputAction::AutoRun, KEY_Q,            GAMEPAD_BUTTON_RIGHT_FACE_UP},
};

constexpr float kDeadzone = 0.15f;

// Right stick look rate, in mouse-pixel equivalents per second.
constexpr float kStickLookRate = 1500.0f;

void push_edges(const ButtonState& button, InputAction action, std::vector<InputEdge>& out) {
    if (button.pressed)  out.push_back({action, InputPhase::Started});
    if (button.released) out.push_back({action, InputPhase::Canceled});
}

float stick(float value) { return std::fabs(value) > kDeadzone ? value : 0.0f; }

} // namespace

void PlayerInputSystem::Update(World& world, float dt) {
    auto* record_ptr = world.try_resource<InputRecord>();
    if (!record_ptr) return;
    const InputRecord& record = *record_ptr;

    world.each<PlayerTag, PlayerInput>([&](Entity, PlayerTag&, PlayerInput& input) {
        // move_input and edges are per frame; look_input accumulates until
        // the next fixed step consumes it.
        Vec2 move = {0, 0};
        input.edges.clear();

        // 1. Keyboard + mouse
        if (record.keys[KEY_W].down) move.y += 1.0f;
        if (record.keys[KEY_S].down) move.y -= 1.0f;
        if (record.keys[KEY_D].down) move.x += 1.0f;
        if (record.keys[KEY_A].down) move.x -= 1.0f;

        input.look_input.x += record.mouse_delta.x;
        input.look_input.y -= record.mouse_delta.y;

        for (const Binding& b : kBindings) push_edges(record.keys[b.key], b.action, input.edges);

        // 2. Gamepads (stick +Y is down)
        for (const GamepadState& gp : record.gamepads) {
            move.x += stick(gp.axes[GAMEPAD_AXIS_LEFT_X]);
            move.y -= stick(gp.axes[GAMEPAD_AXIS_LEFT_Y]);
            input.look_input.x += stick(gp.axes[GAMEPAD_AXIS_RIGHT_X]) * kStickLookRate * dt;
            input.look_input.y -= stick(gp.axes[GAMEPAD_AXIS_RIGHT_Y]) * kStickLookRate * dt;

            for (const Binding& b : kBindings)
                push_edges(gp.buttons[b.gamepad_button], b.action, input.edges);
        }

        // 3. Diagonals and stacked devices never exceed unit length.
        const float len = std::sqrt(move.x * move.x + move.y * move.y);
        if (len > 1.0f) move = {move.x / len, move.y / len};
        input.move_input = move;
    });
}
