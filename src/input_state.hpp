#pragma once
#include <ecs/ecs.hpp>
#include <vector>

// ---------------------------------------------------------------------------
// InputRecord — raw device snapshot for one frame (World resource).
//
// Written by InputGatherSystem, the only system that talks to Raylib's input
// API. Indices are Raylib key / button / axis codes. Every button carries its
// press and release edges because sprint and crouch latch on both.
// ---------------------------------------------------------------------------

constexpr int kMaxKeys           = 512;
constexpr int kMaxGamepads       = 4;
constexpr int kMaxGamepadAxes    = 8;
constexpr int kMaxGamepadButtons = 32;

struct ButtonState {
    bool down     = false;
    bool pressed  = false;  // went down this frame
    bool released = false;  // went up this frame
};

struct GamepadState {
    int         id = -1;
    float       axes[kMaxGamepadAxes] = {};
    ButtonState buttons[kMaxGamepadButtons];
};

struct InputRecord {
    ButtonState keys[kMaxKeys];

    // Pixels since last frame, +Y is down.
    ecs::Vec2 mouse_delta = {0, 0};

    // Devices that look like real controllers only.
    std::vector<GamepadState> gamepads;
};
