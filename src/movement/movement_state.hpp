#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// MovementState — the single mutable record shared by the movement steps.
//
// Owned by MovementController; each step (TimerTracker, CrouchResolver,
// LookIntegrator, MotionIntegrator, JumpGate) receives it by reference.
// ---------------------------------------------------------------------------

struct MovementState {
    float     vertical_velocity = 0.0f;
    ecs::Vec2 planar_intent     = {0, 0};  // move axes, each in [-1, 1]
    ecs::Vec2 look_delta        = {0, 0};  // last raw look input

    float yaw_degrees   = 0.0f;  // body heading, positive turns right
    float pitch_degrees = 0.0f;  // camera pitch, clamped to [-90, 90]

    int   jump_count   = 0;
    float coyote_timer = 0.0f;   // may go negative while airborne

    bool grounded         = false;  // sampled at the start of the last tick
    bool sprint_held      = false;
    bool crouch_held      = false;
    bool auto_run_toggled = false;

    // Derived each grounded tick: crouch_held || ceiling detected.
    bool is_crouching = false;

    // Smoothed geometry, written to the mover and camera sink.
    float     current_height        = 0.0f;
    ecs::Vec3 current_center_offset = {0, 0, 0};
    ecs::Vec3 current_eye_offset    = {0, 0, 0};
};

enum class InputAction { Sprint, Crouch, Jump, AutoRun };
enum class InputPhase  { Started, Canceled };
