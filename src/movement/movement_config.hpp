#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// MovementConfig — tunables for the first-person controller (Authoring).
//
// Supplied once per session (scene "movement" block). standing_height is not
// authored: MovementController captures it from the mover's initial geometry.
// ---------------------------------------------------------------------------

struct MovementConfig {
    // Movement
    float walk_speed             = 5.0f;
    float sprint_multiplier      = 1.5f;
    float air_control_multiplier = 0.5f;  // [0, 1]

    // Crouch
    float crouch_speed           = 2.0f;
    float crouch_height          = 1.0f;
    float crouch_transition_rate = 10.0f;
    float standing_height        = 2.0f;  // overwritten from the mover

    // Jump & physics
    float jump_height            = 1.2f;
    int   max_jumps              = 2;
    float gravity                = -20.0f;
    float coyote_time_duration   = 0.2f;

    // Camera & eyes
    float look_sensitivity       = 0.1f;
    float eye_height_ratio       = 0.9f;  // (0, 1]

    // Object layers that count as ceilings (bit i = object layer i).
    uint32_t obstacle_mask       = 1u;
};

struct ConfigError : std::runtime_error {
    explicit ConfigError(const std::string& what)
        : std::runtime_error("MovementConfig: " + what) {}
};

// Throws ConfigError on the first field outside its valid range.
void validate_movement_config(const MovementConfig& cfg);
