#pragma once
#include "movement_config.hpp"
#include "movement_state.hpp"

// ---------------------------------------------------------------------------
// CrouchResolver — crouch intent and smoothed capsule / eye geometry.
//
// Runs only while grounded: geometry is frozen in mid-air and a crouch
// pressed while airborne takes effect on landing. A detected ceiling forces
// the crouch regardless of the latched crouch input.
// ---------------------------------------------------------------------------

class CrouchResolver {
public:
    struct Targets {
        float     height;
        ecs::Vec3 center;      // keeps the feet at the body origin
        ecs::Vec3 eye_offset;
    };

    static bool    wants_crouch(bool crouch_held, bool ceiling_detected);
    static Targets targets(bool crouching, const MovementConfig& cfg);

    // Per-tick blend factor, clamped to [0, 1].
    static float   blend_factor(float dt, const MovementConfig& cfg);

    // ceiling_detected: upward cast from the feet of length standing_height.
    static void apply(bool ceiling_detected, float dt,
                      const MovementConfig& cfg, MovementState& state);
};
