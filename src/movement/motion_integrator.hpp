#pragma once
#include "movement_config.hpp"
#include "movement_state.hpp"

// ---------------------------------------------------------------------------
// MotionIntegrator — planar speed, air control and gravity.
//
// Produces the displacement for one tick; the caller hands it to the mover.
// Gravity is integrated every tick, grounded or not; TimerTracker's floor
// keeps it from accumulating while standing.
// ---------------------------------------------------------------------------

class MotionIntegrator {
public:
    // Forward input below this cancels auto-run.
    static constexpr float kAutoRunCancelThreshold = -0.1f;

    // Crouch speed wins over sprint.
    static float target_speed(const MovementConfig& cfg, const MovementState& state);

    static float effective_forward(float raw_forward, bool auto_run);

    // Planar velocity (units/s) in world space for the current heading.
    static ecs::Vec3 planar_velocity(bool on_ground,
                                     const MovementConfig& cfg, const MovementState& state);

    // Integrates gravity into state.vertical_velocity and returns the
    // displacement (planar + vertical) * dt.
    static ecs::Vec3 integrate(bool on_ground, float dt,
                               const MovementConfig& cfg, MovementState& state);
};
