#pragma once
#include "collaborators.hpp"
#include "movement_config.hpp"
#include "movement_state.hpp"

// ---------------------------------------------------------------------------
// MovementController — first-person movement state machine for one actor.
//
// The host drives it with set_move_input / set_look_input / on_input_edge as
// input arrives and tick(dt) once per fixed step. Each tick runs
// TimerTracker -> CrouchResolver -> LookIntegrator -> MotionIntegrator and
// submits the resulting displacement to the mover. Jump edges are evaluated
// immediately against the same state, between ticks.
//
// The mover, obstruction query and camera sink must outlive the controller.
// Throws ConfigError from the constructor and reconfigure() on invalid
// configuration.
// ---------------------------------------------------------------------------

class MovementController {
public:
    MovementController(const MovementConfig& config, Mover& mover,
                       ObstructionQuery& obstruction, CameraSink& camera);

    void tick(float dt);

    void set_move_input(const ecs::Vec2& axes) { state_.planar_intent = axes; }
    void set_look_input(const ecs::Vec2& delta) { state_.look_delta = delta; }

    // Returns true if the edge fired a jump.
    bool on_input_edge(InputAction action, InputPhase phase);

    // Replaces the tunables. standing_height keeps its captured value.
    void reconfigure(const MovementConfig& config);

    const MovementConfig& config() const { return config_; }
    const MovementState&  state()  const { return state_; }
    ecs::Vec3             original_center() const { return original_center_; }

    // Upward casts from the feet.
    bool ceiling_detected() const;
    bool under_jump_ceiling() const;

private:
    bool cast_up(float distance) const;

    MovementConfig    config_;
    MovementState     state_;
    ecs::Vec3         original_center_;

    Mover&            mover_;
    ObstructionQuery& obstruction_;
    CameraSink&       camera_;
};
