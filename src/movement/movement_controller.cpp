#include "movement_controller.hpp"
#include "crouch_resolver.hpp"
#include "jump_gate.hpp"
#include "look_integrator.hpp"
#include "motion_integrator.hpp"
#include "timer_tracker.hpp"

MovementController::MovementController(const MovementConfig& config, Mover& mover,
                                       ObstructionQuery& obstruction, CameraSink& camera)
    : config_(config),
      original_center_(mover.center()),
      mover_(mover),
      obstruction_(obstruction),
      camera_(camera) {
    config_.standing_height = mover.height();
    validate_movement_config(config_);

    state_.current_height        = mover.height();
    state_.current_center_offset = original_center_;
    state_.current_eye_offset    = camera.local_position();
}

void MovementController::tick(float dt) {
    const bool on_ground = mover_.is_grounded();

    // 1. Timers
    TimerTracker::apply(on_ground, dt, config_, state_);

    // 2. Crouch (geometry frozen while airborne)
    if (on_ground) {
        CrouchResolver::apply(ceiling_detected(), dt, config_, state_);
        mover_.set_height(state_.current_height);
        mover_.set_center(state_.current_center_offset);
        camera_.set_local_position(state_.current_eye_offset);
    }

    // 3. Look
    LookIntegrator::apply(config_, state_);
    camera_.set_local_pitch(state_.pitch_degrees);

    // 4. Motion
    mover_.move(MotionIntegrator::integrate(on_ground, dt, config_, state_));
}

bool MovementController::on_input_edge(InputAction action, InputPhase phase) {
    const bool started = (phase == InputPhase::Started);

    switch (action) {
        case InputAction::Sprint:
            state_.sprint_held = started;
            return false;
        case InputAction::Crouch:
            state_.crouch_held = started;
            return false;
        case InputAction::AutoRun:
            if (started) state_.auto_run_toggled = !state_.auto_run_toggled;
            return false;
        case InputAction::Jump:
            if (!started) return false;
            return JumpGate::try_jump(under_jump_ceiling(), config_, state_);
    }
    return false;
}

void MovementController::reconfigure(const MovementConfig& config) {
    MovementConfig next    = config;
    next.standing_height   = config_.standing_height;
    validate_movement_config(next);
    config_ = next;
}

bool MovementController::ceiling_detected() const {
    return cast_up(config_.standing_height);
}

bool MovementController::under_jump_ceiling() const {
    return cast_up(config_.standing_height * JumpGate::kCeilingCheckRatio);
}

bool MovementController::cast_up(float distance) const {
    return obstruction_.raycast(mover_.position(), {0.0f, 1.0f, 0.0f},
                                distance, config_.obstacle_mask);
}
