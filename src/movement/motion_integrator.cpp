#include "motion_integrator.hpp"
#include "../math_util.hpp"

using namespace fpmove;

float MotionIntegrator::target_speed(const MovementConfig& cfg, const MovementState& state) {
    if (state.is_crouching) return cfg.crouch_speed;
    if (state.sprint_held)  return cfg.walk_speed * cfg.sprint_multiplier;
    return cfg.walk_speed;
}

float MotionIntegrator::effective_forward(float raw_forward, bool auto_run) {
    return (auto_run && raw_forward > kAutoRunCancelThreshold) ? 1.0f : raw_forward;
}

ecs::Vec3 MotionIntegrator::planar_velocity(bool on_ground,
                                            const MovementConfig& cfg,
                                            const MovementState& state) {
    const float forward = effective_forward(state.planar_intent.y, state.auto_run_toggled);

    ecs::Vec3 move = math::add(
        math::scale(math::heading_right(state.yaw_degrees), state.planar_intent.x),
        math::scale(math::heading_forward(state.yaw_degrees), forward));

    if (!on_ground) move = math::scale(move, cfg.air_control_multiplier);

    return math::scale(move, target_speed(cfg, state));
}

ecs::Vec3 MotionIntegrator::integrate(bool on_ground, float dt,
                                      const MovementConfig& cfg, MovementState& state) {
    ecs::Vec3 velocity = planar_velocity(on_ground, cfg, state);

    state.vertical_velocity += cfg.gravity * dt;
    velocity.y += state.vertical_velocity;

    return math::scale(velocity, dt);
}
