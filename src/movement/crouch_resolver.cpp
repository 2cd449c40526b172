#include "crouch_resolver.hpp"
#include "../math_util.hpp"
#include <algorithm>

using namespace fpmove;

bool CrouchResolver::wants_crouch(bool crouch_held, bool ceiling_detected) {
    return crouch_held || ceiling_detected;
}

CrouchResolver::Targets CrouchResolver::targets(bool crouching, const MovementConfig& cfg) {
    float height = crouching ? cfg.crouch_height : cfg.standing_height;
    return {
        height,
        {0.0f, height * 0.5f, 0.0f},
        {0.0f, height * cfg.eye_height_ratio, 0.0f},
    };
}

float CrouchResolver::blend_factor(float dt, const MovementConfig& cfg) {
    return std::clamp(dt * cfg.crouch_transition_rate, 0.0f, 1.0f);
}

void CrouchResolver::apply(bool ceiling_detected, float dt,
                           const MovementConfig& cfg, MovementState& state) {
    state.is_crouching = wants_crouch(state.crouch_held, ceiling_detected);

    const Targets target = targets(state.is_crouching, cfg);
    const float   t      = blend_factor(dt, cfg);

    state.current_height        = math::lerp(state.current_height, target.height, t);
    state.current_center_offset = math::lerp(state.current_center_offset, target.center, t);
    state.current_eye_offset    = math::lerp(state.current_eye_offset, target.eye_offset, t);
}
