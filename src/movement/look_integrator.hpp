#pragma once
#include "movement_config.hpp"
#include "movement_state.hpp"

// Yaw onto the body, clamped pitch onto the camera.
class LookIntegrator {
public:
    static constexpr float kPitchLimit = 90.0f;

    static void apply(const MovementConfig& cfg, MovementState& state);
};
