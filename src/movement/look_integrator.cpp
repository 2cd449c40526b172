#include "look_integrator.hpp"
#include "../math_util.hpp"
#include <algorithm>

using namespace fpmove;

void LookIntegrator::apply(const MovementConfig& cfg, MovementState& state) {
    state.yaw_degrees = math::wrap_degrees(
        state.yaw_degrees + state.look_delta.x * cfg.look_sensitivity);

    state.pitch_degrees -= state.look_delta.y * cfg.look_sensitivity;
    state.pitch_degrees  = std::clamp(state.pitch_degrees, -kPitchLimit, kPitchLimit);
}
