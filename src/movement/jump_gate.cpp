#include "jump_gate.hpp"
#include <cmath>

float JumpGate::impulse(const MovementConfig& cfg) {
    return std::sqrt(cfg.jump_height * 2.0f * std::fabs(cfg.gravity));
}

bool JumpGate::eligible(bool under_ceiling, const MovementConfig& cfg,
                        const MovementState& state) {
    bool in_coyote_window = state.coyote_timer > 0.0f;
    bool has_jumps_left   = state.jump_count < cfg.max_jumps;
    return (in_coyote_window || has_jumps_left) && !under_ceiling;
}

bool JumpGate::try_jump(bool under_ceiling, const MovementConfig& cfg,
                        MovementState& state) {
    if (!eligible(under_ceiling, cfg, state)) return false;

    state.vertical_velocity = impulse(cfg);
    state.jump_count++;
    // A coyote jump consumes the window; it cannot chain with a double jump
    // on the same instant.
    state.coyote_timer = 0.0f;
    return true;
}
