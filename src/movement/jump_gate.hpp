#pragma once
#include "movement_config.hpp"
#include "movement_state.hpp"

// ---------------------------------------------------------------------------
// JumpGate — evaluated immediately on a jump started edge.
//
// Eligible while the coyote window is open or jumps remain, unless the
// short ceiling cast (0.9 x standing height) is blocked. An ineligible
// request changes nothing.
// ---------------------------------------------------------------------------

class JumpGate {
public:
    // Ceiling cast length for jumps, relative to standing height. Shorter
    // than the crouch cast so low tunnels still allow jumping.
    static constexpr float kCeilingCheckRatio = 0.9f;

    // Launch speed reaching jump_height under the configured gravity.
    static float impulse(const MovementConfig& cfg);

    static bool eligible(bool under_ceiling, const MovementConfig& cfg,
                         const MovementState& state);

    // Returns true if the jump fired.
    static bool try_jump(bool under_ceiling, const MovementConfig& cfg,
                         MovementState& state);
};
