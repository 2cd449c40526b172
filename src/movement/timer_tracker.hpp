#pragma once
#include "movement_config.hpp"
#include "movement_state.hpp"

// Grounded bookkeeping: jump count, coyote window, stick-to-ground bias.
// First step of every tick.
class TimerTracker {
public:
    // Downward velocity kept while grounded so the mover's ground probe
    // stays engaged.
    static constexpr float kGroundStickVelocity = -2.0f;

    static void apply(bool on_ground, float dt,
                      const MovementConfig& cfg, MovementState& state);
};
