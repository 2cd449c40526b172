#include "timer_tracker.hpp"

void TimerTracker::apply(bool on_ground, float dt,
                         const MovementConfig& cfg, MovementState& state) {
    state.grounded = on_ground;

    if (on_ground) {
        state.jump_count   = 0;
        state.coyote_timer = cfg.coyote_time_duration;

        // Only a falling body is floored; a same-tick jump impulse survives.
        if (state.vertical_velocity < 0.0f)
            state.vertical_velocity = kGroundStickVelocity;
    } else {
        state.coyote_timer -= dt;
    }
}
