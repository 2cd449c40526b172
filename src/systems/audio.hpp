#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// AudioSystem — Render-phase system; consumes JumpEvent and LandEvent.
//
// Runs after the Logic phase (JumpEvent) and the frame's fixed steps
// (LandEvent), before the next Pre-Update flush.
// ---------------------------------------------------------------------------

class AudioSystem {
public:
    // Fall speed (units/s) that plays the landing cue at full volume.
    static constexpr float kHardLandingSpeed = 15.0f;

    static float land_volume(float fall_speed);
    static void  Update(ecs::World& world, float dt);
};
