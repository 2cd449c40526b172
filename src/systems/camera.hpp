#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// CameraSystem — first-person view.
//
// Places MainCamera at the player's feet plus the controller's eye offset,
// looking along body yaw and camera pitch. Runs in Render ahead of
// RenderSystem, after the last fixed step of the frame.
// ---------------------------------------------------------------------------

class CameraSystem {
public:
    static void Update(ecs::World& world, float dt);
};
