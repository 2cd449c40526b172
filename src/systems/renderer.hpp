#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem — Render phase.
//
// Update() opens the frame, draws the world from MainCamera and the HUD
// (crosshair, controls, movement flags). Present() closes the frame and
// must be the last Render-phase step so overlays (DebugSystem) land in the
// same frame.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Update(ecs::World& world);
    static void Present();
};
