#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Render-phase system; draws the DebugPanel overlay.
//
// Toggle visibility with F3. Runs after RenderSystem::Update and before
// RenderSystem::Present.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
