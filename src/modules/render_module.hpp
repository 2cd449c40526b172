#pragma once
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// install(): adds RenderSystem::Update to the Render phase (after
// CameraModule). install_present(): adds RenderSystem::Present; call last,
// after every overlay module.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void install_present(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World&, float) { RenderSystem::Present(); });
    }
};
