#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/camera.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// CameraModule
//
// Creates the MainCamera resource, adds CameraSystem to the Render phase and
// a "Camera" debug row.
//
// Pipeline placement: CameraSystem reads the poses written by this frame's
// fixed steps and RenderSystem draws from the result, so install it before
// RenderModule.
// ---------------------------------------------------------------------------

struct CameraModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(MainCamera{});
        pipeline.add_render([](ecs::World& w, float dt) { CameraSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Camera", "Eye", [&world]() {
                auto* cam = world.try_resource<MainCamera>();
                if (!cam) return std::string("-");
                return DebugPanel::fixed(cam->position.y, "m");
            });
        }
    }
};
