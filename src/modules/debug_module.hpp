#pragma once
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// install(): creates the DebugPanel resource with the "Engine" section
// (frame rate, fixed-step clock, entity count). Install before any module
// that watches its own rows so Engine stays on top.
// install_overlay(): adds DebugSystem to the Render phase between
// RenderModule::install and RenderModule::install_present.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            return DebugPanel::fixed(GetFrameTime() * 1000.0f, "ms");
        });
        panel.watch("Engine", "Fixed Step", [&pipeline]() {
            return DebugPanel::fixed(pipeline.fixed_dt() * 1000.0f, "ms");
        });
        panel.watch("Engine", "Steps / Frame", [&pipeline]() {
            return std::to_string(pipeline.last_steps());
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });

        world.set_resource(std::move(panel));
    }

    static void install_overlay(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
