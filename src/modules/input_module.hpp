#pragma once
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// InputModule
//
// Locks the cursor for mouse look, creates the InputRecord resource and adds
// InputGatherSystem then PlayerInputSystem to the Pre-Update phase (after the
// EventBus flush).
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        DisableCursor();
        world.set_resource(InputRecord{});
        pipeline.add_pre_update([](ecs::World& w, float)    { InputGatherSystem::Update(w); });
        pipeline.add_pre_update([](ecs::World& w, float dt) { PlayerInputSystem::Update(w, dt); });
    }
};
