#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Owns the EventRegistry resource. Queues live for one frame: the flush is
// the very first Pre-Update step, so events emitted during Logic, the fixed
// steps or Render are all readable until the next frame begins. Install
// first; CharacterModule registers its queues against this registry.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(EventRegistry{});
        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
    }
};
