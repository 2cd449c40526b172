#pragma once
#include "../physics_context.hpp"
#include "../pipeline.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// install(): initialises Jolt's allocator, creates the PhysicsContext world
// resource and registers PhysicsSystem lifecycle hooks. Must precede any
// module or scene load that creates bodies or characters.
//
// install_step(): adds the fixed-step simulation + transform propagation to
// the Physics phase. Call after CharacterModule::install_motor so the
// character moves before the rigid bodies step.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, ecs::Pipeline& /*pipeline*/) {
        PhysicsContext::InitJoltAllocator();
        world.set_resource(std::make_shared<PhysicsContext>());
        PhysicsSystem::Register(world);
    }

    static void install_step(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_physics([](ecs::World& w, float dt) {
            PhysicsSystem::Update(w, dt);
            ecs::propagate_transforms(w);
        });
    }
};
