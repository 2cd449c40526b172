#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PhysicsSystem — static / kinematic / dynamic Jolt bodies.
//
// Register(): on_add<RigidBodyConfig> creates the body (box or sphere from
// the sibling collider; static bodies go to the NON_MOVING layer, which is
// what the controller's ceiling casts test against), on_remove<RigidBodyHandle>
// destroys it.
// Update(): fixed-step simulation and pose sync for dynamic bodies.
// ---------------------------------------------------------------------------

class PhysicsSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
