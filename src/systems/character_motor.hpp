#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// CharacterMotorSystem — owns the Jolt character and the MovementController.
//
// Register(): on_add<CharacterControllerConfig> creates the CharacterVirtual,
// on_add<MovementConfig> builds the collaborators and the controller.
// Update(): one fixed step — feeds the accumulated look delta, ticks the
// controller (which moves the character), applies body yaw, syncs
// transforms and emits LandEvent. Runs in the Physics phase before
// PhysicsSystem.
// ---------------------------------------------------------------------------

class CharacterMotorSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
