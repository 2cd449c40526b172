#pragma once
#include <ecs/ecs.hpp>

// Forwards PlayerInput move axes and discrete edges to the MovementController.
// Jump edges are evaluated on the spot; accepted jumps emit JumpEvent.
// Runs in the Logic phase, after PlayerInputSystem has filled PlayerInput.
class CharacterInputSystem {
public:
    static void Update(ecs::World& world, float dt);
};
