#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PlayerInputSystem — maps the InputRecord onto the player's PlayerInput.
//
// Move axes are rebuilt every frame; look input accumulates until the next
// fixed step consumes it; discrete bindings become Started / Canceled edges.
//
//   Action    Keyboard     Gamepad
//   Sprint    Left Shift   Left stick press
//   Crouch    Left Ctrl    East face button
//   Jump      Space        South face button
//   Auto-run  Q (toggle)   North face button (toggle)
// ---------------------------------------------------------------------------

class PlayerInputSystem {
public:
    static void Update(ecs::World& world, float dt);
};
