#pragma once
#include <ecs/ecs.hpp>

// Snapshots Raylib keyboard / mouse / gamepad state into the InputRecord
// resource (created on first use). First Pre-Update step after the event
// flush; no other system calls Raylib's input API.
class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
