#pragma once
#include <ecs/ecs.hpp>
#include <cstdint>

// ---------------------------------------------------------------------------
// Collaborator interfaces consumed by MovementController.
//
// The controller holds references to one of each for its whole lifetime;
// the host guarantees they outlive it. Calls are synchronous and assumed
// infallible.
// ---------------------------------------------------------------------------

// Collision body that resolves a requested displacement against the world.
class Mover {
public:
    virtual ~Mover() = default;

    virtual bool      is_grounded() const = 0;
    virtual ecs::Vec3 position() const = 0;  // feet, world space
    virtual void      move(const ecs::Vec3& displacement) = 0;

    virtual float     height() const = 0;
    virtual void      set_height(float height) = 0;
    virtual ecs::Vec3 center() const = 0;    // capsule center, local space
    virtual void      set_center(const ecs::Vec3& center) = 0;
};

// Side-effect-free ray test. mask selects the object layers that may block.
class ObstructionQuery {
public:
    virtual ~ObstructionQuery() = default;

    virtual bool raycast(const ecs::Vec3& origin, const ecs::Vec3& direction,
                         float max_distance, uint32_t mask) const = 0;
};

// Eye transform relative to the body. Only pitch is driven.
class CameraSink {
public:
    virtual ~CameraSink() = default;

    virtual ecs::Vec3 local_position() const = 0;
    virtual void      set_local_position(const ecs::Vec3& position) = 0;
    virtual void      set_local_pitch(float degrees) = 0;
};
