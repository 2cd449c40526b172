#pragma once
#include "movement/collaborators.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Physics/Character/CharacterVirtual.h>
#include <memory>

class PhysicsContext;

// ---------------------------------------------------------------------------
// JoltMover — Mover backed by a JPH::CharacterVirtual.
//
// Capsule geometry requested through set_height / set_center is applied
// lazily at the next move(), so one tick rebuilds the shape at most once.
// move() turns the displacement into a velocity for the current step (see
// begin_step) and runs ExtendedUpdate.
// ---------------------------------------------------------------------------

class JoltMover final : public Mover {
public:
    JoltMover(std::shared_ptr<JPH::CharacterVirtual> character, PhysicsContext& ctx,
              float height, float radius, float gravity_y);

    // Capsule centered on (0, height/2, 0) so the body origin sits at the feet.
    static JPH::RefConst<JPH::Shape> make_capsule(float height, float radius,
                                                  const ecs::Vec3& center);

    void begin_step(float dt) { step_dt_ = dt; }

    bool      is_grounded() const override;
    ecs::Vec3 position() const override;
    void      move(const ecs::Vec3& displacement) override;

    float     height() const override { return applied_height_; }
    void      set_height(float height) override { pending_height_ = height; }
    ecs::Vec3 center() const override { return applied_center_; }
    void      set_center(const ecs::Vec3& center) override { pending_center_ = center; }

    JPH::CharacterVirtual& character() { return *character_; }

private:
    void apply_pending_shape();

    std::shared_ptr<JPH::CharacterVirtual> character_;
    PhysicsContext& ctx_;
    float radius_;
    float gravity_y_;
    float step_dt_ = 0.0f;

    float     applied_height_;
    ecs::Vec3 applied_center_;
    float     pending_height_;
    ecs::Vec3 pending_center_;
};

// ---------------------------------------------------------------------------
// JoltObstructionQuery — narrow-phase ray cast filtered by object-layer mask.
//
// The origin is lifted by kSkin along the direction (and the length reduced
// to match) so the floor the feet rest on is not reported.
// ---------------------------------------------------------------------------

class JoltObstructionQuery final : public ObstructionQuery {
public:
    static constexpr float kSkin = 0.05f;

    explicit JoltObstructionQuery(PhysicsContext& ctx) : ctx_(ctx) {}

    bool raycast(const ecs::Vec3& origin, const ecs::Vec3& direction,
                 float max_distance, uint32_t mask) const override;

private:
    PhysicsContext& ctx_;
};
