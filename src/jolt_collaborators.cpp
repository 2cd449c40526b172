#include "jolt_collaborators.hpp"
#include "physics_context.hpp"
#include "physics_handles.hpp"
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/RotatedTranslatedShape.h>
#include <algorithm>
#include <cmath>
#include <iostream>

// Geometry changes smaller than this keep the current shape.
static constexpr float kShapeEpsilon = 1e-3f;

// Penetration accepted when growing the capsule; larger overlaps keep the
// previous shape.
static constexpr float kMaxShapePenetration = 0.1f;

JPH::RefConst<JPH::Shape> JoltMover::make_capsule(float height, float radius,
                                                  const ecs::Vec3& center) {
    float r        = std::min(radius, 0.45f * height);
    float half_cyl = std::max(0.5f * height - r, 0.01f);

    JPH::RefConst<JPH::ShapeSettings> settings =
        new JPH::RotatedTranslatedShapeSettings(
            MathBridge::ToJolt(center), JPH::Quat::sIdentity(),
            new JPH::CapsuleShapeSettings(half_cyl, r));

    auto result = settings->Create();
    if (result.HasError()) {
        std::cerr << "JoltMover: capsule creation failed: " << result.GetError() << std::endl;
        return nullptr;
    }
    return result.Get();
}

JoltMover::JoltMover(std::shared_ptr<JPH::CharacterVirtual> character, PhysicsContext& ctx,
                     float height, float radius, float gravity_y)
    : character_(std::move(character)),
      ctx_(ctx),
      radius_(radius),
      gravity_y_(gravity_y),
      applied_height_(height),
      applied_center_{0.0f, 0.5f * height, 0.0f},
      pending_height_(height),
      pending_center_{0.0f, 0.5f * height, 0.0f} {}

bool JoltMover::is_grounded() const {
    return character_->GetGroundState() == JPH::CharacterVirtual::EGroundState::OnGround;
}

ecs::Vec3 JoltMover::position() const {
    return MathBridge::FromJolt(character_->GetPosition());
}

void JoltMover::apply_pending_shape() {
    bool height_changed = std::fabs(pending_height_ - applied_height_) > kShapeEpsilon;
    bool center_changed = std::fabs(pending_center_.y - applied_center_.y) > kShapeEpsilon;
    if (!height_changed && !center_changed) return;

    JPH::RefConst<JPH::Shape> shape = make_capsule(pending_height_, radius_, pending_center_);
    if (!shape) return;

    auto bp_filter  = ctx_.broad_phase_filter(Layers::MOVING);
    auto obj_filter = ctx_.object_filter(Layers::MOVING);
    JPH::BodyFilter  body_filter;
    JPH::ShapeFilter shape_filter;

    if (character_->SetShape(shape, kMaxShapePenetration, bp_filter, obj_filter,
                             body_filter, shape_filter, ctx_.temp_allocator())) {
        applied_height_ = pending_height_;
        applied_center_ = pending_center_;
    }
}

void JoltMover::move(const ecs::Vec3& displacement) {
    if (step_dt_ <= 0.0f) return;

    apply_pending_shape();

    JPH::Vec3 velocity = MathBridge::ToJolt(displacement) / step_dt_;
    character_->SetLinearVelocity(velocity);

    auto bp_filter  = ctx_.broad_phase_filter(Layers::MOVING);
    auto obj_filter = ctx_.object_filter(Layers::MOVING);
    JPH::BodyFilter  body_filter;
    JPH::ShapeFilter shape_filter;
    JPH::CharacterVirtual::ExtendedUpdateSettings ext_settings;

    character_->ExtendedUpdate(step_dt_, {0.0f, gravity_y_, 0.0f}, ext_settings,
                               bp_filter, obj_filter, body_filter, shape_filter,
                               ctx_.temp_allocator());
}

bool JoltObstructionQuery::raycast(const ecs::Vec3& origin, const ecs::Vec3& direction,
                                   float max_distance, uint32_t mask) const {
    float length = max_distance - kSkin;
    if (length <= 0.0f) return false;

    JPH::Vec3  dir = MathBridge::ToJolt(direction);
    JPH::RVec3 start(MathBridge::ToJolt(origin) + dir * kSkin);

    JPH::RRayCast      ray(start, dir * length);
    JPH::RayCastResult hit;
    ObstacleMaskFilter layer_filter(mask);

    return ctx_.system().GetNarrowPhaseQuery().CastRay(
        ray, hit, JPH::BroadPhaseLayerFilter(), layer_filter);
}
