#include "physics.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <ecs/modules/transform.hpp>
#include <ecs/integration/glm.hpp>
#include <iostream>
#include <memory>

using namespace ecs;

static PhysicsContext* find_context(World& world) {
    auto* ctx = world.try_resource<std::shared_ptr<PhysicsContext>>();
    return (ctx && *ctx) ? ctx->get() : nullptr;
}

static JPH::EMotionType to_motion_type(BodyType type) {
    switch (type) {
        case BodyType::Static:    return JPH::EMotionType::Static;
        case BodyType::Kinematic: return JPH::EMotionType::Kinematic;
        case BodyType::Dynamic:   return JPH::EMotionType::Dynamic;
    }
    return JPH::EMotionType::Dynamic;
}

// Static geometry is what ceiling casts hit by default (obstacle bit 0).
static JPH::ObjectLayer to_object_layer(BodyType type) {
    return type == BodyType::Static ? Layers::NON_MOVING : Layers::MOVING;
}

// Box or sphere from the sibling collider; a unit box when neither is set.
static JPH::RefConst<JPH::Shape> collider_shape(World& w, Entity e) {
    if (auto* box = w.try_get<BoxCollider>(e))
        return new JPH::BoxShape(MathBridge::ToJolt(box->half_extents));
    if (auto* sphere = w.try_get<SphereCollider>(e))
        return new JPH::SphereShape(sphere->radius);
    return new JPH::BoxShape(JPH::Vec3(0.5f, 0.5f, 0.5f));
}

void PhysicsSystem::Register(World& world) {
    world.on_add<RigidBodyConfig>([](World& w, Entity e, RigidBodyConfig& cfg) {
        PhysicsContext* ctx = find_context(w);
        if (!ctx || w.has<RigidBodyHandle>(e)) return;

        JPH::RVec3 pos = JPH::RVec3::sZero();
        JPH::Quat  rot = JPH::Quat::sIdentity();
        if (auto* lt = w.try_get<LocalTransform>(e)) {
            pos = MathBridge::ToJolt(lt->position);
            rot = MathBridge::ToJolt(lt->rotation);
        }

        JPH::BodyCreationSettings settings(collider_shape(w, e), pos, rot,
                                           to_motion_type(cfg.type), to_object_layer(cfg.type));
        settings.mFriction    = cfg.friction;
        settings.mRestitution = cfg.restitution;
        settings.mIsSensor    = cfg.sensor;
        if (cfg.type == BodyType::Dynamic) {
            settings.mOverrideMassProperties       = JPH::EOverrideMassProperties::CalculateInertia;
            settings.mMassPropertiesOverride.mMass = cfg.mass;
        }

        JPH::BodyInterface& bodies = ctx->bodies();
        JPH::BodyID id = bodies.CreateAndAddBody(settings, JPH::EActivation::Activate);
        if (id.IsInvalid()) {
            std::cerr << "PhysicsSystem: body limit reached, entity has no collision" << std::endl;
            return;
        }
        w.add(e, RigidBodyHandle{id});
    });

    world.on_remove<RigidBodyHandle>([](World& w, Entity, RigidBodyHandle& h) {
        PhysicsContext* ctx = find_context(w);
        if (!ctx) return;
        ctx->bodies().RemoveBody(h.id);
        ctx->bodies().DestroyBody(h.id);
    });
}

void PhysicsSystem::Update(World& world, float dt) {
    PhysicsContext* ctx = find_context(world);
    if (!ctx) return;

    ctx->step(dt);

    // Only dynamic bodies move under simulation; copy their pose back.
    JPH::BodyInterface& bodies = ctx->bodies();
    world.each<RigidBodyHandle, WorldTransform, RigidBodyConfig>(
        [&](Entity e, RigidBodyHandle& h, WorldTransform& wt, RigidBodyConfig& cfg) {
            if (cfg.type != BodyType::Dynamic) return;

            JPH::RVec3 pos;
            JPH::Quat  rot;
            bodies.GetPositionAndRotation(h.id, pos, rot);

            ecs::Vec3 scale = {1, 1, 1};
            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = MathBridge::FromJolt(pos);
                lt->rotation = MathBridge::FromJolt(rot);
                scale        = lt->scale;
            }
            wt.matrix = mat4_compose(MathBridge::FromJolt(pos), MathBridge::FromJolt(rot), scale);
        });
}
