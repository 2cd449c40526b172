#include "character_motor.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include "../physics_context.hpp"
#include "../physics_handles.hpp"
#include <ecs/modules/transform.hpp>
#include <ecs/integration/glm.hpp>
#include <algorithm>
#include <iostream>

using namespace ecs;

void CharacterMotorSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig& cfg) {
            auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
            if (!ctx_ptr || !*ctx_ptr) return;
            auto& ctx = **ctx_ptr;

            JPH::RefConst<JPH::Shape> shape = JoltMover::make_capsule(
                cfg.height, cfg.radius, {0.0f, 0.5f * cfg.height, 0.0f});
            if (!shape) return;

            JPH::RVec3 pos = JPH::RVec3::sZero();
            if (auto* lt = w.try_get<LocalTransform>(e)) {
                pos = MathBridge::ToJolt(lt->position);
            }

            JPH::CharacterVirtualSettings settings;
            settings.mMass             = cfg.mass;
            settings.mMaxSlopeAngle    = JPH::DegreesToRadians(cfg.max_slope_angle);
            settings.mShape            = shape;
            settings.mSupportingVolume = JPH::Plane(JPH::Vec3::sAxisY(), -cfg.radius);

            auto character = std::make_shared<JPH::CharacterVirtual>(
                &settings, pos, JPH::Quat::sIdentity(), &ctx.system());

            w.add(e, CharacterHandle{character});
        });

    world.on_add<MovementConfig>(
        [](World& w, Entity e, MovementConfig& cfg) {
            auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
            auto* handle  = w.try_get<CharacterHandle>(e);
            auto* body    = w.try_get<CharacterControllerConfig>(e);
            if (!ctx_ptr || !*ctx_ptr || !handle || !body) return;
            auto& ctx = **ctx_ptr;

            MovementHandle m;
            m.mover       = std::make_shared<JoltMover>(handle->character, ctx,
                                                        body->height, body->radius, cfg.gravity);
            m.obstruction = std::make_shared<JoltObstructionQuery>(ctx);
            m.camera      = std::make_shared<FirstPersonCamera>(
                ecs::Vec3{0.0f, body->height * cfg.eye_height_ratio, 0.0f});

            try {
                m.controller = std::make_shared<MovementController>(
                    cfg, *m.mover, *m.obstruction, *m.camera);
            } catch (const ConfigError& ex) {
                std::cerr << "CharacterMotorSystem: " << ex.what()
                          << " (entity has no movement controller)" << std::endl;
                return;
            }

            w.add(e, std::move(m));
        });
}

void CharacterMotorSystem::Update(World& world, float dt) {
    world.each<MovementHandle, CharacterHandle, WorldTransform>(
        [&](Entity e, MovementHandle& m, CharacterHandle& h, WorldTransform& wt) {
            auto& controller = *m.controller;

            // Look delta accumulates per frame and is consumed by one step.
            if (auto* input = world.try_get<PlayerInput>(e)) {
                controller.set_look_input(input->look_input);
                input->look_input = {0, 0};
            } else {
                controller.set_look_input({0, 0});
            }

            const bool was_grounded = m.mover->is_grounded();

            m.mover->begin_step(dt);
            controller.tick(dt);

            const MovementState& s = controller.state();
            h.character->SetRotation(JPH::Quat::sRotation(
                JPH::Vec3::sAxisY(), -s.yaw_degrees * fpmove::math::kDegToRad));

            if (!was_grounded && m.mover->is_grounded()) {
                emit(world, LandEvent{e, std::max(0.0f, -s.vertical_velocity)});
            }

            // --- Sync Jolt position back to ECS transforms ---
            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = MathBridge::FromJolt(h.character->GetPosition());
                lt->rotation = MathBridge::FromJolt(h.character->GetRotation());
                wt.matrix    = mat4_compose(lt->position, lt->rotation, lt->scale);
            }
        });
}
