#include "camera.hpp"
#include "../components.hpp"
#include "../math_util.hpp"
#include "../physics_handles.hpp"
#include <ecs/modules/transform.hpp>

using namespace ecs;
using namespace fpmove;

void CameraSystem::Update(World& world, float /*dt*/) {
    auto* cam_ptr = world.try_resource<MainCamera>();
    if (!cam_ptr) return;
    MainCamera& cam = *cam_ptr;

    world.single<PlayerTag, WorldTransform, MovementHandle>(
        [&](Entity, PlayerTag&, WorldTransform& wt, MovementHandle& m) {
            const ecs::Vec3 feet = {wt.matrix.m[12], wt.matrix.m[13], wt.matrix.m[14]};
            const float     yaw  = m.controller->state().yaw_degrees;

            cam.position     = math::add(feet, m.camera->local_position());
            cam.target       = math::add(cam.position,
                                         math::view_direction(yaw, m.camera->pitch_degrees()));
            cam.view_forward = math::heading_forward(yaw);
            cam.view_right   = math::heading_right(yaw);
        });
}
