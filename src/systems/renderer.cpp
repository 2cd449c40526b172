#include "renderer.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <rlgl.h>

using namespace ecs;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

static inline Vector3 to_v3(const ecs::Vec3& v) { return {v.x, v.y, v.z}; }

static void draw_crosshair() {
    const int cx = GetScreenWidth() / 2;
    const int cy = GetScreenHeight() / 2;
    DrawLine(cx - 8, cy, cx + 8, cy, RAYWHITE);
    DrawLine(cx, cy - 8, cx, cy + 8, RAYWHITE);
}

void RenderSystem::Update(World& world) {
    BeginDrawing();
    ClearBackground({35, 35, 40, 255});

    // 1. Camera3D from MainCamera
    Camera3D camera = {};
    camera.up         = {0, 1, 0};
    camera.projection = CAMERA_PERSPECTIVE;
    if (auto* cam = world.try_resource<MainCamera>()) {
        camera.position = to_v3(cam->position);
        camera.target   = to_v3(cam->target);
        camera.fovy     = cam->fovy;
    }

    // 2. World geometry (the player body is not drawn in first person)
    BeginMode3D(camera);
        DrawGrid(100, 2.0f);
        world.each<WorldTransform, MeshRenderer>(
            [&](Entity e, WorldTransform& wt, MeshRenderer& mesh) {
                if (world.has<PlayerTag>(e)) return;

                rlPushMatrix();
                rlMultMatrixf((float*)&wt.matrix);
                rlScalef(mesh.scale_offset.x, mesh.scale_offset.y, mesh.scale_offset.z);
                Color col = to_raylib(mesh.color);
                switch (mesh.shape_type) {
                    case ShapeType::Box:
                        DrawCube({0,0,0}, 1.0f, 1.0f, 1.0f, col);
                        DrawCubeWires({0,0,0}, 1.0f, 1.0f, 1.0f, Fade(BLACK, 0.3f));
                        break;
                    case ShapeType::Sphere:  DrawSphere({0,0,0}, 0.5f, col);                   break;
                    case ShapeType::Capsule: DrawCapsule({0,0,0}, {0, 1.0f, 0}, 0.4f, 8, 8, col); break;
                }
                rlPopMatrix();
            });
    EndMode3D();

    // 3. HUD
    draw_crosshair();
    DrawText("WASD / L-STICK: Move | MOUSE / R-STICK: Look | SPACE / SOUTH: Jump", 10, 10, 20, LIGHTGRAY);
    DrawText("SHIFT / L3: Sprint | CTRL / EAST: Crouch | Q / NORTH: Auto-run | R: Reload | F3: Debug",
             10, 35, 20, LIGHTGRAY);

    world.single<PlayerTag, MovementHandle>([&](Entity, PlayerTag&, MovementHandle& m) {
        const MovementState& s = m.controller->state();
        int y = GetScreenHeight() - 30;
        if (s.auto_run_toggled) { DrawText("AUTO-RUN", 10, y, 20, GREEN);  y -= 25; }
        if (s.is_crouching)     { DrawText("CROUCH",   10, y, 20, SKYBLUE); y -= 25; }
        if (s.sprint_held)      { DrawText("SPRINT",   10, y, 20, YELLOW); }
    });
}

void RenderSystem::Present() {
    EndDrawing();
}
