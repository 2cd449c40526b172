#include "pipeline.hpp"
#include "scene.hpp"
#include "modules/audio_module.hpp"
#include "modules/camera_module.hpp"
#include "modules/character_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <iostream>
#include <string>

static const char* DEFAULT_SCENE_PATH = "resources/scenes/default.json";

int main(int argc, char** argv) {
  const std::string scene_path = (argc > 1) ? argv[1] : DEFAULT_SCENE_PATH;

  InitWindow(1280, 720, "First-Person Movement");
  SetTargetFPS(144);

  ecs::World    world;
  ecs::Pipeline pipeline;

  // --- Module installation (order matters, see each module's header) ---
  EventBusModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  InputModule::install(world, pipeline);
  PhysicsModule::install(world, pipeline);
  CharacterModule::install(world, pipeline);
  AudioModule::install(world, pipeline);
  CharacterModule::install_motor(world, pipeline);
  PhysicsModule::install_step(world, pipeline);
  CameraModule::install(world, pipeline);
  RenderModule::install(world, pipeline);
  DebugModule::install_overlay(world, pipeline);
  RenderModule::install_present(world, pipeline);

  if (!SceneLoader::load(world, scene_path)) {
    std::cerr << "Failed to load scene " << scene_path << std::endl;
    AudioModule::shutdown(world);
    CloseWindow();
    return 1;
  }

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    float dt = GetFrameTime();

    if (IsKeyPressed(KEY_R)) {
        SceneLoader::unload(world);
        if (!SceneLoader::load(world, scene_path)) break;
    }

    // 1. Input & Logic (edges reach the controller immediately)
    pipeline.update(world, dt);

    // 2. Fixed steps: controller tick, then Jolt
    pipeline.advance(world, dt);

    // 3. Camera, scene, overlays
    pipeline.render(world);
  }

  AudioModule::shutdown(world);
  CloseWindow();
  return 0;
}
