#pragma once
#include "movement/movement_config.hpp"
#include "movement/movement_state.hpp"
#include <ecs/ecs.hpp>
#include <cstdint>
#include <vector>

// ---------------------------------------------------------------------------
// Plain data components. No Jolt or Raylib headers: this file is shared with
// the headless test target. Engine handles live in physics_handles.hpp.
// ---------------------------------------------------------------------------

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    constexpr Color4 White = {1.0f, 1.0f, 1.0f, 1.0f};
}

// ---------------------------------------------------------------------------
// Physics Configuration (Authoring)
// ---------------------------------------------------------------------------

enum class BodyType { Static, Kinematic, Dynamic };

// Jolt object layers; bit i of MovementConfig::obstacle_mask selects layer i.
namespace Layers {
    constexpr uint16_t NON_MOVING = 0;
    constexpr uint16_t MOVING     = 1;
    constexpr uint16_t NUM_LAYERS = 2;
}

struct BoxCollider {
    ecs::Vec3 half_extents = {0.5f, 0.5f, 0.5f};
};

struct SphereCollider {
    float radius = 0.5f;
};

// If present, PhysicsSystem creates a Jolt Body for this entity.
struct RigidBodyConfig {
    BodyType type = BodyType::Dynamic;
    float mass = 1.0f;
    float friction = 0.5f;
    float restitution = 0.0f;
    bool sensor = false;
};

// Mover geometry. height is the standing height captured by the controller.
struct CharacterControllerConfig {
    float height = 2.0f;
    float radius = 0.4f;
    float mass = 70.0f;
    float max_slope_angle = 45.0f; // degrees
};

// ---------------------------------------------------------------------------
// Visuals
// ---------------------------------------------------------------------------

enum class ShapeType { Box, Sphere, Capsule };

struct MeshRenderer {
    ShapeType shape_type   = ShapeType::Box;
    Color4    color        = Colors::White;
    ecs::Vec3 scale_offset = {1, 1, 1};
};

// ---------------------------------------------------------------------------
// Gameplay / Input
// ---------------------------------------------------------------------------

struct InputEdge {
    InputAction action;
    InputPhase  phase;
};

// Written by PlayerInputSystem each frame, consumed by CharacterInputSystem.
struct PlayerInput {
    ecs::Vec2 move_input = {0, 0};  // X = strafe, Y = forward
    ecs::Vec2 look_input = {0, 0};  // X = turn right, Y = look up
    std::vector<InputEdge> edges;   // in arrival order
};

// First-person view, rebuilt by CameraSystem at the start of Render.
struct MainCamera {
    ecs::Vec3 position     = {0, 1.8f, 0};
    ecs::Vec3 target       = {0, 1.8f, 1};
    ecs::Vec3 view_forward = {0, 0, 1};
    ecs::Vec3 view_right   = {-1, 0, 0};
    float     fovy         = 70.0f;
};

struct PlayerTag {};
struct WorldTag {};
