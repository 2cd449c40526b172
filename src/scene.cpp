#include "scene.hpp"
#include "components.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec3 parse_vec3(const json& j) {
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
}

static ecs::Quat parse_quat(const json& j) {
    // stored as [x, y, z, w]
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>()};
}

static Color4 parse_color4(const json& j) {
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>()};
}

static ShapeType parse_shape(const std::string& s) {
    if (s == "Box")     return ShapeType::Box;
    if (s == "Sphere")  return ShapeType::Sphere;
    if (s == "Capsule") return ShapeType::Capsule;
    throw std::runtime_error("SceneLoader: unknown shape '" + s + "'");
}

static BodyType parse_body_type(const std::string& s) {
    if (s == "Static")    return BodyType::Static;
    if (s == "Dynamic")   return BodyType::Dynamic;
    if (s == "Kinematic") return BodyType::Kinematic;
    throw std::runtime_error("SceneLoader: unknown body type '" + s + "'");
}

// "obstacle_layers": ["NonMoving", "Moving"] -> bitmask over Layers.
static uint32_t parse_layer_mask(const json& j) {
    uint32_t mask = 0;
    for (const auto& layer : j) {
        const std::string name = layer.get<std::string>();
        if      (name == "NonMoving") mask |= 1u << Layers::NON_MOVING;
        else if (name == "Moving")    mask |= 1u << Layers::MOVING;
        else throw std::runtime_error("SceneLoader: unknown layer '" + name + "'");
    }
    return mask;
}

MovementConfig SceneLoader::parse_movement(const json& m, float standing_height) {
    MovementConfig cfg;
    cfg.walk_speed             = m.value("walk_speed",             cfg.walk_speed);
    cfg.sprint_multiplier      = m.value("sprint_multiplier",      cfg.sprint_multiplier);
    cfg.air_control_multiplier = m.value("air_control_multiplier", cfg.air_control_multiplier);
    cfg.crouch_speed           = m.value("crouch_speed",           cfg.crouch_speed);
    cfg.crouch_height          = m.value("crouch_height",          cfg.crouch_height);
    cfg.crouch_transition_rate = m.value("crouch_transition_rate", cfg.crouch_transition_rate);
    cfg.jump_height            = m.value("jump_height",            cfg.jump_height);
    cfg.max_jumps              = m.value("max_jumps",              cfg.max_jumps);
    cfg.gravity                = m.value("gravity",                cfg.gravity);
    cfg.coyote_time_duration   = m.value("coyote_time_duration",   cfg.coyote_time_duration);
    cfg.look_sensitivity       = m.value("look_sensitivity",       cfg.look_sensitivity);
    cfg.eye_height_ratio       = m.value("eye_height_ratio",       cfg.eye_height_ratio);
    if (m.contains("obstacle_layers")) cfg.obstacle_mask = parse_layer_mask(m["obstacle_layers"]);

    cfg.standing_height = standing_height;
    validate_movement_config(cfg);
    return cfg;
}

// ---------------------------------------------------------------------------
// Entity spawning
// ---------------------------------------------------------------------------

static void spawn_entity(ecs::World& world, const json& e, std::vector<ecs::Entity>& spawned) {
    // Parse the movement block up front so an invalid one never triggers
    // the character hooks.
    CharacterControllerConfig character;
    if (e.contains("character")) {
        const auto& ch = e["character"];
        character.height          = ch.value("height",          character.height);
        character.radius          = ch.value("radius",          character.radius);
        character.mass            = ch.value("mass",            character.mass);
        character.max_slope_angle = ch.value("max_slope_angle", character.max_slope_angle);
    }
    const bool     has_movement = e.contains("movement");
    MovementConfig movement;
    if (has_movement) movement = SceneLoader::parse_movement(e["movement"], character.height);

    auto ent = world.create();
    spawned.push_back(ent);

    // 1. LocalTransform + WorldTransform (must precede physics hooks)
    if (e.contains("transform")) {
        const auto& t = e["transform"];
        ecs::Vec3 pos = t.contains("position") ? parse_vec3(t["position"]) : ecs::Vec3{0,0,0};
        ecs::Quat rot = t.contains("rotation") ? parse_quat(t["rotation"]) : ecs::Quat{0,0,0,1};
        ecs::Vec3 scl = t.contains("scale")    ? parse_vec3(t["scale"])    : ecs::Vec3{1,1,1};
        world.add(ent, ecs::LocalTransform{pos, rot, scl});
        world.add(ent, ecs::WorldTransform{});
    }

    // 2. Colliders (must precede RigidBodyConfig so PhysicsSystem can read them)
    if (e.contains("box_collider")) {
        world.add(ent, BoxCollider{parse_vec3(e["box_collider"]["half_extents"])});
    }
    if (e.contains("sphere_collider")) {
        world.add(ent, SphereCollider{e["sphere_collider"]["radius"].get<float>()});
    }

    // 3. Visual representation
    if (e.contains("mesh")) {
        const auto& m = e["mesh"];
        ShapeType shape        = parse_shape(m.value("shape", std::string("Box")));
        Color4    color        = m.contains("color")        ? parse_color4(m["color"])      : Colors::White;
        ecs::Vec3 scale_offset = m.contains("scale_offset") ? parse_vec3(m["scale_offset"]) : ecs::Vec3{1,1,1};
        world.add(ent, MeshRenderer{shape, color, scale_offset});
    }

    // 4. Tags and player-specific components (before the lifecycle-hooked
    //    configs so the movement hook sees PlayerInput)
    if (e.contains("tags")) {
        for (const auto& tag : e["tags"]) {
            const std::string t = tag.get<std::string>();
            if (t == "World")  world.add(ent, WorldTag{});
            if (t == "Player") {
                world.add(ent, PlayerTag{});
                world.add(ent, PlayerInput{});
            }
        }
    }

    // 5. Physics / character / movement (trigger on_add lifecycle hooks —
    //    added last so sibling components are already present)
    if (e.contains("rigid_body")) {
        const auto& rb = e["rigid_body"];
        RigidBodyConfig cfg;
        cfg.type        = parse_body_type(rb.value("type", std::string("Dynamic")));
        cfg.mass        = rb.value("mass",        1.0f);
        cfg.friction    = rb.value("friction",    0.5f);
        cfg.restitution = rb.value("restitution", 0.0f);
        cfg.sensor      = rb.value("sensor",      false);
        world.add(ent, std::move(cfg));
    }
    if (e.contains("character")) world.add(ent, std::move(character));
    if (has_movement)            world.add(ent, std::move(movement));
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str) {
    std::vector<ecs::Entity> spawned;
    try {
        json scene = json::parse(json_str);
        for (const auto& entity_json : scene.at("entities")) {
            spawn_entity(world, entity_json, spawned);
        }
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "SceneLoader: " << ex.what() << std::endl;
        for (auto e : spawned) world.destroy(e);
        world.deferred().flush(world);
        return false;
    }
}

bool SceneLoader::load(ecs::World& world, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "SceneLoader: cannot open " << path << std::endl;
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    if (!load_from_string(world, content)) return false;
    std::cout << "Scene loaded: " << path << std::endl;
    return true;
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
