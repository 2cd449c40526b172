#pragma once
#include "movement/movement_config.hpp"
#include <ecs/ecs.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>

// ---------------------------------------------------------------------------
// SceneLoader — reads JSON scene files and populates an ECS World.
//
// Components are added in lifecycle-safe order (colliders before rigid_body,
// transform before character, character before movement) so on_add hooks
// fire with sibling data present. A failed load destroys the entities it
// had already spawned. No Jolt or Raylib dependency — compilable in the
// headless test target.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // Load entities from a JSON file into world.
    // Returns false if the file cannot be opened, the JSON is malformed, or
    // an entity carries an invalid "movement" block.
    static bool load(ecs::World& world, const std::string& path);

    // Parse and spawn from a JSON string — identical to load() but avoids
    // file I/O. Intended for unit testing.
    static bool load_from_string(ecs::World& world, const std::string& json);

    // Destroy all WorldTag entities and flush deferred commands.
    static void unload(ecs::World& world);

    // Reads a "movement" block over the defaults. standing_height is taken
    // from the sibling "character" height. Throws ConfigError on invalid
    // values, std::runtime_error on an unknown layer name and
    // nlohmann::json::exception on mistyped fields.
    static MovementConfig parse_movement(const nlohmann::json& j, float standing_height);
};
