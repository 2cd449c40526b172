#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/math_util.hpp"
#include "../src/components.hpp"
#include "../src/events.hpp"
#include "../src/scene.hpp"
#include "../src/debug_panel.hpp"
#include "../src/pipeline.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>

// components.hpp, scene.hpp and pipeline.hpp carry no Jolt or Raylib
// dependency, so everything here runs in the headless target.

using namespace fpmove::math;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Angle Normalization", "[math]") {
    SECTION("Inside range") {
        CHECK_THAT(normalize_angle(1.0f), WithinRel(1.0f));
        CHECK_THAT(normalize_angle(-1.0f), WithinRel(-1.0f));
    }

    SECTION("Outside range (positive)") {
        CHECK_THAT(normalize_angle(1.5f * kPi), WithinRel(-0.5f * kPi));
        CHECK_THAT(normalize_angle(3.0f * kPi), WithinRel(kPi));
    }

    SECTION("Outside range (negative)") {
        CHECK_THAT(normalize_angle(-1.5f * kPi), WithinRel(0.5f * kPi));
        CHECK_THAT(normalize_angle(-3.0f * kPi), WithinRel(-kPi));
    }
}

TEST_CASE("Heading wrap in degrees", "[math]") {
    CHECK_THAT(wrap_degrees(45.0f),   WithinAbs(45.0f, 1e-4f));
    CHECK_THAT(wrap_degrees(180.0f),  WithinAbs(180.0f, 1e-4f));
    CHECK_THAT(wrap_degrees(-180.0f), WithinAbs(180.0f, 1e-4f));
    CHECK_THAT(wrap_degrees(270.0f),  WithinAbs(-90.0f, 1e-4f));
    CHECK_THAT(wrap_degrees(-450.0f), WithinAbs(-90.0f, 1e-4f));
    CHECK_THAT(wrap_degrees(720.0f),  WithinAbs(0.0f, 1e-4f));
}

TEST_CASE("Heading basis", "[math]") {
    SECTION("Yaw 0 faces +Z, right is -X") {
        ecs::Vec3 f = heading_forward(0.0f);
        ecs::Vec3 r = heading_right(0.0f);
        CHECK_THAT(f.x, WithinAbs(0.0f, 1e-5f));
        CHECK_THAT(f.z, WithinAbs(1.0f, 1e-5f));
        CHECK_THAT(r.x, WithinAbs(-1.0f, 1e-5f));
        CHECK_THAT(r.z, WithinAbs(0.0f, 1e-5f));
    }

    SECTION("Turning right 90 degrees faces the old right") {
        ecs::Vec3 f = heading_forward(90.0f);
        CHECK_THAT(f.x, WithinAbs(-1.0f, 1e-5f));
        CHECK_THAT(f.z, WithinAbs(0.0f, 1e-5f));
    }

    SECTION("Basis stays horizontal and orthonormal") {
        for (float yaw : {-135.0f, -30.0f, 10.0f, 77.0f, 179.0f}) {
            ecs::Vec3 f = heading_forward(yaw);
            ecs::Vec3 r = heading_right(yaw);
            CHECK(f.y == 0.0f);
            CHECK(r.y == 0.0f);
            CHECK_THAT(length(f), WithinAbs(1.0f, 1e-5f));
            CHECK_THAT(length(r), WithinAbs(1.0f, 1e-5f));
            CHECK_THAT(f.x * r.x + f.z * r.z, WithinAbs(0.0f, 1e-5f));
        }
    }
}

TEST_CASE("View direction pitches down for positive pitch", "[math]") {
    ecs::Vec3 level = view_direction(0.0f, 0.0f);
    CHECK_THAT(level.y, WithinAbs(0.0f, 1e-5f));
    CHECK_THAT(level.z, WithinAbs(1.0f, 1e-5f));

    ecs::Vec3 down = view_direction(0.0f, 90.0f);
    CHECK_THAT(down.y, WithinAbs(-1.0f, 1e-5f));
    CHECK_THAT(down.z, WithinAbs(0.0f, 1e-5f));

    ecs::Vec3 up = view_direction(0.0f, -45.0f);
    CHECK(up.y > 0.0f);
    CHECK_THAT(length(up), WithinAbs(1.0f, 1e-5f));
}

TEST_CASE("Lerp", "[math]") {
    CHECK_THAT(lerp(2.0f, 1.0f, 0.0f), WithinAbs(2.0f, 1e-6f));
    CHECK_THAT(lerp(2.0f, 1.0f, 1.0f), WithinAbs(1.0f, 1e-6f));
    CHECK_THAT(lerp(2.0f, 1.0f, 0.25f), WithinAbs(1.75f, 1e-6f));

    ecs::Vec3 v = lerp(ecs::Vec3{0, 2, 0}, ecs::Vec3{0, 1, 4}, 0.5f);
    CHECK_THAT(v.y, WithinAbs(1.5f, 1e-6f));
    CHECK_THAT(v.z, WithinAbs(2.0f, 1e-6f));
}

// ---------------------------------------------------------------------------
// Events<T> / EventRegistry
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events — send and read", "[events]") {
    Events<TestEvent> queue;

    CHECK(queue.empty());
    CHECK(queue.read().empty());

    queue.send({42});
    queue.send({7});

    CHECK_FALSE(queue.empty());
    REQUIRE(queue.size() == 2);
    CHECK(queue.read()[0].value == 42);
    CHECK(queue.read()[1].value == 7);
}

TEST_CASE("Events — clear empties the queue", "[events]") {
    Events<TestEvent> queue;
    queue.send({1});
    queue.send({2});
    queue.clear();

    CHECK(queue.empty());
    CHECK(queue.size() == 0);
}

TEST_CASE("EventRegistry — flush_all clears every registered queue", "[events]") {
    ecs::World    world;
    EventRegistry registry;
    registry.register_queue<JumpEvent>(world);
    registry.register_queue<LandEvent>(world);
    CHECK(registry.queue_count() == 2);

    auto player = world.create();
    emit(world, JumpEvent{player, 1, 6.9f});
    emit(world, LandEvent{player, 12.0f});
    emit(world, LandEvent{player, 3.0f});

    CHECK(world.resource<Events<JumpEvent>>().size() == 1);
    CHECK(world.resource<Events<LandEvent>>().size() == 2);

    registry.flush_all();

    CHECK(world.resource<Events<JumpEvent>>().empty());
    CHECK(world.resource<Events<LandEvent>>().empty());
}

TEST_CASE("emit — unregistered event type is dropped", "[events]") {
    ecs::World world;
    emit(world, TestEvent{5});
    CHECK(world.try_resource<Events<TestEvent>>() == nullptr);
}

// ---------------------------------------------------------------------------
// Pipeline fixed-step clock
// ---------------------------------------------------------------------------

TEST_CASE("Pipeline — advance runs whole fixed steps and keeps the remainder", "[pipeline]") {
    ecs::World    world;
    ecs::Pipeline pipeline(0.25f);

    int   calls = 0;
    float seen  = 0.0f;
    pipeline.add_physics([&](ecs::World&, float dt) { ++calls; seen = dt; });

    CHECK(pipeline.advance(world, 0.1f) == 0);
    CHECK(pipeline.advance(world, 0.5f) == 2);
    CHECK(calls == 2);
    CHECK(seen == 0.25f);
    CHECK_THAT(pipeline.accumulator(), WithinAbs(0.1f, 1e-5f));
}

TEST_CASE("Pipeline — a long frame is capped and drops the backlog", "[pipeline]") {
    ecs::World    world;
    ecs::Pipeline pipeline(0.01f);

    int calls = 0;
    pipeline.add_physics([&](ecs::World&, float) { ++calls; });

    CHECK(pipeline.advance(world, 10.0f) == ecs::Pipeline::kMaxStepsPerFrame);
    CHECK(calls == ecs::Pipeline::kMaxStepsPerFrame);
    CHECK(pipeline.accumulator() == 0.0f);
}

TEST_CASE("Pipeline — update runs pre-update before logic", "[pipeline]") {
    ecs::World    world;
    ecs::Pipeline pipeline;

    std::string order;
    pipeline.add_logic([&](ecs::World&, float) { order += "L"; });
    pipeline.add_pre_update([&](ecs::World&, float) { order += "P"; });
    pipeline.add_render([&](ecs::World&, float) { order += "R"; });

    pipeline.update(world, 0.016f);
    pipeline.render(world);

    CHECK(order == "PLR");
}

// ---------------------------------------------------------------------------
// SceneLoader
// ---------------------------------------------------------------------------

static const char* MINIMAL_SCENE = R"({
  "entities": [
    {
      "transform": { "position": [1.0, 2.0, 3.0], "rotation": [0,0,0,1], "scale": [4.0, 5.0, 6.0] },
      "mesh": { "shape": "Box", "color": [0.5, 0.5, 0.5, 1.0] },
      "box_collider": { "half_extents": [2.0, 2.5, 3.0] },
      "rigid_body": { "type": "Static" },
      "tags": ["World"]
    },
    {
      "transform": { "position": [0.0, 5.0, 0.0], "rotation": [0,0,0,1], "scale": [1,1,1] },
      "character": { "height": 1.8, "radius": 0.5, "mass": 80.0, "max_slope_angle": 50.0 },
      "movement": { "walk_speed": 4.0, "max_jumps": 3, "gravity": -15.0,
                    "obstacle_layers": ["NonMoving", "Moving"] },
      "tags": ["Player", "World"]
    }
  ]
})";

TEST_CASE("SceneLoader — correct entity count", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));
    CHECK(world.count() == 2);
}

TEST_CASE("SceneLoader — static entity has correct transform", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));

    bool found = false;
    world.each<ecs::LocalTransform, BoxCollider>([&](ecs::Entity, ecs::LocalTransform& lt, BoxCollider& box) {
        CHECK_THAT(lt.position.x, WithinAbs(1.0f, 1e-4f));
        CHECK_THAT(lt.position.y, WithinAbs(2.0f, 1e-4f));
        CHECK_THAT(lt.position.z, WithinAbs(3.0f, 1e-4f));
        CHECK_THAT(lt.scale.x,    WithinAbs(4.0f, 1e-4f));
        CHECK_THAT(box.half_extents.y, WithinAbs(2.5f, 1e-4f));
        found = true;
    });
    CHECK(found);
}

TEST_CASE("SceneLoader — character entity has correct config", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));

    bool found = false;
    world.each<CharacterControllerConfig, PlayerTag>([&](ecs::Entity,
                                                         CharacterControllerConfig& cfg,
                                                         PlayerTag&) {
        CHECK_THAT(cfg.height,          WithinAbs(1.8f,  1e-4f));
        CHECK_THAT(cfg.radius,          WithinAbs(0.5f,  1e-4f));
        CHECK_THAT(cfg.max_slope_angle, WithinAbs(50.0f, 1e-4f));
        found = true;
    });
    CHECK(found);
}

TEST_CASE("SceneLoader — movement block overrides defaults", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));

    int found = 0;
    world.each<MovementConfig, PlayerInput>([&](ecs::Entity, MovementConfig& cfg, PlayerInput&) {
        CHECK_THAT(cfg.walk_speed, WithinAbs(4.0f, 1e-4f));
        CHECK(cfg.max_jumps == 3);
        CHECK_THAT(cfg.gravity, WithinAbs(-15.0f, 1e-4f));
        CHECK(cfg.obstacle_mask == 3u);
        // Unspecified fields keep their defaults; standing height follows the capsule.
        CHECK_THAT(cfg.jump_height,     WithinAbs(1.2f, 1e-4f));
        CHECK_THAT(cfg.standing_height, WithinAbs(1.8f, 1e-4f));
        ++found;
    });
    CHECK(found == 1);
}

TEST_CASE("SceneLoader — player entity gets PlayerInput", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));

    int player_count = 0;
    world.each<PlayerTag, PlayerInput>([&](ecs::Entity, PlayerTag&, PlayerInput& in) {
        CHECK(in.edges.empty());
        ++player_count;
    });
    CHECK(player_count == 1);
}

TEST_CASE("SceneLoader — malformed JSON returns false", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world, "{bad json"));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — invalid movement block rolls back the load", "[scene]") {
    ecs::World world;
    const char* scene = R"({
      "entities": [
        { "transform": { "position": [0, 0, 0] }, "tags": ["World"] },
        { "character": { "height": 2.0 },
          "movement":  { "gravity": 5.0 },
          "tags": ["Player", "World"] }
      ]
    })";

    CHECK_FALSE(SceneLoader::load_from_string(world, scene));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — unknown obstacle layer is rejected", "[scene]") {
    ecs::World world;
    const char* scene = R"({
      "entities": [
        { "character": { "height": 2.0 },
          "movement":  { "obstacle_layers": ["Water"] } }
      ]
    })";
    CHECK_FALSE(SceneLoader::load_from_string(world, scene));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — unload removes world entities", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));
    SceneLoader::unload(world);
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — missing file returns false", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load(world, "does/not/exist.json"));
}

TEST_CASE("parse_movement — validates the merged config", "[scene]") {
    SECTION("Empty block yields defaults with the given standing height") {
        MovementConfig cfg = SceneLoader::parse_movement(nlohmann::json::object(), 1.6f);
        CHECK_THAT(cfg.walk_speed,      WithinAbs(5.0f, 1e-4f));
        CHECK_THAT(cfg.standing_height, WithinAbs(1.6f, 1e-4f));
        CHECK(cfg.obstacle_mask == 1u);
    }

    SECTION("Out-of-range values throw ConfigError") {
        CHECK_THROWS_AS(SceneLoader::parse_movement({{"max_jumps", 0}}, 2.0f), ConfigError);
        CHECK_THROWS_AS(SceneLoader::parse_movement({{"air_control_multiplier", 1.5}}, 2.0f), ConfigError);
        CHECK_THROWS_AS(SceneLoader::parse_movement({{"eye_height_ratio", 0.0}}, 2.0f), ConfigError);
    }
}

// ---------------------------------------------------------------------------
// DebugPanel
// ---------------------------------------------------------------------------

TEST_CASE("DebugPanel — watch creates section and row", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine", "FPS", []() { return std::string("60"); });

    REQUIRE(panel.sections().size() == 1);
    CHECK(panel.sections()[0].title == "Engine");
    REQUIRE(panel.sections()[0].rows.size() == 1);
    CHECK(panel.sections()[0].rows[0].label == "FPS");
    CHECK(panel.sections()[0].rows[0].fn() == "60");
}

TEST_CASE("DebugPanel — sections ordered by insertion, rows grouped", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine",   "FPS",    []() { return std::string("60"); });
    panel.watch("Movement", "Jumps",  []() { return std::string("0"); });
    panel.watch("Engine",   "Frame",  []() { return std::string("16 ms"); });

    REQUIRE(panel.sections().size() == 2);
    CHECK(panel.sections()[0].title == "Engine");
    CHECK(panel.sections()[0].rows.size() == 2);
    CHECK(panel.sections()[1].title == "Movement");
    CHECK(panel.row_count() == 3);
}

TEST_CASE("DebugPanel — provider is called and returns current value", "[debug]") {
    int counter = 0;
    DebugPanel panel;
    panel.watch("Test", "Count", [&counter]() { return std::to_string(counter); });

    CHECK(panel.sections()[0].rows[0].fn() == "0");
    counter = 42;
    CHECK(panel.sections()[0].rows[0].fn() == "42");
}

TEST_CASE("DebugPanel — visible defaults to false, toggle flips it", "[debug]") {
    DebugPanel panel;
    CHECK_FALSE(panel.visible);
    panel.toggle();
    CHECK(panel.visible);
    panel.toggle();
    CHECK_FALSE(panel.visible);
}

TEST_CASE("DebugPanel — fixed formats two decimals and a unit", "[debug]") {
    CHECK(DebugPanel::fixed(0.2f, "s") == "0.20 s");
    CHECK(DebugPanel::fixed(-6.9282f, "m/s") == "-6.93 m/s");
    CHECK(DebugPanel::fixed(1.0f) == "1.00");
}
