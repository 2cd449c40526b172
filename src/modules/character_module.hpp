#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../physics_handles.hpp"
#include "../pipeline.hpp"
#include "../systems/character_input.hpp"
#include "../systems/character_motor.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// CharacterModule
//
// Registers the character lifecycle hooks (Jolt character + movement
// controller), the event queues the character systems emit (JumpEvent,
// LandEvent), wires CharacterInputSystem into the Logic phase and adds
// "Movement" debug rows.
//
// install_motor() adds CharacterMotorSystem to the Physics phase. It must be
// called BEFORE PhysicsModule::install_step so the controller ticks ahead of
// the rigid-body step.
//
// Ordering summary:
//   PhysicsModule::install         → context + body hooks
//   CharacterModule::install       → logic: CharInput
//   AudioModule::install           → render: Audio
//   CharacterModule::install_motor → physics: CharMotor
//   PhysicsModule::install_step    → physics: Jolt step + propagation
// ---------------------------------------------------------------------------

struct CharacterModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        CharacterMotorSystem::Register(world);

        world.resource<EventRegistry>().register_queue<JumpEvent>(world);
        world.resource<EventRegistry>().register_queue<LandEvent>(world);

        pipeline.add_logic([](ecs::World& w, float dt) { CharacterInputSystem::Update(w, dt); });

        auto* panel = world.try_resource<DebugPanel>();
        if (!panel) return;

        // Each row reads the player's controller state; "-" when absent.
        auto watch_state = [&world, panel](const char* label, auto format) {
            panel->watch("Movement", label, [&world, format]() {
                std::string r = "-";
                world.each<PlayerTag, MovementHandle>([&](ecs::Entity, PlayerTag&, MovementHandle& m) {
                    r = format(m.controller->state());
                });
                return r;
            });
        };

        watch_state("Mode", [](const MovementState& s) {
            std::string mode = s.grounded ? "Grounded" : "Airborne";
            if (s.is_crouching) mode += " + Crouch";
            return mode;
        });
        watch_state("Jump Count", [](const MovementState& s) {
            return std::to_string(s.jump_count);
        });
        watch_state("Coyote", [](const MovementState& s) {
            return DebugPanel::fixed(s.coyote_timer, "s");
        });
        watch_state("Vertical Vel", [](const MovementState& s) {
            return DebugPanel::fixed(s.vertical_velocity, "m/s");
        });
        watch_state("Height", [](const MovementState& s) {
            return DebugPanel::fixed(s.current_height, "m");
        });
        watch_state("Yaw / Pitch", [](const MovementState& s) {
            return DebugPanel::fixed(s.yaw_degrees) + " / " + DebugPanel::fixed(s.pitch_degrees);
        });
        watch_state("Auto-run", [](const MovementState& s) {
            return std::string(s.auto_run_toggled ? "On" : "Off");
        });
    }

    static void install_motor(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_physics([](ecs::World& w, float dt) { CharacterMotorSystem::Update(w, dt); });
    }
};
