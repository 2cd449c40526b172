#include "character_input.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include "../physics_handles.hpp"

using namespace ecs;

void CharacterInputSystem::Update(World& world, float /*dt*/) {
    world.each<PlayerTag, PlayerInput, MovementHandle>(
        [&](Entity e, PlayerTag&, PlayerInput& input, MovementHandle& m) {
            auto& controller = *m.controller;
            controller.set_move_input(input.move_input);

            for (const InputEdge& edge : input.edges) {
                if (controller.on_input_edge(edge.action, edge.phase)) {
                    const MovementState& s = controller.state();
                    emit(world, JumpEvent{e, s.jump_count, s.vertical_velocity});
                }
            }
            input.edges.clear();
        });
}
