#pragma once
#include "../audio_resource.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/audio.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// AudioModule
//
// Initialises Raylib's audio device, loads the AudioResource and adds
// AudioSystem to the Render phase.
//
// JumpEvent is emitted in Logic and LandEvent in the fixed Physics steps;
// both queues are read once per frame in Render, before the next
// Pre-Update flush.
//
// shutdown() unloads sounds and closes the audio device. Must be called
// before CloseWindow().
// ---------------------------------------------------------------------------

struct AudioModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        InitAudioDevice();
        AudioResource audio;
        audio.load();
        world.set_resource(std::move(audio));
        pipeline.add_render([](ecs::World& w, float dt) { AudioSystem::Update(w, dt); });
    }

    static void shutdown(ecs::World& world) {
        world.resource<AudioResource>().unload();
        CloseAudioDevice();
    }
};
