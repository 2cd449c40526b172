#include "audio.hpp"
#include "../audio_resource.hpp"
#include "../events.hpp"
#include <raylib.h>
#include <algorithm>

float AudioSystem::land_volume(float fall_speed) {
    return std::clamp(fall_speed / kHardLandingSpeed, 0.2f, 1.0f);
}

void AudioSystem::Update(ecs::World& world, float /*dt*/) {
    auto* audio = world.try_resource<AudioResource>();
    if (!audio) return;

    if (const auto* evts = world.try_resource<Events<JumpEvent>>()) {
        for (const auto& ev : evts->read()) {
            Sound& s = (ev.jump_number <= 1) ? audio->snd_jump : audio->snd_jump2;
            PlaySound(s);
        }
    }

    if (const auto* evts = world.try_resource<Events<LandEvent>>()) {
        float loudest = 0.0f;
        for (const auto& ev : evts->read()) loudest = std::max(loudest, ev.fall_speed);
        if (!evts->empty()) {
            SetSoundVolume(audio->snd_land, land_volume(loudest));
            PlaySound(audio->snd_land);
        }
    }
}
