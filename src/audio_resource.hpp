#pragma once
#include <raylib.h>

// ---------------------------------------------------------------------------
// AudioResource — movement feedback cues.
//
// Stored as a World resource. Loaded once at startup (after InitAudioDevice),
// unloaded at shutdown (before CloseAudioDevice). A missing file yields a
// zeroed Sound and PlaySound() on it is a no-op.
// ---------------------------------------------------------------------------

struct AudioResource {
    Sound snd_jump;     // first jump
    Sound snd_jump2;    // air jump
    Sound snd_land;     // landing, volume scaled by fall speed

    void load() {
        snd_jump  = LoadSound("resources/sounds/jump.wav");
        snd_jump2 = LoadSound("resources/sounds/jump2.wav");
        snd_land  = LoadSound("resources/sounds/land.wav");
    }

    void unload() {
        UnloadSound(snd_jump);
        UnloadSound(snd_jump2);
        UnloadSound(snd_land);
    }
};
