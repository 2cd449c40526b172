#include "movement_config.hpp"
#include <cmath>

static void require(bool ok, const char* message) {
    if (!ok) throw ConfigError(message);
}

void validate_movement_config(const MovementConfig& cfg) {
    const float fields[] = {
        cfg.walk_speed, cfg.sprint_multiplier, cfg.air_control_multiplier,
        cfg.crouch_speed, cfg.crouch_height, cfg.crouch_transition_rate,
        cfg.standing_height, cfg.jump_height, cfg.gravity,
        cfg.coyote_time_duration, cfg.look_sensitivity, cfg.eye_height_ratio,
    };
    for (float f : fields) require(std::isfinite(f), "non-finite value");

    require(cfg.walk_speed >= 0.0f,             "walk_speed must be >= 0");
    require(cfg.sprint_multiplier >= 0.0f,      "sprint_multiplier must be >= 0");
    require(cfg.air_control_multiplier >= 0.0f &&
            cfg.air_control_multiplier <= 1.0f, "air_control_multiplier must be in [0, 1]");
    require(cfg.crouch_speed >= 0.0f,           "crouch_speed must be >= 0");
    require(cfg.crouch_height > 0.0f,           "crouch_height must be > 0");
    require(cfg.crouch_transition_rate >= 0.0f, "crouch_transition_rate must be >= 0");
    require(cfg.standing_height > 0.0f,         "standing_height must be > 0");
    require(cfg.jump_height >= 0.0f,            "jump_height must be >= 0");
    require(cfg.max_jumps >= 1,                 "max_jumps must be >= 1");
    require(cfg.gravity < 0.0f,                 "gravity must be negative");
    require(cfg.coyote_time_duration >= 0.0f,   "coyote_time_duration must be >= 0");
    require(cfg.eye_height_ratio > 0.0f &&
            cfg.eye_height_ratio <= 1.0f,       "eye_height_ratio must be in (0, 1]");
}
