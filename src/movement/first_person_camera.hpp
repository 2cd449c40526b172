#pragma once
#include "collaborators.hpp"

// Plain CameraSink: stores the eye pose for CameraSystem to read back.
class FirstPersonCamera final : public CameraSink {
public:
    explicit FirstPersonCamera(const ecs::Vec3& local_position = {0, 0, 0})
        : local_position_(local_position) {}

    ecs::Vec3 local_position() const override { return local_position_; }
    void set_local_position(const ecs::Vec3& position) override { local_position_ = position; }
    void set_local_pitch(float degrees) override { pitch_degrees_ = degrees; }

    float pitch_degrees() const { return pitch_degrees_; }

private:
    ecs::Vec3 local_position_;
    float     pitch_degrees_ = 0.0f;
};
