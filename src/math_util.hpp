#pragma once
#include <ecs/ecs.hpp>
#include <cmath>
#include <algorithm>

namespace fpmove::math {

constexpr float kPi         = 3.1415926535f;
constexpr float kDegToRad   = kPi / 180.0f;

/**
 * @brief Normalizes an angle into the range [-PI, PI].
 */
inline float normalize_angle(float angle) {
    while (angle < -kPi) angle += 2.0f * kPi;
    while (angle >  kPi) angle -= 2.0f * kPi;
    return angle;
}

/**
 * @brief Wraps a heading in degrees into (-180, 180].
 */
inline float wrap_degrees(float degrees) {
    degrees = std::fmod(degrees, 360.0f);
    if (degrees <= -180.0f) degrees += 360.0f;
    if (degrees >   180.0f) degrees -= 360.0f;
    return degrees;
}

inline float lerp(float a, float b, float t) { return a + (b - a) * t; }

inline ecs::Vec3 add(const ecs::Vec3& a, const ecs::Vec3& b) {
    return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline ecs::Vec3 scale(const ecs::Vec3& v, float s) {
    return {v.x * s, v.y * s, v.z * s};
}

inline ecs::Vec3 lerp(const ecs::Vec3& a, const ecs::Vec3& b, float t) {
    return {lerp(a.x, b.x, t), lerp(a.y, b.y, t), lerp(a.z, b.z, t)};
}

inline float length(const ecs::Vec3& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

/**
 * @brief Horizontal forward direction for a body heading.
 * Yaw 0 faces +Z; positive yaw turns clockwise seen from above (to the right).
 */
inline ecs::Vec3 heading_forward(float yaw_degrees) {
    float yaw = yaw_degrees * kDegToRad;
    return {-std::sin(yaw), 0.0f, std::cos(yaw)};
}

/**
 * @brief Horizontal right direction, forward x up.
 */
inline ecs::Vec3 heading_right(float yaw_degrees) {
    float yaw = yaw_degrees * kDegToRad;
    return {-std::cos(yaw), 0.0f, -std::sin(yaw)};
}

/**
 * @brief View direction for a heading and a pitch (positive pitch looks down).
 */
inline ecs::Vec3 view_direction(float yaw_degrees, float pitch_degrees) {
    float     pitch = pitch_degrees * kDegToRad;
    ecs::Vec3 fwd   = heading_forward(yaw_degrees);
    return {fwd.x * std::cos(pitch), -std::sin(pitch), fwd.z * std::cos(pitch)};
}

} // namespace fpmove::math
