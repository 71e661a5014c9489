#pragma once

/// @file types.hpp
/// @brief Core type definitions for mcv_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/quaternion.hpp>
#include <glm/gtx/norm.hpp>
#include <glm/gtx/string_cast.hpp>

#include <algorithm>
#include <cmath>

namespace mcv_math {

// =============================================================================
// Type Aliases (GLM)
// =============================================================================

using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;
using IVec3 = glm::ivec3;
using Quat = glm::quat;

/// Linear RGBA color
using Color = glm::vec4;

// =============================================================================
// Constants
// =============================================================================

namespace consts {
    inline constexpr float PI = 3.14159265358979323846f;
    inline constexpr float DEG_TO_RAD = PI / 180.0f;
    inline constexpr float RAD_TO_DEG = 180.0f / PI;
    inline constexpr float EPSILON = 1e-6f;
    inline constexpr float EPSILON_LOOSE = 1e-4f;
}

namespace vec3 {
    inline constexpr Vec3 ZERO = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE  = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X    = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y    = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z    = Vec3(0.0f, 0.0f, 1.0f);
}

namespace color {
    inline constexpr Color WHITE = Color(1.0f, 1.0f, 1.0f, 1.0f);
    inline constexpr Color BLACK = Color(0.0f, 0.0f, 0.0f, 1.0f);
}

namespace quat {
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f); // w, x, y, z
}

// =============================================================================
// Helpers
// =============================================================================

/// Quaternion from Euler angles in degrees (XYZ)
[[nodiscard]] inline Quat quat_from_euler_degrees(const Vec3& degrees) noexcept {
    return Quat(degrees * consts::DEG_TO_RAD);
}

/// Euler angles in degrees (XYZ) from a quaternion
[[nodiscard]] inline Vec3 euler_degrees(const Quat& q) noexcept {
    return glm::eulerAngles(q) * consts::RAD_TO_DEG;
}

/// Rotate a vector by a quaternion
[[nodiscard]] inline Vec3 rotate(const Quat& q, const Vec3& v) noexcept {
    return q * v;
}

[[nodiscard]] inline bool approx_equal(const Vec3& a, const Vec3& b,
                                       float epsilon = consts::EPSILON_LOOSE) noexcept {
    return glm::length2(a - b) <= epsilon * epsilon;
}

[[nodiscard]] inline bool approx_equal(const Quat& a, const Quat& b,
                                       float epsilon = consts::EPSILON_LOOSE) noexcept {
    // q and -q describe the same rotation
    return std::abs(glm::dot(a, b)) >= 1.0f - epsilon;
}

/// Componentwise lerp
[[nodiscard]] inline float lerp(float a, float b, float t) noexcept {
    return a + (b - a) * t;
}

/// Rotation whose local +Z points along `forward` with +Y as close to `up`
/// as possible. A zero `forward` gives identity; a `forward` parallel to `up`
/// falls back to +X as the right axis.
[[nodiscard]] inline Quat look_rotation(const Vec3& forward, const Vec3& up = Vec3(0.0f, 1.0f, 0.0f)) noexcept {
    if (glm::length2(forward) <= consts::EPSILON * consts::EPSILON) {
        return quat::IDENTITY;
    }
    Vec3 z = glm::normalize(forward);
    Vec3 x = glm::cross(up, z);
    if (glm::length2(x) <= consts::EPSILON * consts::EPSILON) {
        x = Vec3(1.0f, 0.0f, 0.0f);
    } else {
        x = glm::normalize(x);
    }
    Vec3 y = glm::cross(z, x);
    return glm::normalize(glm::quat_cast(glm::mat3(x, y, z)));
}

/// Angle between two orientations in degrees
[[nodiscard]] inline float angle_degrees(const Quat& a, const Quat& b) noexcept {
    float d = std::min(std::abs(glm::dot(a, b)), 1.0f);
    return 2.0f * std::acos(d) * consts::RAD_TO_DEG;
}

} // namespace mcv_math
