#pragma once

/// @file transform.hpp
/// @brief Transform type for mcv_math
///
/// Position, rotation and scale of a scene node relative to its parent.

#include "types.hpp"

namespace mcv_math {

/// Complete 3D transform with position, rotation, and scale
struct Transform {
    Vec3 position = vec3::ZERO;
    Quat rotation = quat::IDENTITY;
    Vec3 scale_   = vec3::ONE;  // Named scale_ to avoid conflict with glm::scale

    Transform() noexcept = default;

    Transform(const Vec3& pos, const Quat& rot, const Vec3& scl) noexcept
        : position(pos), rotation(rot), scale_(scl) {}

    /// Position only
    static Transform from_position(const Vec3& pos) noexcept {
        return Transform(pos, quat::IDENTITY, vec3::ONE);
    }

    /// Position and rotation
    static Transform from_position_rotation(const Vec3& pos, const Quat& rot) noexcept {
        return Transform(pos, rot, vec3::ONE);
    }

    // =========================================================================
    // Transformation
    // =========================================================================

    /// Transform a point (applies scale, then rotation, then translation)
    [[nodiscard]] Vec3 transform_point(const Vec3& point) const noexcept {
        return position + rotate(rotation, scale_ * point);
    }

    /// Compose transforms (this * other), `other` expressed in this space
    [[nodiscard]] Transform combine(const Transform& other) const noexcept {
        return Transform(
            transform_point(other.position),
            rotation * other.rotation,
            scale_ * other.scale_
        );
    }

    /// Inverse transform (exact for uniform scale)
    [[nodiscard]] Transform inverse() const noexcept {
        Quat inv_rot = glm::inverse(rotation);
        Vec3 inv_scale = Vec3(1.0f / scale_.x, 1.0f / scale_.y, 1.0f / scale_.z);
        Vec3 inv_pos = rotate(inv_rot, -position) * inv_scale;
        return Transform(inv_pos, inv_rot, inv_scale);
    }

    Transform operator*(const Transform& other) const noexcept {
        return combine(other);
    }

    bool operator==(const Transform& other) const noexcept {
        return position == other.position &&
               rotation == other.rotation &&
               scale_ == other.scale_;
    }

    bool operator!=(const Transform& other) const noexcept {
        return !(*this == other);
    }
};

/// Check if two transforms are approximately equal
[[nodiscard]] inline bool approx_equal(const Transform& a, const Transform& b,
                                       float epsilon = consts::EPSILON_LOOSE) noexcept {
    return approx_equal(a.position, b.position, epsilon) &&
           approx_equal(a.rotation, b.rotation, epsilon) &&
           approx_equal(a.scale_, b.scale_, epsilon);
}

} // namespace mcv_math
