/// @file volumes.cpp
/// @brief Trigger volume implementation for mcv_scene module

#include <mcvillage/scene/volumes.hpp>

#include <mcvillage/core/config.hpp>
#include <mcvillage/math/json.hpp>

#include <nlohmann/json.hpp>

#include <cmath>

namespace mcv_scene {

using mcv_core::ConfigError;
using mcv_core::Result;

// =============================================================================
// BoxVolume Implementation
// =============================================================================

BoxVolume::BoxVolume() = default;

BoxVolume::BoxVolume(const Vec3& center, const Vec3& half_extents)
    : m_center(center)
    , m_half_extents(half_extents) {
}

BoxVolume::~BoxVolume() = default;

bool BoxVolume::contains(const Vec3& point) const {
    return std::abs(point.x - m_center.x) <= m_half_extents.x &&
           std::abs(point.y - m_center.y) <= m_half_extents.y &&
           std::abs(point.z - m_center.z) <= m_half_extents.z;
}

AABB BoxVolume::bounds() const {
    return {m_center - m_half_extents, m_center + m_half_extents};
}

std::unique_ptr<ITriggerVolume> BoxVolume::clone() const {
    return std::make_unique<BoxVolume>(m_center, m_half_extents);
}

// =============================================================================
// SphereVolume Implementation
// =============================================================================

SphereVolume::SphereVolume() = default;

SphereVolume::SphereVolume(const Vec3& center, float radius)
    : m_center(center)
    , m_radius(radius) {
}

SphereVolume::~SphereVolume() = default;

bool SphereVolume::contains(const Vec3& point) const {
    Vec3 d = point - m_center;
    return glm::dot(d, d) <= m_radius * m_radius;
}

AABB SphereVolume::bounds() const {
    Vec3 r(m_radius);
    return {m_center - r, m_center + r};
}

std::unique_ptr<ITriggerVolume> SphereVolume::clone() const {
    return std::make_unique<SphereVolume>(m_center, m_radius);
}

// =============================================================================
// VolumeFactory Implementation
// =============================================================================

std::unique_ptr<ITriggerVolume> VolumeFactory::create_box(const Vec3& center, const Vec3& size) {
    return std::make_unique<BoxVolume>(center, size * 0.5f);
}

std::unique_ptr<ITriggerVolume> VolumeFactory::create_sphere(const Vec3& center, float radius) {
    return std::make_unique<SphereVolume>(center, radius);
}

Result<std::unique_ptr<ITriggerVolume>> VolumeFactory::from_json(const nlohmann::json& j) {
    using VolumeResult = Result<std::unique_ptr<ITriggerVolume>>;

    if (auto r = mcv_core::expect_object(j, "volume"); !r) {
        return VolumeResult(r.error());
    }

    std::string shape = "box";
    if (auto r = mcv_core::read_optional(j, "shape", shape); !r) {
        return VolumeResult(r.error());
    }

    Vec3 center(0.0f);
    if (j.contains("center")) {
        auto c = mcv_math::vec3_from_json(j["center"], "volume.center");
        if (!c) {
            return VolumeResult(c.error());
        }
        center = *c;
    }

    if (shape == "box") {
        Vec3 size(1.0f);
        if (j.contains("size")) {
            auto s = mcv_math::vec3_from_json(j["size"], "volume.size");
            if (!s) {
                return VolumeResult(s.error());
            }
            size = *s;
        }
        return VolumeResult(create_box(center, size));
    }

    if (shape == "sphere") {
        float radius = 0.5f;
        if (auto r = mcv_core::read_optional(j, "radius", radius); !r) {
            return VolumeResult(r.error());
        }
        return VolumeResult(create_sphere(center, radius));
    }

    return VolumeResult(mcv_core::Error(ConfigError::unknown_reference("volume.shape", shape)));
}

} // namespace mcv_scene
