/// @file volumes.hpp
/// @brief Trigger volume shapes for mcv_scene module

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <mcvillage/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <memory>

namespace mcv_scene {

/// @brief Volume shape type
enum class VolumeType : std::uint8_t {
    Box,
    Sphere
};

// =============================================================================
// ITriggerVolume Interface
// =============================================================================

/// @brief Interface for trigger volumes
///
/// The center is an offset in the owning node's space; containment tests take
/// points already expressed relative to the owning node's world position.
class ITriggerVolume {
public:
    virtual ~ITriggerVolume() = default;

    /// @brief Get volume type
    virtual VolumeType type() const = 0;

    /// @brief Check if point is inside volume
    virtual bool contains(const Vec3& point) const = 0;

    /// @brief Get bounding AABB
    virtual AABB bounds() const = 0;

    /// @brief Get center offset
    virtual Vec3 center() const = 0;

    /// @brief Set center offset
    virtual void set_center(const Vec3& center) = 0;

    /// @brief Clone the volume
    virtual std::unique_ptr<ITriggerVolume> clone() const = 0;
};

// =============================================================================
// BoxVolume
// =============================================================================

/// @brief Axis-aligned box volume
class BoxVolume : public ITriggerVolume {
public:
    BoxVolume();
    BoxVolume(const Vec3& center, const Vec3& half_extents);
    ~BoxVolume() override;

    VolumeType type() const override { return VolumeType::Box; }
    bool contains(const Vec3& point) const override;
    AABB bounds() const override;
    Vec3 center() const override { return m_center; }
    void set_center(const Vec3& center) override { m_center = center; }
    std::unique_ptr<ITriggerVolume> clone() const override;

    const Vec3& half_extents() const { return m_half_extents; }
    void set_half_extents(const Vec3& extents) { m_half_extents = extents; }

    /// @brief Full edge lengths
    Vec3 size() const { return m_half_extents * 2.0f; }

private:
    Vec3 m_center{0.0f};
    Vec3 m_half_extents{0.5f, 0.5f, 0.5f};
};

// =============================================================================
// SphereVolume
// =============================================================================

/// @brief Sphere volume
class SphereVolume : public ITriggerVolume {
public:
    SphereVolume();
    SphereVolume(const Vec3& center, float radius);
    ~SphereVolume() override;

    VolumeType type() const override { return VolumeType::Sphere; }
    bool contains(const Vec3& point) const override;
    AABB bounds() const override;
    Vec3 center() const override { return m_center; }
    void set_center(const Vec3& center) override { m_center = center; }
    std::unique_ptr<ITriggerVolume> clone() const override;

    float radius() const { return m_radius; }
    void set_radius(float radius) { m_radius = radius; }

private:
    Vec3 m_center{0.0f};
    float m_radius{0.5f};
};

// =============================================================================
// Volume Factory
// =============================================================================

/// @brief Factory for creating trigger volumes
class VolumeFactory {
public:
    /// @brief Create a box volume from full edge lengths
    static std::unique_ptr<ITriggerVolume> create_box(const Vec3& center, const Vec3& size);

    /// @brief Create a sphere volume
    static std::unique_ptr<ITriggerVolume> create_sphere(const Vec3& center, float radius);

    /// @brief Create from `{"shape": "box", "center": [..], "size": [..]}` or
    /// `{"shape": "sphere", "center": [..], "radius": r}`
    static mcv_core::Result<std::unique_ptr<ITriggerVolume>> from_json(const nlohmann::json& j);
};

} // namespace mcv_scene
