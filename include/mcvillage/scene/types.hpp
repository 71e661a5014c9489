/// @file types.hpp
/// @brief Materials, property blocks and renderers for mcv_scene module

#pragma once

#include "fwd.hpp"

#include <mcvillage/math/types.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcv_scene {

using mcv_math::Color;
using mcv_math::Quat;
using mcv_math::Vec3;

// =============================================================================
// Material Values
// =============================================================================

/// @brief Value of a named shader property
using MaterialValue = std::variant<float, Color, TextureId>;

/// @brief Shared material asset
///
/// Declares which shader properties exist and their default values. Instances
/// never write here; per-instance overrides live in PropertyBlock.
struct Material {
    std::string name;
    std::map<std::string, MaterialValue> properties;

    Material() = default;
    explicit Material(std::string material_name) : name(std::move(material_name)) {}

    /// @brief Check whether the shader declares a property
    [[nodiscard]] bool has_property(const std::string& property) const {
        return properties.count(property) > 0;
    }

    /// @brief Declare a property with its default value
    Material& declare(const std::string& property, MaterialValue default_value) {
        properties[property] = std::move(default_value);
        return *this;
    }

    [[nodiscard]] std::optional<float> get_float(const std::string& property) const;
    [[nodiscard]] std::optional<Color> get_color(const std::string& property) const;
    [[nodiscard]] std::optional<TextureId> get_texture(const std::string& property) const;
};

// =============================================================================
// PropertyBlock
// =============================================================================

/// @brief Per-instance, per-slot property overrides
struct PropertyBlock {
    std::map<std::string, MaterialValue> values;

    void set_float(const std::string& property, float value) { values[property] = value; }
    void set_color(const std::string& property, const Color& value) { values[property] = value; }
    void set_texture(const std::string& property, TextureId value) { values[property] = value; }

    [[nodiscard]] bool has(const std::string& property) const { return values.count(property) > 0; }
    [[nodiscard]] bool empty() const noexcept { return values.empty(); }
    void clear() { values.clear(); }

    [[nodiscard]] std::optional<float> get_float(const std::string& property) const;
    [[nodiscard]] std::optional<Color> get_color(const std::string& property) const;
    [[nodiscard]] std::optional<TextureId> get_texture(const std::string& property) const;
};

// =============================================================================
// Renderer
// =============================================================================

/// @brief Renderer attached to a scene node
///
/// Material slots reference shared materials. `blocks` always has one entry per
/// slot and is the only place instance values are written.
struct Renderer {
    std::vector<std::shared_ptr<const Material>> materials;
    std::vector<PropertyBlock> blocks;

    Renderer() = default;
    explicit Renderer(std::vector<std::shared_ptr<const Material>> slots)
        : materials(std::move(slots))
        , blocks(materials.size()) {}

    [[nodiscard]] std::size_t slot_count() const noexcept { return materials.size(); }

    /// @brief Whether any slot's material declares the property
    [[nodiscard]] bool declares(const std::string& property) const;

    /// @brief Effective float value for a slot (block override, else material default)
    [[nodiscard]] std::optional<float> effective_float(std::size_t slot, const std::string& property) const;
    [[nodiscard]] std::optional<Color> effective_color(std::size_t slot, const std::string& property) const;
    [[nodiscard]] std::optional<TextureId> effective_texture(std::size_t slot, const std::string& property) const;

    /// @brief Write a value into every slot whose material declares the property
    /// @return Number of slots written
    std::size_t set_float_on_declaring(const std::string& property, float value);
    std::size_t set_color_on_declaring(const std::string& property, const Color& value);
    std::size_t set_texture_on_declaring(const std::string& property, TextureId value);

    /// @brief Resize blocks to match the material slots
    void sync_blocks() { blocks.resize(materials.size()); }
};

// =============================================================================
// AABB
// =============================================================================

/// @brief Axis-aligned bounding box
struct AABB {
    Vec3 min{0.0f};
    Vec3 max{0.0f};

    [[nodiscard]] Vec3 center() const { return (min + max) * 0.5f; }
    [[nodiscard]] Vec3 extents() const { return (max - min) * 0.5f; }

    [[nodiscard]] bool contains(const Vec3& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    [[nodiscard]] bool intersects(const AABB& other) const {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }
};

} // namespace mcv_scene
