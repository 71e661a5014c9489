/// @file custom_grid_generator.hpp
/// @brief Multi-type grid generator with probability gating and weights

#pragma once

#include "grid_generator.hpp"
#include "shader_parameters.hpp"
#include "sprite_sheets.hpp"
#include "transform_randomizer.hpp"

#include <vector>

namespace mcv_gridgen {

/// @brief One object type the custom generator may place
struct ObjectTypeEntry {
    std::string name;
    TemplateId template_id;
    bool enabled{true};
    float spawn_weight{1.0f};
    float spawn_probability{1.0f};    ///< Per-cell Bernoulli gate when below 1
    TransformRandomizer transform;
    ShaderParameterManager shader{ShaderParameterManager::default_parameters()};
    SpriteSheetManager sprites;

    /// @brief Whether the entry runs a Bernoulli trial per cell
    [[nodiscard]] bool uses_spawn_probability() const { return spawn_probability < 1.0f; }
};

// =============================================================================
// CustomGridGenerator
// =============================================================================

/// @brief Places a weighted choice among several object types per cell
///
/// Per cell every enabled entry with a live template first passes its spawn
/// probability trial (in entry order, one draw each for gated entries). A
/// weighted draw then picks among the survivors. Cells where every entry is
/// gated out are skipped.
class CustomGridGenerator : public GridGenerator {
public:
    using GridGenerator::GridGenerator;

    /// @brief Append an enabled entry with default weight and probability
    ObjectTypeEntry& add_object_type(const std::string& name, TemplateId template_id);

    [[nodiscard]] std::vector<ObjectTypeEntry>& object_types() noexcept { return m_types; }
    [[nodiscard]] const std::vector<ObjectTypeEntry>& object_types() const noexcept { return m_types; }

    [[nodiscard]] const char* kind() const override { return "custom"; }

protected:
    [[nodiscard]] Result<void> validate() const override;
    std::optional<Placement> place_cell(const IVec3& cell, const Vec3& position, NodeId container) override;

private:
    [[nodiscard]] bool is_usable(const ObjectTypeEntry& entry) const;

    std::vector<ObjectTypeEntry> m_types;
};

} // namespace mcv_gridgen
