/// @file plant_grid_generator.hpp
/// @brief Weighted plant placement with shared randomization

#pragma once

#include "grid_generator.hpp"
#include "shader_parameters.hpp"
#include "sprite_sheets.hpp"
#include "transform_randomizer.hpp"

#include <vector>

namespace mcv_gridgen {

/// @brief One plant kind the plant generator may place
struct PlantTypeConfig {
    std::string name;
    TemplateId template_id;
    PlantPrefabType plant_type{PlantPrefabType::Crop};
    float spawn_weight{1.0f};
    bool enabled{true};
};

// =============================================================================
// PlantGridGenerator
// =============================================================================

/// @brief Weight-only plant selection; sprite sheets filtered by plant type
///
/// Without any enabled config holding a live template, the generator places
/// its `default_template` under the name "Default" with `default_plant_type`.
class PlantGridGenerator : public GridGenerator {
public:
    using GridGenerator::GridGenerator;

    PlantPrefabType default_plant_type{PlantPrefabType::Crop};
    TransformRandomizer transform;
    ShaderParameterManager shader{ShaderParameterManager::default_parameters()};
    SpriteSheetManager sprites;

    /// @brief Append an enabled config with weight 1
    PlantTypeConfig& add_plant_type(const std::string& name, TemplateId template_id, PlantPrefabType type);

    [[nodiscard]] std::vector<PlantTypeConfig>& plant_types() noexcept { return m_plants; }
    [[nodiscard]] const std::vector<PlantTypeConfig>& plant_types() const noexcept { return m_plants; }

    [[nodiscard]] const char* kind() const override { return "plant"; }

protected:
    [[nodiscard]] Result<void> validate() const override;
    void begin_generation() override;
    std::optional<Placement> place_cell(const IVec3& cell, const Vec3& position, NodeId container) override;

private:
    [[nodiscard]] bool is_usable(const PlantTypeConfig& config) const;

    std::vector<PlantTypeConfig> m_plants;
    std::vector<std::size_t> m_usable;
    std::vector<float> m_weights;
};

} // namespace mcv_gridgen
