/// @file sprite_sheets.hpp
/// @brief Sprite-sheet stage selection for grid instances

#pragma once

#include "types.hpp"

#include <mcvillage/core/fwd.hpp>
#include <mcvillage/math/types.hpp>
#include <mcvillage/scene/fwd.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcv_gridgen {

class ShaderParameterManager;

/// @brief Texture atlas of growth stages
struct SpriteSheet {
    std::string name;
    mcv_scene::TextureId texture;
    int columns{1};
    int rows{1};
    int frame_count{1};
    PlantPrefabType prefab_type{PlantPrefabType::Any};
    bool use_color_tint{false};
    mcv_math::Color color_tint{1.0f, 1.0f, 1.0f, 1.0f};

    /// @brief min(frame_count, columns * rows), never negative
    [[nodiscard]] int total_frames() const;
};

/// @brief Material property names written by sprite application
struct SpriteSheetProperties {
    std::string main_texture{"_MainTex"};
    std::string stage{"_Stage"};
    std::string columns{"_Columns"};
    std::string rows{"_Rows"};
    std::string stage_count{"_StageCount"};
    std::string color{"_Color"};
};

/// @brief Grid layout (columns, rows)
struct GridLayout {
    int columns{1};
    int rows{1};

    bool operator==(const GridLayout&) const = default;
};

// =============================================================================
// SpriteSheetManager
// =============================================================================

class SpriteSheetManager {
public:
    bool use_sprite_sheets{true};
    std::vector<SpriteSheet> sheets;
    SpriteSheetProperties properties;

    /// @brief Whether apply() would pick a sheet at all
    [[nodiscard]] bool is_active() const { return use_sprite_sheets && !sheets.empty(); }

    /// @brief Indices of sheets compatible with `filter`
    [[nodiscard]] std::vector<std::size_t> compatible_sheets(PlantPrefabType filter) const;

    /// @brief Pick a compatible sheet and frame, write it to the instance, then
    /// randomize the remaining shader parameters (skipping the stage property)
    ///
    /// Draws: sheet index, then frame index, then shader parameters. With no
    /// compatible sheet only the shader parameters are randomized.
    /// @param shader_writes Receives the shader randomization write count
    std::optional<SpriteSelection> apply(mcv_scene::SceneGraph& scene, NodeId node,
                                         const ShaderParameterManager& shader,
                                         mcv_core::IRandomSource& rng,
                                         PlantPrefabType filter = PlantPrefabType::Any,
                                         std::size_t* shader_writes = nullptr) const;

    /// @brief Estimate a layout from texture pixel dimensions
    ///
    /// Wider than twice the height: horizontal strip. Taller than twice the
    /// width: vertical strip. Otherwise a square grid estimate.
    [[nodiscard]] static GridLayout detect_grid_size(int width, int height);
};

} // namespace mcv_gridgen
