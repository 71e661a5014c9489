/// @file types.hpp
/// @brief Core types for mcv_gridgen module

#pragma once

#include <mcvillage/math/types.hpp>
#include <mcvillage/scene/fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcv_gridgen {

using mcv_math::IVec3;
using mcv_math::Quat;
using mcv_math::Vec3;
using mcv_scene::NodeId;
using mcv_scene::TemplateId;

// =============================================================================
// GridSpec
// =============================================================================

/// @brief Lattice dimensions and generation switches
struct GridSpec {
    int size_x{5};
    int size_y{1};
    int size_z{5};
    float spacing{1.0f};
    bool align_to_center{true};
    bool clear_on_generate{true};
    bool use_random_seed{true};
    std::int32_t seed{12345};    ///< Used only when use_random_seed is false

    /// @brief Number of cells (0 for invalid sizes)
    [[nodiscard]] std::size_t cell_count() const {
        if (size_x < 0 || size_y < 0 || size_z < 0) {
            return 0;
        }
        return static_cast<std::size_t>(size_x) * static_cast<std::size_t>(size_y) *
               static_cast<std::size_t>(size_z);
    }
};

// =============================================================================
// Plant Prefab Type
// =============================================================================

/// @brief Plant shape category used to match sprite sheets
enum class PlantPrefabType : std::uint8_t {
    Any,
    Single,     ///< One block tall (short flowers, grass)
    Double,     ///< Two blocks tall (tall flowers, tall grass)
    Crop        ///< Farmland crops
};

[[nodiscard]] const char* plant_prefab_type_name(PlantPrefabType type);
[[nodiscard]] std::optional<PlantPrefabType> parse_plant_prefab_type(const std::string& name);

/// @brief Sheet compatibility: either side Any, or equal
[[nodiscard]] inline bool prefab_types_compatible(PlantPrefabType sheet, PlantPrefabType filter) {
    return sheet == PlantPrefabType::Any || filter == PlantPrefabType::Any || sheet == filter;
}

// =============================================================================
// Generation Report
// =============================================================================

/// @brief Sprite frame chosen for an instance
struct SpriteSelection {
    std::size_t sheet_index{0};     ///< Index into the manager's full sheet list
    int frame{0};
    int total_frames{0};
};

/// @brief One instance placed by a generator
struct Placement {
    NodeId node;
    std::string type_name;
    IVec3 cell{0};
    Vec3 position{0.0f};
    Vec3 scale{1.0f};
    Quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    std::optional<SpriteSelection> sprite;
    std::size_t shader_writes{0};   ///< Property-block slots written by shader randomization
};

/// @brief Result of a generate() call
struct GenerationReport {
    std::vector<Placement> placements;
    std::size_t cell_count{0};
    std::size_t skipped_cells{0};
    std::optional<std::int32_t> seed;     ///< Set when a fixed seed was applied
};

} // namespace mcv_gridgen
