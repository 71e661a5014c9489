/// @file serialization.hpp
/// @brief JSON loading for grid generators
///
/// Generator definition:
/// ```json
/// {
///   "kind": "plant",
///   "grid": {"size": [4, 1, 4], "spacing": 1.0, "align_to_center": true,
///            "use_random_seed": false, "seed": 7},
///   "template": "Wheat",
///   "default_plant_type": "Crop",
///   "plants": [{"name": "Wheat", "template": "Wheat", "plant_type": "Crop", "spawn_weight": 2}],
///   "transform": {"randomize_rotation": true, "min_rotation": [0, 0, 0], "max_rotation": [0, 360, 0]},
///   "shader": [{"name": "_WaveSpeed", "min": 0.5, "max": 2.0}],
///   "sprites": {"sheets": [{"name": "wheat", "texture": "wheat_sheet", "columns": 4, "rows": 2}]}
/// }
/// ```
/// Custom generators list their entries under "types", each carrying its own
/// "transform", "shader" and "sprites". Unknown keys are ignored.

#pragma once

#include "custom_grid_generator.hpp"
#include "plant_grid_generator.hpp"

#include <mcvillage/scene/assets.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcv_gridgen {

mcv_core::Result<GridSpec> grid_spec_from_json(const nlohmann::json& j);

mcv_core::Result<TransformRandomizer> transform_randomizer_from_json(const nlohmann::json& j);

/// @brief Parse a parameter list (array of {"name", "enabled", "min", "max"})
mcv_core::Result<ShaderParameterManager> shader_parameters_from_json(const nlohmann::json& j);

/// @brief Parse a sprite sheet. Texture names are registered with `assets`.
///
/// When "columns"/"rows" are absent but "pixel_size" is given, the layout is
/// estimated with SpriteSheetManager::detect_grid_size.
mcv_core::Result<SpriteSheet> sprite_sheet_from_json(const nlohmann::json& j, mcv_scene::AssetLookup& assets);

mcv_core::Result<SpriteSheetManager> sprite_sheet_manager_from_json(const nlohmann::json& j,
                                                                    mcv_scene::AssetLookup& assets);

mcv_core::Result<ObjectTypeEntry> object_type_from_json(const nlohmann::json& j, mcv_scene::AssetLookup& assets);

mcv_core::Result<PlantTypeConfig> plant_type_from_json(const nlohmann::json& j, const mcv_scene::AssetLookup& assets);

/// @brief Build a generator of the requested "kind" (base, custom or plant)
mcv_core::Result<std::unique_ptr<GridGenerator>> generator_from_json(
    const nlohmann::json& j, mcv_scene::SceneGraph& scene, NodeId owner, mcv_scene::AssetLookup& assets,
    std::shared_ptr<mcv_core::IRandomSource> rng = nullptr);

/// @brief A generator loaded from a world file with the owner it was declared for
struct LoadedGenerator {
    std::string owner_name;
    std::unique_ptr<GridGenerator> generator;
};

/// @brief Load the world's "generators" array, creating missing owner nodes
///
/// Every generator gets its own SeededRandom. With `base_seed` set, generator
/// i is seeded with derive_seed(base_seed, i); otherwise each seeds from
/// entropy. Owners are resolved by node name.
mcv_core::Result<std::vector<LoadedGenerator>> generators_from_json(const nlohmann::json& world,
                                                                    mcv_scene::SceneGraph& scene,
                                                                    mcv_scene::AssetLookup& assets,
                                                                    std::optional<std::uint32_t> base_seed);

} // namespace mcv_gridgen
