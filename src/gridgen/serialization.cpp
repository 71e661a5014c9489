/// @file serialization.cpp
/// @brief JSON loading for mcv_gridgen module

#include <mcvillage/gridgen/serialization.hpp>

#include <mcvillage/core/config.hpp>
#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/math/json.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <nlohmann/json.hpp>

namespace mcv_gridgen {

using mcv_core::ConfigError;
using mcv_core::Err;
using mcv_core::Error;
using mcv_core::Ok;
using mcv_core::Result;

namespace {

/// Read a vec3 given either as a scalar (uniform) or a vector
Result<void> read_vec3(const nlohmann::json& j, const std::string& key, Vec3& out, bool allow_scalar) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok();
    }
    if (allow_scalar && it->is_number()) {
        out = Vec3(it->get<float>());
        return Ok();
    }
    auto value = mcv_math::vec3_from_json(*it, key);
    if (!value) {
        return Err(value.error());
    }
    out = *value;
    return Ok();
}

Result<void> read_unit_interval(const nlohmann::json& j, const std::string& key, float& out) {
    if (auto r = mcv_core::read_optional(j, key, out); !r) {
        return r;
    }
    if (out < 0.0f || out > 1.0f) {
        return Err(ConfigError::wrong_type(key, "a number between 0 and 1"));
    }
    return Ok();
}

Result<void> read_non_negative(const nlohmann::json& j, const std::string& key, float& out) {
    if (auto r = mcv_core::read_optional(j, key, out); !r) {
        return r;
    }
    if (out < 0.0f) {
        return Err(ConfigError::wrong_type(key, "a non-negative number"));
    }
    return Ok();
}

Result<void> read_prefab_type(const nlohmann::json& j, const std::string& key, PlantPrefabType& out) {
    std::string text;
    if (auto r = mcv_core::read_optional(j, key, text); !r) {
        return r;
    }
    if (text.empty()) {
        return Ok();
    }
    auto parsed = parse_plant_prefab_type(text);
    if (!parsed) {
        return Err(ConfigError::wrong_type(key, "one of Any, Single, Double, Crop"));
    }
    out = *parsed;
    return Ok();
}

Result<TemplateId> read_template(const nlohmann::json& j, const std::string& key,
                                 const mcv_scene::AssetLookup& assets) {
    std::string name;
    if (auto r = mcv_core::read_required(j, key, name); !r) {
        return Err<TemplateId>(r.error());
    }
    return assets.find_template(name, key);
}

} // anonymous namespace

// =============================================================================
// Components
// =============================================================================

Result<GridSpec> grid_spec_from_json(const nlohmann::json& j) {
    if (auto r = mcv_core::expect_object(j, "grid"); !r) {
        return Err<GridSpec>(r.error());
    }

    GridSpec spec;

    auto size = j.find("size");
    if (size != j.end()) {
        if (!size->is_array() || size->size() != 3 || !(*size)[0].is_number_integer() ||
            !(*size)[1].is_number_integer() || !(*size)[2].is_number_integer()) {
            return Err<GridSpec>(ConfigError::wrong_type("grid.size", "an array of three integers"));
        }
        spec.size_x = (*size)[0].get<int>();
        spec.size_y = (*size)[1].get<int>();
        spec.size_z = (*size)[2].get<int>();
    }

    for (auto r : {mcv_core::read_optional(j, "size_x", spec.size_x),
                   mcv_core::read_optional(j, "size_y", spec.size_y),
                   mcv_core::read_optional(j, "size_z", spec.size_z),
                   mcv_core::read_optional(j, "spacing", spec.spacing),
                   mcv_core::read_optional(j, "align_to_center", spec.align_to_center),
                   mcv_core::read_optional(j, "clear_on_generate", spec.clear_on_generate),
                   mcv_core::read_optional(j, "use_random_seed", spec.use_random_seed),
                   mcv_core::read_optional(j, "seed", spec.seed)}) {
        if (!r) {
            return Err<GridSpec>(r.error());
        }
    }

    return Ok(spec);
}

Result<TransformRandomizer> transform_randomizer_from_json(const nlohmann::json& j) {
    if (auto r = mcv_core::expect_object(j, "transform"); !r) {
        return Err<TransformRandomizer>(r.error());
    }

    TransformRandomizer out;
    for (auto r : {mcv_core::read_optional(j, "randomize_scale", out.randomize_scale),
                   read_vec3(j, "min_scale", out.min_scale, true),
                   read_vec3(j, "max_scale", out.max_scale, true),
                   mcv_core::read_optional(j, "randomize_rotation", out.randomize_rotation),
                   read_vec3(j, "min_rotation", out.min_rotation, false),
                   read_vec3(j, "max_rotation", out.max_rotation, false)}) {
        if (!r) {
            return Err<TransformRandomizer>(r.error());
        }
    }
    return Ok(out);
}

Result<ShaderParameterManager> shader_parameters_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        return Err<ShaderParameterManager>(ConfigError::wrong_type("shader", "an array"));
    }

    ShaderParameterManager manager;
    for (const auto& item : j) {
        if (auto r = mcv_core::expect_object(item, "shader parameter"); !r) {
            return Err<ShaderParameterManager>(r.error());
        }

        ShaderFloatParameter param;
        for (auto r : {mcv_core::read_required(item, "name", param.name),
                       mcv_core::read_optional(item, "enabled", param.enabled),
                       mcv_core::read_optional(item, "min", param.min_value),
                       mcv_core::read_optional(item, "max", param.max_value)}) {
            if (!r) {
                return Err<ShaderParameterManager>(r.error());
            }
        }
        if (param.min_value > param.max_value) {
            return Err<ShaderParameterManager>(
                ConfigError::malformed("shader", "parameter '" + param.name + "' has min greater than max"));
        }
        manager.add_parameter(std::move(param));
    }
    return Ok(std::move(manager));
}

Result<SpriteSheet> sprite_sheet_from_json(const nlohmann::json& j, mcv_scene::AssetLookup& assets) {
    if (auto r = mcv_core::expect_object(j, "sprite sheet"); !r) {
        return Err<SpriteSheet>(r.error());
    }

    SpriteSheet sheet;
    std::string texture;
    bool has_layout = j.contains("columns") || j.contains("rows");

    for (auto r : {mcv_core::read_optional(j, "name", sheet.name),
                   mcv_core::read_optional(j, "texture", texture),
                   mcv_core::read_optional(j, "columns", sheet.columns),
                   mcv_core::read_optional(j, "rows", sheet.rows),
                   read_prefab_type(j, "prefab_type", sheet.prefab_type)}) {
        if (!r) {
            return Err<SpriteSheet>(r.error());
        }
    }

    if (!texture.empty()) {
        sheet.texture = assets.add_texture(texture);
    }

    auto pixels = j.find("pixel_size");
    if (!has_layout && pixels != j.end()) {
        if (!pixels->is_array() || pixels->size() != 2 || !(*pixels)[0].is_number_integer() ||
            !(*pixels)[1].is_number_integer()) {
            return Err<SpriteSheet>(ConfigError::wrong_type("pixel_size", "an array of two integers"));
        }
        auto layout = SpriteSheetManager::detect_grid_size((*pixels)[0].get<int>(), (*pixels)[1].get<int>());
        sheet.columns = layout.columns;
        sheet.rows = layout.rows;
    }

    if (sheet.columns < 1 || sheet.rows < 1) {
        return Err<SpriteSheet>(ConfigError::malformed("sprite sheet", "'" + sheet.name + "' needs at least one cell"));
    }

    sheet.frame_count = sheet.columns * sheet.rows;
    if (auto r = mcv_core::read_optional(j, "frame_count", sheet.frame_count); !r) {
        return Err<SpriteSheet>(r.error());
    }

    auto tint = j.find("color_tint");
    if (tint != j.end() && !tint->is_null()) {
        auto color = mcv_math::color_from_json(*tint, "color_tint");
        if (!color) {
            return Err<SpriteSheet>(color.error());
        }
        sheet.color_tint = *color;
        sheet.use_color_tint = true;
    }
    if (auto r = mcv_core::read_optional(j, "use_color_tint", sheet.use_color_tint); !r) {
        return Err<SpriteSheet>(r.error());
    }

    return Ok(sheet);
}

Result<SpriteSheetManager> sprite_sheet_manager_from_json(const nlohmann::json& j, mcv_scene::AssetLookup& assets) {
    if (auto r = mcv_core::expect_object(j, "sprites"); !r) {
        return Err<SpriteSheetManager>(r.error());
    }

    SpriteSheetManager manager;
    if (auto r = mcv_core::read_optional(j, "enabled", manager.use_sprite_sheets); !r) {
        return Err<SpriteSheetManager>(r.error());
    }

    auto sheets = j.find("sheets");
    if (sheets != j.end()) {
        if (!sheets->is_array()) {
            return Err<SpriteSheetManager>(ConfigError::wrong_type("sheets", "an array"));
        }
        for (const auto& item : *sheets) {
            auto sheet = sprite_sheet_from_json(item, assets);
            if (!sheet) {
                return Err<SpriteSheetManager>(sheet.error());
            }
            manager.sheets.push_back(std::move(*sheet));
        }
    }

    auto props = j.find("properties");
    if (props != j.end()) {
        auto& names = manager.properties;
        for (auto r : {mcv_core::read_optional(*props, "main_texture", names.main_texture),
                       mcv_core::read_optional(*props, "stage", names.stage),
                       mcv_core::read_optional(*props, "columns", names.columns),
                       mcv_core::read_optional(*props, "rows", names.rows),
                       mcv_core::read_optional(*props, "stage_count", names.stage_count),
                       mcv_core::read_optional(*props, "color", names.color)}) {
            if (!r) {
                return Err<SpriteSheetManager>(r.error());
            }
        }
    }

    return Ok(std::move(manager));
}

// =============================================================================
// Type Entries
// =============================================================================

Result<ObjectTypeEntry> object_type_from_json(const nlohmann::json& j, mcv_scene::AssetLookup& assets) {
    if (auto r = mcv_core::expect_object(j, "object type"); !r) {
        return Err<ObjectTypeEntry>(r.error());
    }

    ObjectTypeEntry entry;
    for (auto r : {mcv_core::read_required(j, "name", entry.name),
                   mcv_core::read_optional(j, "enabled", entry.enabled),
                   read_non_negative(j, "spawn_weight", entry.spawn_weight),
                   read_unit_interval(j, "spawn_probability", entry.spawn_probability)}) {
        if (!r) {
            return Err<ObjectTypeEntry>(r.error());
        }
    }
    if (entry.name.empty()) {
        return Err<ObjectTypeEntry>(ConfigError::malformed("object type", "name must not be empty"));
    }

    auto template_id = read_template(j, "template", assets);
    if (!template_id) {
        return Err<ObjectTypeEntry>(template_id.error());
    }
    entry.template_id = *template_id;

    if (j.contains("transform")) {
        auto transform = transform_randomizer_from_json(j["transform"]);
        if (!transform) {
            return Err<ObjectTypeEntry>(transform.error());
        }
        entry.transform = *transform;
    }
    if (j.contains("shader")) {
        auto shader = shader_parameters_from_json(j["shader"]);
        if (!shader) {
            return Err<ObjectTypeEntry>(shader.error());
        }
        entry.shader = std::move(*shader);
    }
    if (j.contains("sprites")) {
        auto sprites = sprite_sheet_manager_from_json(j["sprites"], assets);
        if (!sprites) {
            return Err<ObjectTypeEntry>(sprites.error());
        }
        entry.sprites = std::move(*sprites);
    }

    return Ok(std::move(entry));
}

Result<PlantTypeConfig> plant_type_from_json(const nlohmann::json& j, const mcv_scene::AssetLookup& assets) {
    if (auto r = mcv_core::expect_object(j, "plant type"); !r) {
        return Err<PlantTypeConfig>(r.error());
    }

    PlantTypeConfig config;
    for (auto r : {mcv_core::read_required(j, "name", config.name),
                   mcv_core::read_optional(j, "enabled", config.enabled),
                   read_non_negative(j, "spawn_weight", config.spawn_weight),
                   read_prefab_type(j, "plant_type", config.plant_type)}) {
        if (!r) {
            return Err<PlantTypeConfig>(r.error());
        }
    }

    auto template_id = read_template(j, "template", assets);
    if (!template_id) {
        return Err<PlantTypeConfig>(template_id.error());
    }
    config.template_id = *template_id;

    return Ok(std::move(config));
}

// =============================================================================
// Generators
// =============================================================================

Result<std::unique_ptr<GridGenerator>> generator_from_json(const nlohmann::json& j, mcv_scene::SceneGraph& scene,
                                                           NodeId owner, mcv_scene::AssetLookup& assets,
                                                           std::shared_ptr<mcv_core::IRandomSource> rng) {
    using GeneratorResult = Result<std::unique_ptr<GridGenerator>>;

    if (auto r = mcv_core::expect_object(j, "generator"); !r) {
        return GeneratorResult(r.error());
    }

    std::string kind = "base";
    if (auto r = mcv_core::read_optional(j, "kind", kind); !r) {
        return GeneratorResult(r.error());
    }

    std::unique_ptr<GridGenerator> generator;
    CustomGridGenerator* custom = nullptr;
    PlantGridGenerator* plant = nullptr;

    if (kind == "base") {
        generator = std::make_unique<GridGenerator>(scene, owner, rng);
    } else if (kind == "custom") {
        auto made = std::make_unique<CustomGridGenerator>(scene, owner, rng);
        custom = made.get();
        generator = std::move(made);
    } else if (kind == "plant") {
        auto made = std::make_unique<PlantGridGenerator>(scene, owner, rng);
        plant = made.get();
        generator = std::move(made);
    } else {
        return GeneratorResult(Error(ConfigError::wrong_type("kind", "one of base, custom, plant")));
    }

    if (j.contains("grid")) {
        auto spec = grid_spec_from_json(j["grid"]);
        if (!spec) {
            return GeneratorResult(spec.error());
        }
        generator->spec = *spec;
    }

    if (j.contains("template")) {
        auto template_id = read_template(j, "template", assets);
        if (!template_id) {
            return GeneratorResult(template_id.error());
        }
        generator->default_template = *template_id;
    }

    if (custom) {
        auto types = j.find("types");
        if (types != j.end()) {
            if (!types->is_array()) {
                return GeneratorResult(Error(ConfigError::wrong_type("types", "an array")));
            }
            for (const auto& item : *types) {
                auto entry = object_type_from_json(item, assets);
                if (!entry) {
                    return GeneratorResult(entry.error());
                }
                custom->object_types().push_back(std::move(*entry));
            }
        }
    }

    if (plant) {
        if (auto r = read_prefab_type(j, "default_plant_type", plant->default_plant_type); !r) {
            return GeneratorResult(r.error());
        }

        auto plants = j.find("plants");
        if (plants != j.end()) {
            if (!plants->is_array()) {
                return GeneratorResult(Error(ConfigError::wrong_type("plants", "an array")));
            }
            for (const auto& item : *plants) {
                auto config = plant_type_from_json(item, assets);
                if (!config) {
                    return GeneratorResult(config.error());
                }
                plant->plant_types().push_back(std::move(*config));
            }
        }

        if (j.contains("transform")) {
            auto transform = transform_randomizer_from_json(j["transform"]);
            if (!transform) {
                return GeneratorResult(transform.error());
            }
            plant->transform = *transform;
        }
        if (j.contains("shader")) {
            auto shader = shader_parameters_from_json(j["shader"]);
            if (!shader) {
                return GeneratorResult(shader.error());
            }
            plant->shader = std::move(*shader);
        }
        if (j.contains("sprites")) {
            auto sprites = sprite_sheet_manager_from_json(j["sprites"], assets);
            if (!sprites) {
                return GeneratorResult(sprites.error());
            }
            plant->sprites = std::move(*sprites);
        }
    }

    mcv_core::gridgen_logger()->debug("Loaded {} generator for '{}'", generator->kind(), generator->name());
    return GeneratorResult(std::move(generator));
}

Result<std::vector<LoadedGenerator>> generators_from_json(const nlohmann::json& world,
                                                          mcv_scene::SceneGraph& scene,
                                                          mcv_scene::AssetLookup& assets,
                                                          std::optional<std::uint32_t> base_seed) {
    using GeneratorsResult = Result<std::vector<LoadedGenerator>>;

    std::vector<LoadedGenerator> generators;
    auto it = world.find("generators");
    if (it == world.end()) {
        return GeneratorsResult(std::move(generators));
    }
    if (!it->is_array()) {
        return GeneratorsResult(Error(ConfigError::wrong_type("generators", "an array")));
    }

    std::uint32_t stream = 0;
    for (const auto& entry : *it) {
        std::string owner_name;
        if (auto r = mcv_core::read_required(entry, "owner", owner_name); !r) {
            return GeneratorsResult(r.error());
        }
        NodeId owner = scene.find_by_name(owner_name);
        if (!owner) {
            // Generators may name an owner that only exists for them
            owner = scene.create_node(owner_name);
        }

        std::shared_ptr<mcv_core::IRandomSource> rng;
        if (base_seed) {
            rng = std::make_shared<mcv_core::SeededRandom>(mcv_core::derive_seed(*base_seed, stream));
        } else {
            rng = std::make_shared<mcv_core::SeededRandom>();
        }
        ++stream;

        auto generator = generator_from_json(entry, scene, owner, assets, std::move(rng));
        if (!generator) {
            return GeneratorsResult(generator.error().with_context("owner", owner_name));
        }
        generators.push_back(LoadedGenerator{owner_name, std::move(*generator)});
    }
    return GeneratorsResult(std::move(generators));
}

} // namespace mcv_gridgen
