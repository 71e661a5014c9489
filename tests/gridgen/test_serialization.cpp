// mcv_gridgen JSON loading tests

#include <catch2/catch_test_macros.hpp>
#include <mcvillage/gridgen/custom_grid_generator.hpp>
#include <mcvillage/gridgen/plant_grid_generator.hpp>
#include <mcvillage/gridgen/serialization.hpp>
#include <mcvillage/scene/assets.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include "support/scripted_random.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace mcv_gridgen;
using mcv_core::ErrorCode;
using nlohmann::json;

// =============================================================================
// Components
// =============================================================================

TEST_CASE("grid_spec_from_json", "[gridgen][serialization]") {
    SECTION("defaults") {
        auto spec = grid_spec_from_json(json::object());
        REQUIRE(spec);
        REQUIRE(spec->size_x == 5);
        REQUIRE(spec->size_z == 5);
        REQUIRE(spec->use_random_seed);
        REQUIRE(spec->seed == 12345);
    }

    SECTION("size array and switches") {
        auto spec = grid_spec_from_json(json::parse(
            R"({"size": [4, 1, 3], "spacing": 2.5, "align_to_center": false,
                "clear_on_generate": false, "use_random_seed": false, "seed": 7})"));
        REQUIRE(spec);
        REQUIRE(spec->size_x == 4);
        REQUIRE(spec->size_y == 1);
        REQUIRE(spec->size_z == 3);
        REQUIRE(spec->spacing == 2.5f);
        REQUIRE_FALSE(spec->align_to_center);
        REQUIRE_FALSE(spec->clear_on_generate);
        REQUIRE_FALSE(spec->use_random_seed);
        REQUIRE(spec->seed == 7);
    }

    SECTION("per-axis keys") {
        auto spec = grid_spec_from_json(json::parse(R"({"size_x": 2, "size_z": 9})"));
        REQUIRE(spec);
        REQUIRE(spec->size_x == 2);
        REQUIRE(spec->size_y == 1);
        REQUIRE(spec->size_z == 9);
    }

    SECTION("malformed size") {
        REQUIRE_FALSE(grid_spec_from_json(json::parse(R"({"size": [4, 1]})")));
        REQUIRE_FALSE(grid_spec_from_json(json::parse(R"({"size": [4, 1.5, 3]})")));
        REQUIRE_FALSE(grid_spec_from_json(json::parse(R"({"spacing": "wide"})")));
        REQUIRE_FALSE(grid_spec_from_json(json::array()));
    }
}

TEST_CASE("transform_randomizer_from_json", "[gridgen][serialization]") {
    auto transform = transform_randomizer_from_json(json::parse(
        R"({"randomize_scale": true, "min_scale": 0.5, "max_scale": [1, 2, 3],
            "randomize_rotation": true, "max_rotation": [0, 90, 0]})"));
    REQUIRE(transform);
    REQUIRE(transform->randomize_scale);
    REQUIRE(transform->min_scale == Vec3(0.5f));
    REQUIRE(transform->max_scale == Vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(transform->min_rotation == Vec3(0.0f));
    REQUIRE(transform->max_rotation == Vec3(0.0f, 90.0f, 0.0f));

    SECTION("rotation does not accept a scalar") {
        REQUIRE_FALSE(transform_randomizer_from_json(json::parse(R"({"max_rotation": 90})")));
    }
}

TEST_CASE("shader_parameters_from_json", "[gridgen][serialization]") {
    auto shader = shader_parameters_from_json(json::parse(
        R"([{"name": "_WaveSpeed", "min": 0.5, "max": 2.0}, {"name": "_Tint", "enabled": false}])"));
    REQUIRE(shader);
    REQUIRE(shader->parameters().size() == 2);
    REQUIRE(shader->parameters()[0].max_value == 2.0f);
    REQUIRE_FALSE(shader->parameters()[1].enabled);
    REQUIRE(shader->parameters()[1].max_value == 1.0f);

    SECTION("errors") {
        REQUIRE_FALSE(shader_parameters_from_json(json::object()));
        REQUIRE_FALSE(shader_parameters_from_json(json::parse(R"([{"min": 0}])")));
        auto reversed = shader_parameters_from_json(json::parse(R"([{"name": "_X", "min": 2, "max": 1}])"));
        REQUIRE_FALSE(reversed);
        REQUIRE(reversed.error().code() == ErrorCode::ParseError);
    }
}

TEST_CASE("sprite_sheet_from_json", "[gridgen][serialization]") {
    mcv_scene::AssetLookup assets;

    SECTION("explicit layout") {
        auto sheet = sprite_sheet_from_json(json::parse(
            R"({"name": "wheat", "texture": "wheat_sheet", "columns": 4, "rows": 2, "prefab_type": "Crop"})"),
            assets);
        REQUIRE(sheet);
        REQUIRE(sheet->frame_count == 8);
        REQUIRE(sheet->prefab_type == PlantPrefabType::Crop);
        REQUIRE(sheet->texture == assets.textures.at("wheat_sheet"));
        REQUIRE_FALSE(sheet->use_color_tint);
    }

    SECTION("layout detected from pixel size") {
        auto sheet = sprite_sheet_from_json(json::parse(R"({"pixel_size": [256, 64], "color_tint": [1, 0, 0, 1]})"),
                                            assets);
        REQUIRE(sheet);
        REQUIRE(sheet->columns == 4);
        REQUIRE(sheet->rows == 1);
        REQUIRE(sheet->frame_count == 4);
        REQUIRE(sheet->use_color_tint);
        REQUIRE(sheet->color_tint == mcv_math::Color(1.0f, 0.0f, 0.0f, 1.0f));
    }

    SECTION("errors") {
        REQUIRE_FALSE(sprite_sheet_from_json(json::parse(R"({"columns": 0})"), assets));
        REQUIRE_FALSE(sprite_sheet_from_json(json::parse(R"({"prefab_type": "Tree"})"), assets));
        REQUIRE_FALSE(sprite_sheet_from_json(json::parse(R"({"pixel_size": [64]})"), assets));
    }
}

TEST_CASE("object_type_from_json", "[gridgen][serialization]") {
    mcv_scene::SceneGraph scene;
    mcv_scene::AssetLookup assets;
    assets.templates["Poppy"] = scene.make_template(scene.create_node("Poppy"));

    auto entry = object_type_from_json(json::parse(
        R"({"name": "Poppy", "template": "Poppy", "spawn_weight": 2, "spawn_probability": 0.25,
            "shader": [{"name": "_WaveSpeed"}], "sprites": {"enabled": false}})"), assets);
    REQUIRE(entry);
    REQUIRE(entry->template_id == assets.templates["Poppy"]);
    REQUIRE(entry->spawn_weight == 2.0f);
    REQUIRE(entry->spawn_probability == 0.25f);
    REQUIRE(entry->uses_spawn_probability());
    REQUIRE(entry->shader.parameters().size() == 1);
    REQUIRE_FALSE(entry->sprites.use_sprite_sheets);

    SECTION("errors") {
        auto unknown = object_type_from_json(json::parse(R"({"name": "Rose", "template": "Rose"})"), assets);
        REQUIRE_FALSE(unknown);
        REQUIRE(unknown.error().code() == ErrorCode::NotFound);

        REQUIRE_FALSE(object_type_from_json(
            json::parse(R"({"name": "Poppy", "template": "Poppy", "spawn_probability": 1.5})"), assets));
        REQUIRE_FALSE(object_type_from_json(
            json::parse(R"({"name": "Poppy", "template": "Poppy", "spawn_weight": -1})"), assets));
        REQUIRE_FALSE(object_type_from_json(json::parse(R"({"name": "", "template": "Poppy"})"), assets));
    }
}

// =============================================================================
// Generators
// =============================================================================

TEST_CASE("generator_from_json", "[gridgen][serialization]") {
    mcv_scene::SceneGraph scene;
    mcv_scene::AssetLookup assets;
    assets.templates["Wheat"] = scene.make_template(scene.create_node("Wheat"));
    assets.templates["Poppy"] = scene.make_template(scene.create_node("Poppy"));
    NodeId owner = scene.create_node("Farm");
    auto rng = std::make_shared<mcv_test::ScriptedRandom>();

    SECTION("base") {
        auto generator = generator_from_json(
            json::parse(R"({"template": "Wheat", "grid": {"size": [2, 1, 2]}})"), scene, owner, assets, rng);
        REQUIRE(generator);
        REQUIRE(std::string((*generator)->kind()) == "base");
        REQUIRE((*generator)->default_template == assets.templates["Wheat"]);
        REQUIRE(&(*generator)->random() == rng.get());

        auto report = (*generator)->generate();
        REQUIRE(report);
        REQUIRE(report->placements.size() == 4);
    }

    SECTION("custom") {
        auto generator = generator_from_json(json::parse(
            R"({"kind": "custom", "types": [{"name": "Poppy", "template": "Poppy"},
                                            {"name": "Wheat", "template": "Wheat", "enabled": false}]})"),
            scene, owner, assets, rng);
        REQUIRE(generator);
        auto* custom = dynamic_cast<CustomGridGenerator*>(generator->get());
        REQUIRE(custom != nullptr);
        REQUIRE(custom->object_types().size() == 2);
        REQUIRE_FALSE(custom->object_types()[1].enabled);
    }

    SECTION("plant") {
        auto generator = generator_from_json(json::parse(
            R"({"kind": "plant", "default_plant_type": "Single",
                "plants": [{"name": "Wheat", "template": "Wheat", "plant_type": "Crop", "spawn_weight": 3}],
                "transform": {"randomize_rotation": true},
                "shader": [{"name": "_WaveSpeed", "min": 0.5, "max": 2.0}],
                "sprites": {"sheets": [{"name": "wheat", "columns": 4, "rows": 2}],
                            "properties": {"stage": "_Growth"}}})"),
            scene, owner, assets, rng);
        REQUIRE(generator);
        auto* plant = dynamic_cast<PlantGridGenerator*>(generator->get());
        REQUIRE(plant != nullptr);
        REQUIRE(plant->default_plant_type == PlantPrefabType::Single);
        REQUIRE(plant->plant_types().size() == 1);
        REQUIRE(plant->plant_types()[0].spawn_weight == 3.0f);
        REQUIRE(plant->transform.randomize_rotation);
        REQUIRE(plant->shader.parameters().size() == 1);
        REQUIRE(plant->sprites.sheets.size() == 1);
        REQUIRE(plant->sprites.properties.stage == "_Growth");
        REQUIRE(plant->sprites.properties.main_texture == "_MainTex");
    }

    SECTION("errors") {
        auto unknown_kind = generator_from_json(json::parse(R"({"kind": "forest"})"), scene, owner, assets, rng);
        REQUIRE_FALSE(unknown_kind);
        REQUIRE(unknown_kind.error().code() == ErrorCode::ParseError);

        auto missing_template = generator_from_json(json::parse(R"({"template": "Oak"})"), scene, owner, assets, rng);
        REQUIRE_FALSE(missing_template);
        REQUIRE(missing_template.error().code() == ErrorCode::NotFound);

        REQUIRE_FALSE(generator_from_json(json::parse(R"({"kind": "custom", "types": {}})"),
                                          scene, owner, assets, rng));
    }
}

// =============================================================================
// World Generators
// =============================================================================

namespace {

const char* kVillageWorld = R"({
  "templates": [
    {"name": "Wheat", "node": {"name": "Wheat"}},
    {"name": "Poppy", "node": {"name": "Poppy"}},
    {"name": "Rose", "node": {"name": "Rose"}}
  ],
  "generators": [
    {"owner": "Farm", "kind": "plant",
     "grid": {"size": [3, 1, 2], "use_random_seed": false, "seed": 7},
     "plants": [{"name": "Wheat", "template": "Wheat", "plant_type": "Crop"}],
     "transform": {"randomize_rotation": true}},
    {"owner": "Garden", "kind": "custom",
     "grid": {"size": [3, 1, 3], "use_random_seed": true},
     "types": [
       {"name": "Poppy", "template": "Poppy", "spawn_weight": 2,
        "transform": {"randomize_scale": true, "min_scale": 0.5, "max_scale": 1.5}},
       {"name": "Rose", "template": "Rose", "spawn_probability": 0.5,
        "transform": {"randomize_rotation": true}}
     ]}
  ]
})";

struct WorldRun {
    mcv_scene::SceneGraph scene;
    mcv_scene::AssetLookup assets;
    std::vector<LoadedGenerator> generators;
    std::vector<GenerationReport> reports;
};

void run_world(WorldRun& run, std::optional<std::uint32_t> seed) {
    auto world = json::parse(kVillageWorld);
    REQUIRE(mcv_scene::load_assets(world, run.scene, run.assets));
    auto generators = generators_from_json(world, run.scene, run.assets, seed);
    REQUIRE(generators);
    run.generators = std::move(*generators);
    for (auto& loaded : run.generators) {
        auto report = loaded.generator->generate();
        REQUIRE(report);
        run.reports.push_back(std::move(*report));
    }
}

} // anonymous namespace

TEST_CASE("generators_from_json", "[gridgen][serialization]") {
    SECTION("owners are found or created") {
        WorldRun run;
        NodeId farm = run.scene.create_node("Farm");
        run_world(run, 42u);
        REQUIRE(run.generators.size() == 2);
        REQUIRE(run.generators[0].owner_name == "Farm");
        REQUIRE(run.generators[0].generator->owner() == farm);
        REQUIRE(run.scene.find_by_name("Garden"));
        REQUIRE(std::string(run.generators[1].generator->kind()) == "custom");
    }

    SECTION("each generator draws from its own source") {
        WorldRun run;
        run_world(run, 42u);
        REQUIRE(&run.generators[0].generator->random() != &run.generators[1].generator->random());
    }

    SECTION("same base seed reproduces every generator") {
        // The farm reseeds from entropy after its fixed-seed pass; the garden
        // that follows must not inherit that entropy.
        WorldRun first;
        WorldRun second;
        run_world(first, 42u);
        run_world(second, 42u);

        REQUIRE(first.reports.size() == second.reports.size());
        for (std::size_t g = 0; g < first.reports.size(); ++g) {
            const auto& a = first.reports[g].placements;
            const auto& b = second.reports[g].placements;
            REQUIRE(a.size() == b.size());
            REQUIRE(first.reports[g].skipped_cells == second.reports[g].skipped_cells);
            for (std::size_t i = 0; i < a.size(); ++i) {
                REQUIRE(a[i].type_name == b[i].type_name);
                REQUIRE(a[i].cell == b[i].cell);
                REQUIRE(a[i].position == b[i].position);
                REQUIRE(a[i].scale == b[i].scale);
                REQUIRE(a[i].rotation == b[i].rotation);
            }
        }
    }

    SECTION("errors") {
        mcv_scene::SceneGraph scene;
        mcv_scene::AssetLookup assets;
        REQUIRE(generators_from_json(json::object(), scene, assets, 1u)->empty());
        REQUIRE_FALSE(generators_from_json(json::parse(R"({"generators": {}})"), scene, assets, 1u));
        REQUIRE_FALSE(generators_from_json(json::parse(R"({"generators": [{"kind": "base"}]})"), scene, assets, 1u));

        auto bad = generators_from_json(json::parse(R"({"generators": [{"owner": "Farm", "kind": "forest"}]})"),
                                        scene, assets, 1u);
        REQUIRE_FALSE(bad);
        REQUIRE(bad.error().code() == ErrorCode::ParseError);
    }
}
