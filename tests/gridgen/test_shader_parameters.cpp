// mcv_gridgen ShaderParameterManager tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <mcvillage/gridgen/shader_parameters.hpp>
#include <mcvillage/scene/scene_graph.hpp>
#include <mcvillage/scene/types.hpp>

#include "support/scripted_random.hpp"

#include <memory>

using namespace mcv_gridgen;
using Catch::Matchers::WithinAbs;

namespace {

std::shared_ptr<mcv_scene::Material> make_crop_material() {
    auto material = std::make_shared<mcv_scene::Material>("crop");
    material->declare("_Stage", 0.0f).declare("_WaveSpeed", 1.0f);
    return material;
}

} // anonymous namespace

TEST_CASE("ShaderParameterManager defaults", "[gridgen][shader]") {
    auto params = ShaderParameterManager::default_parameters();
    REQUIRE(params.size() == 2);
    REQUIRE(params[0].name == "_Stage");
    REQUIRE(params[0].min_value == 0.0f);
    REQUIRE(params[0].max_value == 1.0f);
    REQUIRE(params[1].name == "_WaveSpeed");
    REQUIRE(params[1].min_value == 0.5f);
    REQUIRE(params[1].max_value == 2.0f);
    REQUIRE(params[1].enabled);
}

TEST_CASE("ShaderParameterManager randomize", "[gridgen][shader]") {
    mcv_scene::SceneGraph scene;
    auto crop = make_crop_material();
    auto stone = std::make_shared<mcv_scene::Material>("stone");
    stone->declare("_Color", mcv_math::color::WHITE);

    NodeId root = scene.create_node("Wheat");
    NodeId stalk = scene.create_node("Stalk", root);
    scene.add_renderer(root, mcv_scene::Renderer({crop, stone}));
    scene.add_renderer(stalk, mcv_scene::Renderer({crop}));

    ShaderParameterManager manager(ShaderParameterManager::default_parameters());

    SECTION("writes only declaring slots") {
        mcv_test::ScriptedRandom rng({0.5f, 0.0f});
        std::size_t writes = manager.randomize(scene, root, rng);

        REQUIRE(rng.draws() == 2);
        REQUIRE(writes == 4);

        const auto& root_renderer = scene.renderers(root)[0];
        REQUIRE(root_renderer.blocks[0].get_float("_Stage") == 0.5f);
        REQUIRE(root_renderer.blocks[0].get_float("_WaveSpeed") == 0.5f);
        REQUIRE(root_renderer.blocks[1].empty());

        const auto& stalk_renderer = scene.renderers(stalk)[0];
        REQUIRE(stalk_renderer.blocks[0].get_float("_Stage") == 0.5f);
    }

    SECTION("shared materials are never mutated") {
        mcv_test::ScriptedRandom rng({0.75f});
        manager.randomize(scene, root, rng);
        REQUIRE(crop->get_float("_Stage") == 0.0f);
        REQUIRE(crop->get_float("_WaveSpeed") == 1.0f);
        REQUIRE(scene.renderers(root)[0].effective_float(0, "_Stage") == 0.75f);
    }

    SECTION("skip property is neither drawn nor written") {
        mcv_test::ScriptedRandom rng({0.5f});
        std::size_t writes = manager.randomize(scene, root, rng, "_Stage");
        REQUIRE(rng.draws() == 1);
        REQUIRE(writes == 2);
        REQUIRE_FALSE(scene.renderers(root)[0].blocks[0].has("_Stage"));
        REQUIRE_THAT(*scene.renderers(root)[0].blocks[0].get_float("_WaveSpeed"), WithinAbs(1.25f, 1e-5f));
    }

    SECTION("disabled parameters are skipped") {
        manager.parameters()[0].enabled = false;
        mcv_test::ScriptedRandom rng({0.0f});
        manager.randomize(scene, root, rng);
        REQUIRE(rng.draws() == 1);
        REQUIRE_FALSE(scene.renderers(root)[0].blocks[0].has("_Stage"));
    }

    SECTION("undeclared parameter still consumes a draw") {
        manager.add_parameter(ShaderFloatParameter("_Missing", 0.0f, 1.0f));
        mcv_test::ScriptedRandom rng({0.5f});
        std::size_t writes = manager.randomize(scene, root, rng);
        REQUIRE(rng.draws() == 3);
        REQUIRE(writes == 4);
    }
}

TEST_CASE("ShaderParameterManager without renderers", "[gridgen][shader]") {
    mcv_scene::SceneGraph scene;
    NodeId empty = scene.create_node("Empty");

    ShaderParameterManager manager(ShaderParameterManager::default_parameters());
    mcv_test::ScriptedRandom rng({0.5f});

    REQUIRE(manager.randomize(scene, empty, rng) == 0);
    REQUIRE(rng.draws() == 0);
}
