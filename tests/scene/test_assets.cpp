// mcv_scene asset loading tests

#include <catch2/catch_test_macros.hpp>
#include <mcvillage/scene/assets.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <nlohmann/json.hpp>

using namespace mcv_scene;
using nlohmann::json;

namespace {

const char* k_assets = R"({
    "textures": ["wheat_sheet"],
    "materials": [
        {"name": "crop", "properties": {"_Stage": 0, "_MainTex": "wheat_sheet", "_Color": [1, 1, 1]}},
        {"name": "stone"}
    ],
    "templates": [
        {"name": "Wheat", "node": {"name": "Wheat", "renderers": [["crop"]],
                                   "children": [{"name": "Stalk", "renderers": [["crop", "stone"]]}]}}
    ]
})";

} // anonymous namespace

TEST_CASE("AssetLookup", "[scene][assets]") {
    AssetLookup assets;
    TextureId a = assets.add_texture("eye_open");
    TextureId b = assets.add_texture("eye_closed");
    REQUIRE(a);
    REQUIRE(a != b);
    REQUIRE(assets.add_texture("eye_open") == a);
    REQUIRE(assets.texture_name(b) == "eye_closed");
    REQUIRE(assets.texture_name(TextureId{99}).empty());

    auto missing = assets.find_template("Wheat", "template");
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().code() == mcv_core::ErrorCode::NotFound);
    REQUIRE(assets.find_texture("eye_open", "texture").value() == a);
}

TEST_CASE("load_assets", "[scene][assets]") {
    SceneGraph scene;
    AssetLookup assets;

    REQUIRE(load_assets(json::parse(k_assets), scene, assets));
    REQUIRE(assets.textures.size() == 1);
    REQUIRE(assets.materials.size() == 2);
    REQUIRE(assets.templates.size() == 1);

    auto crop = assets.find_material("crop", "material").value();
    REQUIRE(crop->get_float("_Stage") == 0.0f);
    REQUIRE(crop->get_texture("_MainTex") == assets.textures["wheat_sheet"]);
    REQUIRE(crop->get_color("_Color") == Color(1.0f));

    TemplateId wheat = assets.templates["Wheat"];
    REQUIRE(scene.is_valid_template(wheat));
    NodeId instance = scene.instantiate(wheat);
    REQUIRE(scene.collect_renderers(instance).size() == 2);

    SECTION("templates stay out of name lookups") {
        REQUIRE(scene.find_by_name("Wheat") == instance);
    }
}

TEST_CASE("load_assets errors", "[scene][assets]") {
    SceneGraph scene;
    AssetLookup assets;

    SECTION("unknown material in a renderer") {
        auto r = load_assets(json::parse(R"({"templates": [{"name": "X", "node": {"renderers": [["nope"]]}}]})"),
                             scene, assets);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code() == mcv_core::ErrorCode::NotFound);
        // The partial subtree is removed
        REQUIRE(scene.node_count() == 0);
    }

    SECTION("template without node") {
        auto r = load_assets(json::parse(R"({"templates": [{"name": "X"}]})"), scene, assets);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code() == mcv_core::ErrorCode::ParseError);
    }

    SECTION("bad property value") {
        auto r = load_assets(json::parse(R"({"materials": [{"name": "m", "properties": {"_Flag": true}}]})"),
                             scene, assets);
        REQUIRE_FALSE(r);
    }
}

TEST_CASE("node_from_json", "[scene][assets]") {
    SceneGraph scene;
    AssetLookup assets;
    REQUIRE(load_assets(json::parse(k_assets), scene, assets));

    auto chest = node_from_json(json::parse(R"({
        "name": "ChestA", "tag": "teleChest", "transform": {"position": [4, 0, 0]},
        "children": [
            {"name": "TeleportVolume", "volume": {"shape": "sphere", "radius": 0.75}},
            {"name": "TeleportTarget", "transform": {"position": [0, 0, 2]}}
        ]
    })"), scene, assets);

    REQUIRE(chest);
    REQUIRE(scene.tag(*chest) == "teleChest");
    REQUIRE(scene.children(*chest).size() == 2);

    NodeId target = scene.find_child(*chest, "TeleportTarget");
    REQUIRE(scene.world_position(target) == Vec3(4.0f, 0.0f, 2.0f));

    NodeId volume = scene.find_child(*chest, "TeleportVolume");
    REQUIRE(scene.volume(volume) != nullptr);
    REQUIRE(scene.volume_contains(volume, Vec3(4.5f, 0.0f, 0.0f)));
}
