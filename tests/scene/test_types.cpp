// mcv_scene material and renderer tests

#include <catch2/catch_test_macros.hpp>
#include <mcvillage/scene/types.hpp>

using namespace mcv_scene;

TEST_CASE("Material properties", "[scene][material]") {
    Material material("flower");
    material.declare("_WaveSpeed", 1.0f)
        .declare("_Color", Color(1.0f, 0.0f, 0.0f, 1.0f))
        .declare("_MainTex", TextureId{4});

    REQUIRE(material.has_property("_WaveSpeed"));
    REQUIRE_FALSE(material.has_property("_Stage"));
    REQUIRE(material.get_float("_WaveSpeed") == 1.0f);
    REQUIRE(material.get_color("_Color") == Color(1.0f, 0.0f, 0.0f, 1.0f));
    REQUIRE(material.get_texture("_MainTex") == TextureId{4});

    SECTION("typed getters reject other types") {
        REQUIRE_FALSE(material.get_float("_Color").has_value());
        REQUIRE_FALSE(material.get_texture("_WaveSpeed").has_value());
    }
}

TEST_CASE("Renderer property blocks", "[scene][renderer]") {
    auto crop = std::make_shared<Material>("crop");
    crop->declare("_Stage", 0.0f).declare("_WaveSpeed", 1.0f);
    auto stone = std::make_shared<Material>("stone");
    stone->declare("_Color", Color(0.5f));

    Renderer renderer({crop, stone, crop});
    REQUIRE(renderer.slot_count() == 3);
    REQUIRE(renderer.blocks.size() == 3);

    SECTION("declares checks every slot") {
        REQUIRE(renderer.declares("_Stage"));
        REQUIRE(renderer.declares("_Color"));
        REQUIRE_FALSE(renderer.declares("_Reveal_Amount"));
    }

    SECTION("writes only reach declaring slots") {
        REQUIRE(renderer.set_float_on_declaring("_Stage", 2.0f) == 2);
        REQUIRE(renderer.blocks[0].get_float("_Stage") == 2.0f);
        REQUIRE(renderer.blocks[1].empty());
        REQUIRE(renderer.blocks[2].get_float("_Stage") == 2.0f);
        REQUIRE(renderer.set_float_on_declaring("_Missing", 1.0f) == 0);
    }

    SECTION("shared materials are never written") {
        renderer.set_float_on_declaring("_WaveSpeed", 3.5f);
        renderer.set_color_on_declaring("_Color", Color(1.0f));
        REQUIRE(crop->get_float("_WaveSpeed") == 1.0f);
        REQUIRE(stone->get_color("_Color") == Color(0.5f));
    }

    SECTION("effective values prefer the block") {
        REQUIRE(renderer.effective_float(0, "_WaveSpeed") == 1.0f);
        renderer.set_float_on_declaring("_WaveSpeed", 3.5f);
        REQUIRE(renderer.effective_float(0, "_WaveSpeed") == 3.5f);
        REQUIRE(renderer.effective_color(1, "_Color") == Color(0.5f));
        REQUIRE_FALSE(renderer.effective_float(7, "_WaveSpeed").has_value());
    }

    SECTION("sync_blocks follows material slots") {
        renderer.materials.push_back(stone);
        renderer.sync_blocks();
        REQUIRE(renderer.blocks.size() == 4);
    }
}

TEST_CASE("AABB", "[scene][aabb]") {
    AABB box{Vec3(-1.0f), Vec3(1.0f, 2.0f, 1.0f)};
    REQUIRE(box.center() == Vec3(0.0f, 0.5f, 0.0f));
    REQUIRE(box.extents() == Vec3(1.0f, 1.5f, 1.0f));
    REQUIRE(box.contains(Vec3(0.0f, 2.0f, 0.0f)));
    REQUIRE_FALSE(box.contains(Vec3(0.0f, 2.1f, 0.0f)));
    REQUIRE(box.intersects(AABB{Vec3(0.5f), Vec3(3.0f)}));
    REQUIRE_FALSE(box.intersects(AABB{Vec3(5.0f), Vec3(6.0f)}));
}
