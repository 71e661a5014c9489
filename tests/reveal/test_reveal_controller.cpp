// mcv_reveal MaterialRevealController tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <mcvillage/reveal/reveal_controller.hpp>
#include <mcvillage/reveal/serialization.hpp>
#include <mcvillage/scene/scene_graph.hpp>
#include <mcvillage/scene/types.hpp>

#include <nlohmann/json.hpp>

#include <memory>

using namespace mcv_reveal;
using Catch::Matchers::WithinAbs;
using mcv_sequence::EaseType;

namespace {

constexpr TextureId k_eye_closed{1};
constexpr TextureId k_eye_open{2};
constexpr TextureId k_glow_off{3};
constexpr TextureId k_glow_on{4};

struct RevealHarness {
    mcv_scene::SceneGraph scene;
    std::shared_ptr<mcv_scene::Material> reveal_material = std::make_shared<mcv_scene::Material>("chest_reveal");
    std::shared_ptr<mcv_scene::Material> wood = std::make_shared<mcv_scene::Material>("wood");
    NodeId root;
    NodeId lid;

    RevealHarness() {
        reveal_material->declare("_Reveal_Amount", 0.5f)
            .declare("_enderEyeTexture", TextureId{})
            .declare("_enderEyeEmissive", TextureId{});
        wood->declare("_Color", mcv_math::color::WHITE);

        root = scene.create_node("Chest");
        lid = scene.create_node("Lid", root);
        scene.add_renderer(root, mcv_scene::Renderer({wood}));
        scene.add_renderer(lid, mcv_scene::Renderer({reveal_material, wood}));
    }

    static RevealSettings linear_settings() {
        RevealSettings settings;
        settings.curve = EaseType::Linear;
        settings.duration = 1.0f;
        settings.eye_textures = {k_eye_closed, k_eye_open};
        settings.eye_emissives = {k_glow_off, k_glow_on};
        return settings;
    }

    [[nodiscard]] const mcv_scene::PropertyBlock& lid_block() const { return scene.renderers(lid)[0].blocks[0]; }
};

} // anonymous namespace

// =============================================================================
// Start
// =============================================================================

TEST_CASE("MaterialRevealController start", "[reveal][controller]") {
    RevealHarness h;
    MaterialRevealController controller(h.scene, h.root, RevealHarness::linear_settings());
    REQUIRE(controller.renderer_count() == 1);

    controller.start();

    SECTION("initial value is clamped into range") {
        REQUIRE(controller.reveal_value() == 0.0f);
        REQUIRE(h.lid_block().get_float("_Reveal_Amount") == 0.0f);
        REQUIRE_FALSE(controller.is_playing());
    }

    SECTION("initial eye textures are applied") {
        REQUIRE(h.lid_block().get_texture("_enderEyeTexture") == k_eye_closed);
        REQUIRE(h.lid_block().get_texture("_enderEyeEmissive") == k_glow_off);
        REQUIRE(controller.eye_texture_index() == 0);
    }

    SECTION("undeclaring slots and shared materials are untouched") {
        REQUIRE(h.scene.renderers(h.root)[0].blocks[0].empty());
        REQUIRE(h.scene.renderers(h.lid)[0].blocks[1].empty());
        REQUIRE(h.reveal_material->get_float("_Reveal_Amount") == 0.5f);
    }
}

TEST_CASE("MaterialRevealController play_on_start", "[reveal][controller]") {
    RevealHarness h;
    auto settings = RevealHarness::linear_settings();
    settings.play_on_start = true;
    MaterialRevealController controller(h.scene, h.root, settings);

    controller.start();
    REQUIRE(controller.is_playing());
    controller.tick(1.0f);
    REQUIRE(controller.reveal_value() == 1.0f);
}

// =============================================================================
// Reveal and Hide
// =============================================================================

TEST_CASE("MaterialRevealController reveal", "[reveal][controller]") {
    RevealHarness h;
    MaterialRevealController controller(h.scene, h.root, RevealHarness::linear_settings());
    controller.start();

    SECTION("reaches one after the duration and toggles eyes once") {
        controller.play_reveal();
        controller.tick(0.25f);
        REQUIRE_THAT(controller.reveal_value(), WithinAbs(0.25f, 1e-6f));
        REQUIRE(controller.eye_texture_index() == 0);

        controller.tick(0.75f);
        REQUIRE(controller.reveal_value() == 1.0f);
        REQUIRE(h.lid_block().get_float("_Reveal_Amount") == 1.0f);
        REQUIRE_FALSE(controller.is_playing());
        REQUIRE(controller.eye_texture_index() == 1);
        REQUIRE(controller.eye_emissive_index() == 1);
        REQUIRE(h.lid_block().get_texture("_enderEyeTexture") == k_eye_open);
        REQUIRE(h.lid_block().get_texture("_enderEyeEmissive") == k_glow_on);

        controller.tick(1.0f);
        REQUIRE(controller.eye_texture_index() == 1);
    }

    SECTION("resumes from the current value over the remaining time") {
        controller.set_reveal_value(0.5f);
        controller.play_reveal();
        controller.tick(0.25f);
        REQUIRE_THAT(controller.reveal_value(), WithinAbs(0.75f, 1e-6f));
        controller.tick(0.25f);
        REQUIRE(controller.reveal_value() == 1.0f);
        REQUIRE_FALSE(controller.is_playing());
    }

    SECTION("from start resets to zero first") {
        controller.set_reveal_value(0.8f);
        controller.play_reveal_from_start();
        REQUIRE(controller.reveal_value() == 0.0f);
        controller.tick(0.5f);
        REQUIRE_THAT(controller.reveal_value(), WithinAbs(0.5f, 1e-6f));
    }

    SECTION("curve shapes the progress") {
        auto settings = RevealHarness::linear_settings();
        settings.curve = EaseType::EaseInOut;
        MaterialRevealController eased(h.scene, h.root, settings);
        eased.start();
        eased.play_reveal();
        eased.tick(0.25f);
        REQUIRE_THAT(eased.reveal_value(), WithinAbs(0.125f, 1e-6f));
    }

    SECTION("stop keeps the current value and skips completion") {
        controller.play_reveal();
        controller.tick(0.5f);
        controller.stop();
        controller.tick(1.0f);
        REQUIRE_THAT(controller.reveal_value(), WithinAbs(0.5f, 1e-6f));
        REQUIRE(controller.eye_texture_index() == 0);
    }

    SECTION("auto toggle can be disabled") {
        auto settings = RevealHarness::linear_settings();
        settings.auto_toggle_on_complete = false;
        MaterialRevealController quiet(h.scene, h.root, settings);
        quiet.start();
        quiet.play_reveal();
        quiet.tick(1.0f);
        REQUIRE(quiet.reveal_value() == 1.0f);
        REQUIRE(quiet.eye_texture_index() == 0);
    }

    SECTION("zero duration completes on the next tick") {
        auto settings = RevealHarness::linear_settings();
        settings.duration = 0.0f;
        MaterialRevealController instant(h.scene, h.root, settings);
        instant.start();
        instant.play_reveal();
        instant.tick(0.0f);
        REQUIRE(instant.reveal_value() == 1.0f);
        REQUIRE(instant.eye_texture_index() == 1);
    }
}

TEST_CASE("MaterialRevealController hide", "[reveal][controller]") {
    RevealHarness h;
    MaterialRevealController controller(h.scene, h.root, RevealHarness::linear_settings());
    controller.start();
    controller.play_reveal();
    controller.tick(1.0f);
    REQUIRE(controller.eye_texture_index() == 1);

    SECTION("restores original textures and animates to zero") {
        controller.play_hide();
        REQUIRE(controller.eye_texture_index() == 0);
        REQUIRE(h.lid_block().get_texture("_enderEyeTexture") == k_eye_closed);

        controller.tick(0.5f);
        REQUIRE_THAT(controller.reveal_value(), WithinAbs(0.5f, 1e-6f));
        controller.tick(0.5f);
        REQUIRE(controller.reveal_value() == 0.0f);
        REQUIRE_FALSE(controller.is_playing());
    }

    SECTION("starting a reveal cancels a running hide") {
        controller.play_hide();
        controller.tick(0.5f);
        controller.play_reveal();
        controller.tick(0.25f);
        REQUIRE_THAT(controller.reveal_value(), WithinAbs(0.75f, 1e-6f));
        controller.tick(0.25f);
        REQUIRE(controller.reveal_value() == 1.0f);
        REQUIRE(controller.eye_texture_index() == 1);
    }

    SECTION("hide without auto toggle keeps the revealed eyes") {
        auto settings = RevealHarness::linear_settings();
        settings.auto_toggle_on_hide = false;
        MaterialRevealController keep(h.scene, h.root, settings);
        keep.start();
        keep.toggle_eye_texture_and_emissive();
        keep.play_hide();
        REQUIRE(keep.eye_texture_index() == 1);
    }
}

// =============================================================================
// Eye Textures
// =============================================================================

TEST_CASE("MaterialRevealController eye textures", "[reveal][controller]") {
    RevealHarness h;

    SECTION("toggle and set") {
        MaterialRevealController controller(h.scene, h.root, RevealHarness::linear_settings());
        controller.start();

        controller.toggle_eye_emissive();
        REQUIRE(controller.eye_emissive_index() == 1);
        REQUIRE(controller.eye_texture_index() == 0);

        controller.set_eye_texture_and_emissive(0);
        REQUIRE(controller.eye_emissive_index() == 0);

        // Out of range indices are clamped
        controller.set_eye_texture(7);
        REQUIRE(controller.eye_texture_index() == 1);
        REQUIRE(h.lid_block().get_texture("_enderEyeTexture") == k_eye_open);
    }

    SECTION("unassigned textures are skipped") {
        auto settings = RevealHarness::linear_settings();
        settings.eye_textures.second = TextureId{};
        MaterialRevealController controller(h.scene, h.root, settings);
        controller.start();

        controller.toggle_eye_texture();
        REQUIRE(controller.eye_texture_index() == 0);
        REQUIRE(h.lid_block().get_texture("_enderEyeTexture") == k_eye_closed);
    }

    SECTION("configured starting index becomes the original") {
        auto settings = RevealHarness::linear_settings();
        settings.eye_texture_index = 1;
        MaterialRevealController controller(h.scene, h.root, settings);
        controller.start();
        controller.set_eye_texture(0);
        controller.reset_to_original_textures();
        REQUIRE(controller.eye_texture_index() == 1);
    }
}

// =============================================================================
// Serialization
// =============================================================================

TEST_CASE("reveal_settings_from_json", "[reveal][serialization]") {
    mcv_scene::AssetLookup assets;

    SECTION("parses names and textures") {
        auto settings = reveal_settings_from_json(nlohmann::json::parse(
            R"({"duration": 2.0, "curve": "bounce", "play_on_start": true,
                "eye_textures": ["eye_closed", "eye_open"], "eye_emissives": ["glow_off", "glow_on"]})"), assets);
        REQUIRE(settings);
        REQUIRE(settings->duration == 2.0f);
        REQUIRE(settings->curve == EaseType::Bounce);
        REQUIRE(settings->play_on_start);
        REQUIRE(settings->eye_textures.second == assets.textures.at("eye_open"));
        REQUIRE(settings->eye_emissives.first == assets.textures.at("glow_off"));
        REQUIRE(settings->reveal_property == "_Reveal_Amount");
    }

    SECTION("ease names round trip") {
        for (EaseType type : {EaseType::Linear, EaseType::EaseIn, EaseType::EaseOut, EaseType::EaseInOut,
                              EaseType::SmoothStep, EaseType::Bounce}) {
            REQUIRE(parse_ease_type(mcv_sequence::ease_type_name(type)) == type);
        }
        REQUIRE_FALSE(parse_ease_type("elastic").has_value());
    }

    SECTION("errors") {
        REQUIRE_FALSE(reveal_settings_from_json(nlohmann::json::parse(R"({"curve": "elastic"})"), assets));
        REQUIRE_FALSE(reveal_settings_from_json(nlohmann::json::parse(R"({"duration": -1})"), assets));
        REQUIRE_FALSE(reveal_settings_from_json(nlohmann::json::parse(R"({"eye_textures": ["a"]})"), assets));
    }
}
