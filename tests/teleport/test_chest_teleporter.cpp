// mcv_teleport ChestTeleporter tests

#include <catch2/catch_test_macros.hpp>
#include <mcvillage/teleport/chest_teleporter.hpp>
#include <mcvillage/teleport/lockout_table.hpp>

#include "support/chest_fixture.hpp"
#include "support/scripted_random.hpp"

#include <memory>

using namespace mcv_teleport;
using mcv_core::ErrorCode;
using mcv_test::exact_teleport_config;
using mcv_test::make_chest;
using mcv_test::make_player;

namespace {

struct ChestHarness {
    mcv_scene::SceneGraph scene;
    LockoutTable lockouts;
    TeleportConfig config = exact_teleport_config();
    std::shared_ptr<mcv_test::ScriptedRandom> rng = std::make_shared<mcv_test::ScriptedRandom>();

    std::unique_ptr<ChestTeleporter> make(NodeId chest, std::shared_ptr<RecordingChestAnimator> animator) {
        return std::make_unique<ChestTeleporter>(scene, chest, lockouts, config, std::move(animator), rng);
    }
};

void advance(ChestTeleporter& chest, int ticks) {
    for (int i = 0; i < ticks; ++i) {
        chest.on_tick(0.25f);
    }
}

} // anonymous namespace

// =============================================================================
// Setup
// =============================================================================

TEST_CASE("ChestTeleporter setup", "[teleport][chest]") {
    ChestHarness h;

    SECTION("resolves named children") {
        NodeId chest = make_chest(h.scene, "ChestA", Vec3(0.0f));
        auto animator = std::make_shared<RecordingChestAnimator>();
        auto teleporter = h.make(chest, animator);

        REQUIRE(teleporter->setup());
        REQUIRE(h.scene.name(teleporter->teleport_volume()) == "TeleportVolume");
        REQUIRE(h.scene.name(teleporter->detect_volume()) == "PlayerDetectVolume");
        REQUIRE(teleporter->teleport_target() == h.scene.find_child(chest, "TeleportTarget"));
        REQUIRE(animator->history() == std::vector<AnimationIntent>{AnimationIntent::Close});
        REQUIRE(teleporter->state() == ChestState::Closed);
        REQUIRE(teleporter->can_teleport());
    }

    SECTION("synthesizes missing volumes and target") {
        NodeId chest = h.scene.create_node("Bare");
        NodeId volume = h.scene.create_node("TeleportVolume", chest);
        NodeId detect = h.scene.create_node("PlayerDetectVolume", chest);
        auto teleporter = h.make(chest, nullptr);

        REQUIRE(teleporter->setup());
        REQUIRE(h.scene.volume(volume) != nullptr);
        REQUIRE(h.scene.volume(detect) != nullptr);
        REQUIRE(h.scene.volume_contains(detect, Vec3(1.4f, 0.9f, 1.4f)));
        REQUIRE_FALSE(h.scene.volume_contains(detect, Vec3(1.6f, 0.0f, 0.0f)));

        NodeId target = teleporter->teleport_target();
        REQUIRE(target);
        REQUIRE(h.scene.parent(target) == chest);
        REQUIRE(h.scene.world_position(target) == Vec3(0.0f, 0.0f, 2.0f));
    }

    SECTION("descendant names are matched by fragment") {
        NodeId chest = h.scene.create_node("Nested");
        NodeId lid = h.scene.create_node("Lid", chest);
        NodeId volume = h.scene.create_node("Chest_TeleportVolume_01", lid);
        NodeId target = h.scene.create_node("TeleportTarget_Front", lid);
        auto teleporter = h.make(chest, nullptr);

        REQUIRE(teleporter->setup());
        REQUIRE(teleporter->teleport_volume() == volume);
        REQUIRE(teleporter->teleport_target() == target);
        // The detect volume must be a direct child
        REQUIRE_FALSE(teleporter->detect_volume());
    }

    SECTION("chest volume doubles as the teleport volume") {
        NodeId chest = h.scene.create_node("Crate");
        h.scene.set_volume(chest, mcv_scene::VolumeFactory::create_sphere(Vec3(0.0f), 1.0f));
        auto teleporter = h.make(chest, nullptr);

        REQUIRE(teleporter->setup());
        REQUIRE(teleporter->teleport_volume() == chest);
    }

    SECTION("no teleport volume at all") {
        NodeId chest = h.scene.create_node("Display");
        auto teleporter = h.make(chest, nullptr);

        auto result = teleporter->setup();
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::NotFound);
        REQUIRE(teleporter->teleport_target());
    }
}

// =============================================================================
// Door
// =============================================================================

TEST_CASE("ChestTeleporter door and reopen cooldown", "[teleport][chest]") {
    ChestHarness h;
    NodeId chest = make_chest(h.scene, "ChestA", Vec3(0.0f));
    NodeId player = make_player(h.scene, Vec3(0.0f));
    NodeId villager = make_player(h.scene, Vec3(1.0f, 0.0f, 0.0f));

    auto animator = std::make_shared<RecordingChestAnimator>();
    auto teleporter = h.make(chest, animator);
    REQUIRE(teleporter->setup());

    teleporter->on_volume_enter(VolumeKind::PlayerDetect, player);
    REQUIRE(teleporter->is_door_open());
    REQUIRE(teleporter->state() == ChestState::Open);
    REQUIRE(animator->is_open());

    SECTION("last actor leaving closes the door") {
        teleporter->on_volume_enter(VolumeKind::PlayerDetect, villager);
        teleporter->on_volume_exit(VolumeKind::PlayerDetect, player);
        REQUIRE(teleporter->is_door_open());

        teleporter->on_volume_exit(VolumeKind::PlayerDetect, villager);
        REQUIRE_FALSE(teleporter->is_door_open());
        REQUIRE(teleporter->state() == ChestState::CooldownClosed);
    }

    SECTION("reopens when the cooldown ends with an actor in range") {
        teleporter->on_volume_exit(VolumeKind::PlayerDetect, player);
        teleporter->on_volume_enter(VolumeKind::PlayerDetect, player);
        REQUIRE_FALSE(teleporter->is_door_open());

        advance(*teleporter, 5);
        REQUIRE(teleporter->is_on_cooldown());
        REQUIRE_FALSE(teleporter->is_door_open());

        advance(*teleporter, 1);
        REQUIRE_FALSE(teleporter->is_on_cooldown());
        REQUIRE(teleporter->is_door_open());
        REQUIRE(animator->count(AnimationIntent::Open) == 2);
    }

    SECTION("stays closed when nobody is in range") {
        teleporter->on_volume_exit(VolumeKind::PlayerDetect, player);
        advance(*teleporter, 6);
        REQUIRE_FALSE(teleporter->is_on_cooldown());
        REQUIRE(teleporter->state() == ChestState::Closed);
    }

    SECTION("closing again restarts the cooldown") {
        teleporter->on_volume_exit(VolumeKind::PlayerDetect, player);
        advance(*teleporter, 4);
        teleporter->close_chest();
        advance(*teleporter, 4);
        REQUIRE(teleporter->is_on_cooldown());
        advance(*teleporter, 2);
        REQUIRE_FALSE(teleporter->is_on_cooldown());
    }

    SECTION("teleport volume events never touch the door directly") {
        teleporter->on_volume_exit(VolumeKind::Teleport, player);
        REQUIRE(teleporter->is_door_open());
    }
}

TEST_CASE("ChestTeleporter without animator", "[teleport][chest]") {
    ChestHarness h;
    NodeId chest = make_chest(h.scene, "ChestA", Vec3(0.0f));
    NodeId player = make_player(h.scene, Vec3(0.0f));
    auto teleporter = h.make(chest, nullptr);
    REQUIRE(teleporter->setup());

    teleporter->on_volume_enter(VolumeKind::PlayerDetect, player);
    REQUIRE_FALSE(teleporter->is_door_open());
    teleporter->on_volume_exit(VolumeKind::PlayerDetect, player);
    REQUIRE_FALSE(teleporter->is_on_cooldown());
}

// =============================================================================
// Transfer
// =============================================================================

TEST_CASE("ChestTeleporter transfer", "[teleport][chest]") {
    ChestHarness h;
    NodeId a = make_chest(h.scene, "ChestA", Vec3(0.0f));
    NodeId b = make_chest(h.scene, "ChestB", Vec3(10.0f, 0.0f, 0.0f));
    NodeId player = make_player(h.scene, Vec3(0.0f));

    auto animator = std::make_shared<RecordingChestAnimator>();
    auto teleporter = h.make(a, animator);
    REQUIRE(teleporter->setup());

    int outcomes = 0;
    teleporter->set_outcome_callback([&outcomes](const TeleportOutcome&) { ++outcomes; });

    teleporter->on_volume_enter(VolumeKind::PlayerDetect, player);
    teleporter->on_volume_enter(VolumeKind::Teleport, player);
    REQUIRE(teleporter->state() == ChestState::Teleporting);
    REQUIRE_FALSE(teleporter->can_teleport());

    SECTION("full sequence") {
        advance(*teleporter, 1);
        REQUIRE(teleporter->is_door_open());
        REQUIRE(h.rng->draws() == 0);

        // Destination chosen and door closed after the delay
        advance(*teleporter, 1);
        REQUIRE(h.rng->draws() == 1);
        REQUIRE_FALSE(teleporter->is_door_open());
        REQUIRE(teleporter->is_on_cooldown());
        REQUIRE(h.scene.world_position(player) == Vec3(0.0f));

        // Relocation after the settle delay
        advance(*teleporter, 1);
        REQUIRE(h.scene.world_position(player) == Vec3(10.0f, 0.0f, 2.0f));
        REQUIRE(h.lockouts.remaining(b) == 5.0f);
        REQUIRE_FALSE(h.lockouts.is_locked(a));
        REQUIRE(outcomes == 1);

        const auto& outcome = teleporter->last_outcome();
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.source == a);
        REQUIRE(outcome.destination == b);
        REQUIRE(outcome.actor == player);
        REQUIRE(outcome.arrival == Vec3(10.0f, 0.0f, 2.0f));
        REQUIRE(teleporter->is_teleporting());

        // Re-entering during the post cooldown does nothing
        teleporter->on_volume_enter(VolumeKind::Teleport, player);
        REQUIRE(outcomes == 1);

        advance(*teleporter, 7);
        REQUIRE(teleporter->is_teleporting());
        advance(*teleporter, 1);
        REQUIRE_FALSE(teleporter->is_teleporting());
        REQUIRE(teleporter->can_teleport());
    }

    SECTION("door stays shut while the actor is still in range during the transfer") {
        advance(*teleporter, 2);
        // Reopen cooldown ends mid-transfer without opening
        advance(*teleporter, 6);
        REQUIRE_FALSE(teleporter->is_on_cooldown());
        REQUIRE_FALSE(teleporter->is_door_open());
        REQUIRE(animator->count(AnimationIntent::Open) == 1);
    }

    SECTION("destination vanishing before relocation") {
        advance(*teleporter, 2);
        h.scene.destroy(b);
        advance(*teleporter, 1);

        REQUIRE(teleporter->last_outcome().result == TeleportResult::MissingTarget);
        REQUIRE(teleporter->last_outcome().error.has_value());
        REQUIRE(h.scene.world_position(player) == Vec3(0.0f));
        REQUIRE_FALSE(teleporter->is_teleporting());
        REQUIRE(teleporter->can_teleport());
        REQUIRE(outcomes == 1);
    }

    SECTION("actor destroyed before relocation") {
        advance(*teleporter, 2);
        h.scene.destroy(player);
        advance(*teleporter, 1);
        REQUIRE(teleporter->last_outcome().result == TeleportResult::NoActor);
        REQUIRE(teleporter->last_outcome().error->code() == ErrorCode::NoActor);
    }

    SECTION("reset cancels the transfer") {
        advance(*teleporter, 2);
        teleporter->reset();
        REQUIRE_FALSE(teleporter->is_teleporting());
        REQUIRE_FALSE(teleporter->is_on_cooldown());
        REQUIRE(teleporter->can_teleport());
        // Actor still in range, so the door matches
        REQUIRE(teleporter->is_door_open());

        advance(*teleporter, 8);
        REQUIRE(h.scene.world_position(player) == Vec3(0.0f));
        REQUIRE(outcomes == 0);
    }
}

TEST_CASE("ChestTeleporter actor controller", "[teleport][chest]") {
    ChestHarness h;
    NodeId a = make_chest(h.scene, "ChestA", Vec3(0.0f));
    make_chest(h.scene, "ChestB", Vec3(10.0f, 0.0f, 0.0f));
    NodeId player = make_player(h.scene, Vec3(0.0f));
    NodeId controller = h.scene.create_node("Controller", player);

    auto teleporter = h.make(a, nullptr);
    REQUIRE(teleporter->setup());

    teleporter->on_volume_enter(VolumeKind::Teleport, player);
    advance(*teleporter, 3);

    REQUIRE(teleporter->last_outcome().actor == controller);
    REQUIRE(h.scene.world_position(controller) == Vec3(10.0f, 0.0f, 2.0f));
    // The tagged root travels with its controller
    REQUIRE(h.scene.world_position(player) == Vec3(10.0f, 0.0f, 2.0f));
}

TEST_CASE("ChestTeleporter controller offset", "[teleport][chest]") {
    ChestHarness h;
    NodeId a = make_chest(h.scene, "ChestA", Vec3(0.0f));
    make_chest(h.scene, "ChestB", Vec3(10.0f, 0.0f, 0.0f));
    NodeId player = make_player(h.scene, Vec3(0.0f));
    NodeId body = h.scene.create_node("Body", player);
    NodeId controller = h.scene.create_node("PlayerController", body);
    h.scene.set_local_position(controller, Vec3(0.0f, 1.0f, 0.0f));

    auto teleporter = h.make(a, nullptr);
    REQUIRE(teleporter->setup());

    teleporter->on_volume_enter(VolumeKind::Teleport, player);
    advance(*teleporter, 3);

    REQUIRE(teleporter->last_outcome().succeeded());
    REQUIRE(teleporter->last_outcome().actor == controller);
    REQUIRE(mcv_math::approx_equal(h.scene.world_position(controller), Vec3(10.0f, 0.0f, 2.0f)));
    REQUIRE(mcv_math::approx_equal(h.scene.world_position(player), Vec3(10.0f, -1.0f, 2.0f)));
    REQUIRE(h.scene.parent(controller) == body);
}

TEST_CASE("ChestTeleporter refusals", "[teleport][chest]") {
    ChestHarness h;
    NodeId a = make_chest(h.scene, "ChestA", Vec3(0.0f));
    NodeId player = make_player(h.scene, Vec3(0.0f));

    SECTION("no destination aborts") {
        auto teleporter = h.make(a, nullptr);
        REQUIRE(teleporter->setup());
        teleporter->on_volume_enter(VolumeKind::Teleport, player);
        advance(*teleporter, 2);

        const auto& outcome = teleporter->last_outcome();
        REQUIRE(outcome.result == TeleportResult::NoDestination);
        REQUIRE(outcome.error->code() == ErrorCode::NoDestination);
        REQUIRE(h.rng->draws() == 0);
        REQUIRE(teleporter->can_teleport());
        REQUIRE_FALSE(teleporter->is_teleporting());
        REQUIRE(h.lockouts.empty());
    }

    SECTION("locked out chest ignores the teleport volume") {
        make_chest(h.scene, "ChestB", Vec3(10.0f, 0.0f, 0.0f));
        auto teleporter = h.make(a, nullptr);
        REQUIRE(teleporter->setup());

        h.lockouts.lock(a, 5.0f);
        REQUIRE(teleporter->is_locked_out());
        teleporter->on_volume_enter(VolumeKind::Teleport, player);
        REQUIRE_FALSE(teleporter->is_teleporting());

        h.lockouts.unlock(a);
        teleporter->on_volume_enter(VolumeKind::Teleport, player);
        REQUIRE(teleporter->is_teleporting());
    }
}

TEST_CASE("ChestTeleporter eligible destinations", "[teleport][chest]") {
    ChestHarness h;
    NodeId outer = make_chest(h.scene, "Outer", Vec3(-10.0f, 0.0f, 0.0f));
    NodeId a = make_chest(h.scene, "ChestA", Vec3(0.0f), outer);
    make_chest(h.scene, "Inner", Vec3(1.0f, 0.0f, 0.0f), a);
    NodeId b = make_chest(h.scene, "ChestB", Vec3(10.0f, 0.0f, 0.0f));

    NodeId targetless = h.scene.create_node("Targetless");
    h.scene.set_tag(targetless, "teleChest");

    NodeId untagged = make_chest(h.scene, "Untagged", Vec3(20.0f, 0.0f, 0.0f));
    h.scene.set_tag(untagged, "");

    auto teleporter = h.make(a, nullptr);
    REQUIRE(teleporter->setup());

    REQUIRE(teleporter->eligible_destinations() == std::vector<NodeId>{b});
}
