// mcv_teleport LockoutTable tests

#include <catch2/catch_test_macros.hpp>
#include <mcvillage/scene/scene_graph.hpp>
#include <mcvillage/teleport/lockout_table.hpp>

using namespace mcv_teleport;

TEST_CASE("LockoutTable lock and tick", "[teleport][lockout]") {
    mcv_scene::SceneGraph scene;
    NodeId a = scene.create_node("ChestA");
    NodeId b = scene.create_node("ChestB");
    LockoutTable table;

    SECTION("lock and query") {
        table.lock(a, 5.0f);
        REQUIRE(table.is_locked(a));
        REQUIRE_FALSE(table.is_locked(b));
        REQUIRE(table.remaining(a) == 5.0f);
        REQUIRE_FALSE(table.remaining(b).has_value());
        REQUIRE(table.size() == 1);
    }

    SECTION("relocking overwrites the timer") {
        table.lock(a, 1.0f);
        table.lock(a, 3.0f);
        REQUIRE(table.remaining(a) == 3.0f);
        REQUIRE(table.size() == 1);
    }

    SECTION("non-positive durations and invalid ids are ignored") {
        table.lock(a, 0.0f);
        table.lock(b, -1.0f);
        table.lock(NodeId{}, 2.0f);
        REQUIRE(table.empty());
    }

    SECTION("tick decrements once per call and expires at zero") {
        table.lock(a, 1.0f);
        table.lock(b, 0.5f);

        REQUIRE(table.tick(0.25f, scene) == 0);
        REQUIRE(table.remaining(a) == 0.75f);
        REQUIRE(table.remaining(b) == 0.25f);

        REQUIRE(table.tick(0.25f, scene) == 1);
        REQUIRE_FALSE(table.is_locked(b));
        REQUIRE(table.is_locked(a));

        REQUIRE(table.tick(0.5f, scene) == 1);
        REQUIRE(table.empty());
    }

    SECTION("destroyed chests are dropped") {
        table.lock(a, 5.0f);
        table.lock(b, 5.0f);
        scene.destroy(a);
        REQUIRE(table.tick(0.25f, scene) == 1);
        REQUIRE_FALSE(table.is_locked(a));
        REQUIRE(table.remaining(b) == 4.75f);
    }

    SECTION("unlock and clear") {
        table.lock(a, 5.0f);
        REQUIRE(table.unlock(a));
        REQUIRE_FALSE(table.unlock(a));
        table.lock(b, 5.0f);
        table.clear();
        REQUIRE(table.empty());
    }
}
