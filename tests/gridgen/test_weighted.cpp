// mcv_gridgen weighted selection tests

#include <catch2/catch_test_macros.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/gridgen/weighted.hpp>

#include "support/scripted_random.hpp"

#include <array>

using namespace mcv_gridgen;

// =============================================================================
// select_weighted_at
// =============================================================================

TEST_CASE("select_weighted_at", "[gridgen][weighted]") {
    std::vector<float> weights = {1.0f, 1.0f, 2.0f};

    SECTION("boundaries are inclusive") {
        REQUIRE(select_weighted_at(weights, 0.0f) == 0);
        REQUIRE(select_weighted_at(weights, 1.0f) == 0);
        REQUIRE(select_weighted_at(weights, 1.5f) == 1);
        REQUIRE(select_weighted_at(weights, 2.0f) == 1);
        REQUIRE(select_weighted_at(weights, 2.01f) == 2);
        REQUIRE(select_weighted_at(weights, 4.0f) == 2);
    }

    SECTION("beyond total falls back to first") {
        REQUIRE(select_weighted_at(weights, 5.0f) == 0);
    }

    SECTION("zero weights never win") {
        std::vector<float> gapped = {0.0f, 1.0f, -3.0f, 1.0f};
        REQUIRE(select_weighted_at(gapped, 0.0f) == 1);
        REQUIRE(select_weighted_at(gapped, 1.0f) == 1);
        REQUIRE(select_weighted_at(gapped, 1.5f) == 3);
    }

    SECTION("empty list") {
        REQUIRE(select_weighted_at({}, 0.5f) == 0);
    }
}

TEST_CASE("total_weight ignores non-positive weights", "[gridgen][weighted]") {
    REQUIRE(total_weight({}) == 0.0f);
    REQUIRE(total_weight({1.0f, -2.0f, 0.0f, 3.0f}) == 4.0f);
}

// =============================================================================
// select_weighted
// =============================================================================

TEST_CASE("select_weighted draw accounting", "[gridgen][weighted]") {
    mcv_test::ScriptedRandom rng({0.9f});

    SECTION("single candidate uses no draw") {
        REQUIRE(select_weighted({5.0f}, rng) == 0);
        REQUIRE(rng.draws() == 0);
    }

    SECTION("empty list uses no draw") {
        REQUIRE(select_weighted({}, rng) == 0);
        REQUIRE(rng.draws() == 0);
    }

    SECTION("two or more candidates use one draw") {
        // 0.9 * 4 = 3.6 lands in the third bucket
        REQUIRE(select_weighted({1.0f, 1.0f, 2.0f}, rng) == 2);
        REQUIRE(rng.draws() == 1);
    }

    SECTION("all zero weights still draw once and fall back") {
        REQUIRE(select_weighted({0.0f, 0.0f}, rng) == 0);
        REQUIRE(rng.draws() == 1);
    }
}

TEST_CASE("select_weighted distribution", "[gridgen][weighted][statistics]") {
    mcv_core::SeededRandom rng(1234);
    std::vector<float> weights = {1.0f, 1.0f, 2.0f};

    std::array<int, 3> counts{};
    constexpr int k_trials = 10000;
    for (int i = 0; i < k_trials; ++i) {
        ++counts[select_weighted(weights, rng)];
    }

    REQUIRE(rng.draw_count() == static_cast<std::uint64_t>(k_trials));
    float third = static_cast<float>(counts[2]) / k_trials;
    REQUIRE(third > 0.45f);
    REQUIRE(third < 0.55f);
    REQUIRE(counts[0] > 2000);
    REQUIRE(counts[1] > 2000);
}
