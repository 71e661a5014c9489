// mcv_core JSON configuration tests

#include <catch2/catch_test_macros.hpp>
#include <mcvillage/core/config.hpp>

#include <filesystem>
#include <fstream>

using namespace mcv_core;

TEST_CASE("parse_json_string", "[core][config]") {
    SECTION("valid document") {
        auto j = parse_json_string(R"({"spacing": 1.5})");
        REQUIRE(j);
        REQUIRE((*j)["spacing"].get<float>() == 1.5f);
    }

    SECTION("malformed document names the source") {
        auto j = parse_json_string("{\"spacing\": ", "village.json");
        REQUIRE_FALSE(j);
        REQUIRE(j.error().code() == ErrorCode::ParseError);
        REQUIRE(j.error().as<ConfigError>()->key == "village.json");
    }
}

TEST_CASE("load_json_file", "[core][config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto j = load_json_file("/nonexistent/mcvillage/world.json");
        REQUIRE_FALSE(j);
        REQUIRE(j.error().code() == ErrorCode::IOError);
    }

    SECTION("file on disk") {
        fs::path path = fs::temp_directory_path() / "mcvillage_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"grid": {"size": [2, 1, 2]}})";
        }
        auto j = load_json_file(path);
        REQUIRE(j);
        REQUIRE((*j)["grid"]["size"].size() == 3);
        fs::remove(path);
    }
}

TEST_CASE("read_optional and read_required", "[core][config]") {
    auto j = nlohmann::json::parse(R"({"name": "Wheat", "weight": 2.5, "count": 3, "enabled": false, "nothing": null})");

    SECTION("present keys are read") {
        std::string name;
        float weight = 0.0f;
        int count = 0;
        bool enabled = true;
        REQUIRE(read_optional(j, "name", name));
        REQUIRE(read_optional(j, "weight", weight));
        REQUIRE(read_optional(j, "count", count));
        REQUIRE(read_optional(j, "enabled", enabled));
        REQUIRE(name == "Wheat");
        REQUIRE(weight == 2.5f);
        REQUIRE(count == 3);
        REQUIRE_FALSE(enabled);
    }

    SECTION("missing and null keys leave the default") {
        float weight = 9.0f;
        REQUIRE(read_optional(j, "missing", weight));
        REQUIRE(read_optional(j, "nothing", weight));
        REQUIRE(weight == 9.0f);
    }

    SECTION("integers are accepted for floats") {
        float count = 0.0f;
        REQUIRE(read_optional(j, "count", count));
        REQUIRE(count == 3.0f);
    }

    SECTION("wrong types are parse errors") {
        int count = 0;
        auto r = read_optional(j, "name", count);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code() == ErrorCode::ParseError);
        REQUIRE(r.error().as<ConfigError>()->key == "name");

        bool flag = false;
        REQUIRE_FALSE(read_optional(j, "count", flag));

        int whole = 0;
        REQUIRE_FALSE(read_optional(j, "weight", whole));
    }

    SECTION("required keys must exist") {
        std::string tpl;
        auto r = read_required(j, "template", tpl);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code() == ErrorCode::ParseError);
    }

    SECTION("expect_object") {
        REQUIRE(expect_object(j, "root"));
        REQUIRE_FALSE(expect_object(nlohmann::json::array(), "root"));
    }
}
