#include <catch2/catch_test_macros.hpp>
#include "lua/config_loader.hpp"

#include <fstream>
#include <string>

using namespace tc;
using namespace tc::lua;

TEST_CASE("Config defaults", "[config]") {
    Config config;
    CHECK(config.map_width == 40);
    CHECK(config.map_height == 40);
    CHECK(config.fov_radius == 10);
    CHECK_FALSE(config.crouching);
    CHECK(config.fov_mode == FovMode::Lines);
    CHECK(config.max_search_nodes == 0);
    CHECK(config.log_level == "info");
    CHECK(config.log_file.empty());
    CHECK(std::string(fov_mode_name(FovMode::Buffered)) == "buffered");
}

TEST_CASE("Config from an empty table keeps defaults", "[config]") {
    ConfigLoader loader;
    auto result = loader.load_string("TileCore = {}");
    REQUIRE(result.ok());
    CHECK(result.value().map_width == 40);
    CHECK(result.value().fov_mode == FovMode::Lines);
}

TEST_CASE("Config reads every recognized key", "[config]") {
    ConfigLoader loader;
    auto result = loader.load_string(R"(
        local side = 16
        TileCore = {
            map_width = side * 2,
            map_height = side,
            fov_radius = 7,
            crouching = true,
            fov_mode = "buffered",
            max_search_nodes = 500,
            log_level = "debug",
            log_file = "probe.log",
        }
    )");
    REQUIRE(result.ok());

    const Config& config = result.value();
    CHECK(config.map_width == 32);
    CHECK(config.map_height == 16);
    CHECK(config.fov_radius == 7);
    CHECK(config.crouching);
    CHECK(config.fov_mode == FovMode::Buffered);
    CHECK(config.max_search_nodes == 500);
    CHECK(config.log_level == "debug");
    CHECK(config.log_file == "probe.log");
}

TEST_CASE("Config ignores unknown keys", "[config]") {
    ConfigLoader loader;
    auto result = loader.load_string(R"(
        TileCore = { fov_radius = 3, colour = "blue", [1] = "x" }
    )");
    REQUIRE(result.ok());
    CHECK(result.value().fov_radius == 3);
}

TEST_CASE("Config rejects malformed values", "[config]") {
    ConfigLoader loader;

    auto wrong_type = loader.load_string("TileCore = { map_width = 'wide' }");
    REQUIRE_FALSE(wrong_type.ok());
    CHECK(wrong_type.error().kind == ErrorKind::Config);
    CHECK(wrong_type.error().message.find("map_width") != std::string::npos);

    auto not_bool = loader.load_string("TileCore = { crouching = 1 }");
    REQUIRE_FALSE(not_bool.ok());
    CHECK(not_bool.error().kind == ErrorKind::Config);

    auto bad_mode = loader.load_string("TileCore = { fov_mode = 'cones' }");
    REQUIRE_FALSE(bad_mode.ok());
    CHECK(bad_mode.error().kind == ErrorKind::Config);

    auto zero_width = loader.load_string("TileCore = { map_width = 0 }");
    REQUIRE_FALSE(zero_width.ok());
    CHECK(zero_width.error().kind == ErrorKind::Config);

    auto negative = loader.load_string("TileCore = { max_search_nodes = -1 }");
    REQUIRE_FALSE(negative.ok());
    CHECK(negative.error().kind == ErrorKind::Config);
}

TEST_CASE("Config rejects numbers too large for their field", "[config]") {
    ConfigLoader loader;

    auto wide = loader.load_string("TileCore = { map_width = 1e10 }");
    REQUIRE_FALSE(wide.ok());
    CHECK(wide.error().kind == ErrorKind::Config);
    CHECK(wide.error().message.find("map_width") != std::string::npos);

    auto tall = loader.load_string("TileCore = { map_height = 100001 }");
    REQUIRE_FALSE(tall.ok());
    CHECK(tall.error().kind == ErrorKind::Config);

    auto radius = loader.load_string("TileCore = { fov_radius = 2147483648 }");
    REQUIRE_FALSE(radius.ok());
    CHECK(radius.error().kind == ErrorKind::Config);

    auto nodes = loader.load_string("TileCore = { max_search_nodes = 4294967296 }");
    REQUIRE_FALSE(nodes.ok());
    CHECK(nodes.error().kind == ErrorKind::Config);

    auto nan = loader.load_string("TileCore = { fov_radius = 0/0 }");
    REQUIRE_FALSE(nan.ok());
    CHECK(nan.error().kind == ErrorKind::Config);

    auto limits = loader.load_string(R"(
        TileCore = { map_width = 100000, fov_radius = 2147483647,
                     max_search_nodes = 4294967295 }
    )");
    REQUIRE(limits.ok());
    CHECK(limits.value().map_width == MAX_MAP_DIMENSION);
    CHECK(limits.value().fov_radius == 2147483647);
    CHECK(limits.value().max_search_nodes == 4294967295u);
}

TEST_CASE("Config requires the TileCore table", "[config]") {
    ConfigLoader loader;

    auto missing = loader.load_string("Settings = {}");
    REQUIRE_FALSE(missing.ok());
    CHECK(missing.error().kind == ErrorKind::Config);

    auto not_table = loader.load_string("TileCore = 5");
    REQUIRE_FALSE(not_table.ok());
    CHECK(not_table.error().kind == ErrorKind::Config);
}

TEST_CASE("Config script errors keep their kind", "[config]") {
    ConfigLoader loader;

    auto syntax = loader.load_string("TileCore = {");
    REQUIRE_FALSE(syntax.ok());
    CHECK(syntax.error().kind == ErrorKind::Script);

    auto missing = loader.load_file("/nonexistent/tilecore.lua");
    REQUIRE_FALSE(missing.ok());
    CHECK(missing.error().kind == ErrorKind::Io);
}

TEST_CASE("Config from a file", "[config]") {
    fs::path path = fs::temp_directory_path() / "tilecore_test_config.lua";
    {
        std::ofstream out(path);
        out << "LOG('loading test config')\n"
            << "TileCore = { map_width = 12, map_height = 9 }\n";
    }

    ConfigLoader loader;
    auto result = loader.load_file(path);
    fs::remove(path);

    REQUIRE(result.ok());
    CHECK(result.value().map_width == 12);
    CHECK(result.value().map_height == 9);
}
