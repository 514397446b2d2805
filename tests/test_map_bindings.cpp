#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"
#include "lua/log_bindings.hpp"
#include "lua/lua_state.hpp"
#include "lua/map_bindings.hpp"
#include "map/tile_map.hpp"

#include <string>

extern "C" {
#include <lua.h>
}

using namespace tc;
using namespace tc::lua;
using tc::map::Pos;
using tc::map::TileMap;
using tc::map::TileType;
using tc::map::Wall;

namespace {

/// A 10x10 map with a scripting state bound to it.
struct ScriptedMap {
    TileMap map{10, 10};
    Config config;
    LuaState state;

    ScriptedMap() {
        state.set_tile_map(&map);
        state.set_config(&config);
        register_log_bindings(state);
        register_map_bindings(state);
    }

    double number(const char* name) {
        lua_getglobal(state.raw(), name);
        double v = lua_tonumber(state.raw(), -1);
        lua_pop(state.raw(), 1);
        return v;
    }

    bool boolean(const char* name) {
        lua_getglobal(state.raw(), name);
        bool v = lua_toboolean(state.raw(), -1) != 0;
        lua_pop(state.raw(), 1);
        return v;
    }

    std::string string(const char* name) {
        lua_getglobal(state.raw(), name);
        const char* s = lua_tostring(state.raw(), -1);
        std::string v = s ? s : "";
        lua_pop(state.raw(), 1);
        return v;
    }
};

} // namespace

TEST_CASE("Map bindings report dimensions", "[lua]") {
    ScriptedMap s;
    REQUIRE(s.state.do_string("w = MapWidth() h = MapHeight()").ok());
    CHECK(s.number("w") == 10);
    CHECK(s.number("h") == 10);
}

TEST_CASE("SetTile and GetTile", "[lua]") {
    ScriptedMap s;
    s.map.at(3, 4).left_wall = Wall::ShortWall;

    auto result = s.state.do_string(R"(
        SetTile(3, 4, "wall")
        SetTile(6, 6, "water")
        local t = GetTile(3, 4)
        kind = t.type
        blocked = t.blocked
        sight = t.block_sight
        left = t.left_wall
    )");
    REQUIRE(result.ok());

    CHECK(s.map.at(3, 4).tile_type == TileType::Wall);
    CHECK(s.map.at(3, 4).left_wall == Wall::ShortWall);
    CHECK(s.map.at(6, 6).tile_type == TileType::Water);
    CHECK_FALSE(s.map.visibility().is_transparent(3, 4));
    CHECK(s.string("kind") == "Wall");
    CHECK(s.boolean("blocked"));
    CHECK(s.boolean("sight"));
    CHECK(s.string("left") == "short");
}

TEST_CASE("SetWall places edge walls", "[lua]") {
    ScriptedMap s;
    auto result = s.state.do_string(R"(
        SetWall(5, 5, "left", "tall")
        SetWall(5, 5, "bottom", "short")
    )");
    REQUIRE(result.ok());
    CHECK(s.map.at(5, 5).left_wall == Wall::TallWall);
    CHECK(s.map.at(5, 5).bottom_wall == Wall::ShortWall);
}

TEST_CASE("Map bindings raise Lua errors for bad input", "[lua]") {
    ScriptedMap s;

    auto outside = s.state.do_string("SetTile(10, 0, 'wall')");
    REQUIRE_FALSE(outside.ok());
    CHECK(outside.error().kind == ErrorKind::Script);
    CHECK(outside.error().message.find("outside") != std::string::npos);

    CHECK_FALSE(s.state.do_string("SetTile(1, 1, 'lava')").ok());
    CHECK_FALSE(s.state.do_string("SetWall(1, 1, 'top', 'tall')").ok());
    CHECK_FALSE(s.state.do_string("SetWall(1, 1, 'left', 'huge')").ok());
    CHECK_FALSE(s.state.do_string("GetTile(-1, 1)").ok());
    CHECK_FALSE(s.state.do_string("SetTile('a', 1, 'wall')").ok());

    // Errors are caught by the protected call; the state stays usable.
    REQUIRE(s.state.do_string("after = MapWidth()").ok());
    CHECK(s.number("after") == 10);
}

TEST_CASE("IsBlocked returns the obstruction", "[lua]") {
    ScriptedMap s;
    s.map.at(4, 2).left_wall = Wall::TallWall;

    auto result = s.state.do_string(R"(
        clear = IsBlocked(1, 1, 5, 0) == nil
        local b = IsBlocked(1, 2, 7, 0)
        wall = b.wall
        tile = b.blocked_tile
        bx = b.x
        by = b.y
    )");
    REQUIRE(result.ok());
    CHECK(s.boolean("clear"));
    CHECK(s.string("wall") == "tall");
    CHECK_FALSE(s.boolean("tile"));
    CHECK(s.number("bx") == 4);
    CHECK(s.number("by") == 2);
}

TEST_CASE("IsInFov uses the configured radius", "[lua]") {
    ScriptedMap s;
    s.config.fov_radius = 4;
    s.map.at(5, 5).left_wall = Wall::ShortWall;

    auto result = s.state.do_string(R"(
        near = IsInFov(1, 1, 3, 1)
        far = IsInFov(1, 1, 8, 1)
        far_wide = IsInFov(1, 1, 8, 1, 10)
        over_wall = IsInFov(4, 5, 9, 5, 6)
    )");
    REQUIRE(result.ok());
    CHECK(s.boolean("near"));
    CHECK_FALSE(s.boolean("far"));
    CHECK(s.boolean("far_wide"));
    CHECK(s.boolean("over_wall"));

    s.config.crouching = true;
    REQUIRE(s.state.do_string("crouched = IsInFov(4, 5, 9, 5, 6)").ok());
    CHECK_FALSE(s.boolean("crouched"));
}

TEST_CASE("IsInFov in buffered mode", "[lua]") {
    ScriptedMap s;
    s.config.fov_mode = FovMode::Buffered;

    auto result = s.state.do_string(R"(
        SetTile(5, 2, "wall")
        face = IsInFov(1, 2, 5, 2)
        behind = IsInFov(1, 2, 8, 2)
        open = IsInFov(1, 5, 8, 5)
    )");
    REQUIRE(result.ok());
    CHECK(s.boolean("face"));
    CHECK_FALSE(s.boolean("behind"));
    CHECK(s.boolean("open"));
    CHECK(s.map.fov_pos() == Pos(1, 5));
}

TEST_CASE("ShortestPath returns cells from start to goal", "[lua]") {
    ScriptedMap s;
    auto result = s.state.do_string(R"(
        local path = ShortestPath(0, 0, 4, 4)
        steps = table.getn(path)
        last_x = path[steps].x
        last_y = path[steps].y
        for y = 0, 9 do SetTile(2, y, "wall") end
        blocked = table.getn(ShortestPath(0, 0, 4, 4))
        same = table.getn(ShortestPath(1, 1, 1, 1))
    )");
    REQUIRE(result.ok());
    CHECK(s.number("steps") == 5);
    CHECK(s.number("last_x") == 4);
    CHECK(s.number("last_y") == 4);
    CHECK(s.number("blocked") == 0);
    CHECK(s.number("same") == 1);
}

TEST_CASE("FloodFill and AoeFill", "[lua]") {
    ScriptedMap s;
    auto result = s.state.do_string(R"(
        filled = table.getn(FloodFill(5, 5, 1))
        local rings = AoeFill(5, 5, 2)
        ring_count = table.getn(rings)
        ring0 = table.getn(rings[1])
        ring1 = table.getn(rings[2])
        origin_x = rings[1][1].x
    )");
    REQUIRE(result.ok());
    CHECK(s.number("filled") == 9);
    CHECK(s.number("ring_count") == 3);
    CHECK(s.number("ring0") == 1);
    CHECK(s.number("ring1") == 8);
    CHECK(s.number("origin_x") == 5);
}

TEST_CASE("Huge radii and offsets stay within the map", "[lua]") {
    ScriptedMap s;
    auto result = s.state.do_string(R"(
        local rings = AoeFill(5, 5, 2147483647)
        ring_count = table.getn(rings)
        filled = table.getn(FloodFill(5, 5, 2147483647))
        local b = IsBlocked(5, 5, 1000000000, 0)
        edge_x = b.x
        edge_tile = b.blocked_tile
        local corner = IsBlocked(2147483647, 0, 1, 0)
        corner_tile = corner.blocked_tile
    )");
    REQUIRE(result.ok());
    // (0,0) is the farthest cell from (5,5).
    CHECK(s.number("ring_count") == 6);
    CHECK(s.number("filled") == 100);
    CHECK(s.number("edge_x") == 10);
    CHECK(s.boolean("edge_tile"));
    CHECK(s.boolean("corner_tile"));
}

TEST_CASE("Numbers outside the integer range raise Lua errors", "[lua]") {
    ScriptedMap s;

    auto result = s.state.do_string("IsBlocked(0, 0, 1e12, 0)");
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().message.find("out of integer range") != std::string::npos);

    CHECK_FALSE(s.state.do_string("AoeFill(5, 5, -1e10)").ok());
    CHECK_FALSE(s.state.do_string("FloodFill(5, 5, 0/0)").ok());
    CHECK_FALSE(s.state.do_string("IsInFov(1, 1, 2, 2, 1/0)").ok());

    // The state is still usable afterwards.
    REQUIRE(s.state.do_string("after = MapWidth()").ok());
    CHECK(s.number("after") == 10);
}

TEST_CASE("UpdateMap resyncs the visibility buffer", "[lua]") {
    ScriptedMap s;
    s.map.at(7, 7) = map::Tile::wall();
    CHECK(s.map.visibility().is_transparent(7, 7));

    REQUIRE(s.state.do_string("UpdateMap()").ok());
    CHECK_FALSE(s.map.visibility().is_transparent(7, 7));
}

TEST_CASE("Map bindings without a map", "[lua]") {
    LuaState state;
    register_map_bindings(state);
    auto result = state.do_string("MapWidth()");
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().message.find("TileMap") != std::string::npos);
}
