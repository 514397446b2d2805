#include "lua/map_bindings.hpp"
#include "lua/lua_state.hpp"
#include "core/config.hpp"
#include "map/aoe.hpp"
#include "map/pathfinder.hpp"
#include "map/tile_map.hpp"

#include <cstdint>
#include <cstring>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace tc::lua {

using map::Pos;
using map::TileMap;

// Fallbacks when no Config is attached to the state.
static const Config DEFAULT_CONFIG{};

static TileMap* check_map(lua_State* L) {
    auto* map = LuaState::get_tile_map(L);
    if (!map) {
        luaL_error(L, "TileMap not initialized");
    }
    return map;
}

static const Config& config_of(lua_State* L) {
    const Config* config = LuaState::get_config(L);
    return config ? *config : DEFAULT_CONFIG;
}

static i32 check_int(lua_State* L, int idx) {
    lua_Number n = luaL_checknumber(L, idx);
    // NaN fails both comparisons.
    luaL_argcheck(L, n >= INT32_MIN && n <= INT32_MAX, idx,
                  "number out of integer range");
    return static_cast<i32>(n);
}

static Pos check_pos(lua_State* L, int idx) {
    return Pos(check_int(L, idx), check_int(L, idx + 1));
}

/// Like check_pos, but raises a Lua error for cells outside the map.
static Pos check_cell(lua_State* L, const TileMap& map, int idx) {
    Pos pos = check_pos(L, idx);
    if (!map.is_within_bounds(pos)) {
        spdlog::warn("Script touched cell ({},{}) outside the map", pos.x,
                     pos.y);
        luaL_error(L, "cell (%d, %d) is outside the %dx%d map", pos.x, pos.y,
                   map.width(), map.height());
    }
    return pos;
}

static void set_field(lua_State* L, const char* key, lua_Number value) {
    lua_pushstring(L, key);
    lua_pushnumber(L, value);
    lua_rawset(L, -3);
}

static void set_field(lua_State* L, const char* key, bool value) {
    lua_pushstring(L, key);
    lua_pushboolean(L, value ? 1 : 0);
    lua_rawset(L, -3);
}

static void set_field(lua_State* L, const char* key, const char* value) {
    lua_pushstring(L, key);
    lua_pushstring(L, value);
    lua_rawset(L, -3);
}

static void push_pos(lua_State* L, Pos pos) {
    lua_newtable(L);
    set_field(L, "x", static_cast<lua_Number>(pos.x));
    set_field(L, "y", static_cast<lua_Number>(pos.y));
}

static void push_pos_array(lua_State* L, const std::vector<Pos>& positions) {
    lua_newtable(L);
    int i = 1;
    for (Pos p : positions) {
        push_pos(L, p);
        lua_rawseti(L, -2, i++);
    }
}

// ================================================================
// Dimensions and edits
// ================================================================

static int l_MapWidth(lua_State* L) {
    lua_pushnumber(L, check_map(L)->width());
    return 1;
}

static int l_MapHeight(lua_State* L) {
    lua_pushnumber(L, check_map(L)->height());
    return 1;
}

static int l_SetTile(lua_State* L) {
    auto* map = check_map(L);
    Pos pos = check_cell(L, *map, 1);
    const char* kind = luaL_checkstring(L, 3);

    map::Tile tile;
    if (std::strcmp(kind, "empty") == 0) {
        tile = map::Tile::empty();
    } else if (std::strcmp(kind, "wall") == 0) {
        tile = map::Tile::wall('#');
    } else if (std::strcmp(kind, "short_wall") == 0) {
        tile = map::Tile::short_wall('+');
    } else if (std::strcmp(kind, "water") == 0) {
        tile = map::Tile::water();
    } else if (std::strcmp(kind, "exit") == 0) {
        tile = map::Tile::exit();
    } else {
        return luaL_error(L, "unknown tile kind '%s'", kind);
    }

    // Edge walls belong to the cell and survive a tile swap.
    const map::Tile& old = (*map)[pos];
    tile.left_wall = old.left_wall;
    tile.bottom_wall = old.bottom_wall;
    tile.explored = old.explored;
    (*map)[pos] = tile;
    map->set_cell(pos.x, pos.y, !tile.block_sight);
    return 0;
}

static int l_SetWall(lua_State* L) {
    auto* map = check_map(L);
    Pos pos = check_cell(L, *map, 1);
    const char* side = luaL_checkstring(L, 3);
    const char* kind = luaL_checkstring(L, 4);

    map::Wall wall;
    if (std::strcmp(kind, "empty") == 0) {
        wall = map::Wall::Empty;
    } else if (std::strcmp(kind, "short") == 0) {
        wall = map::Wall::ShortWall;
    } else if (std::strcmp(kind, "tall") == 0) {
        wall = map::Wall::TallWall;
    } else {
        return luaL_error(L, "unknown wall kind '%s'", kind);
    }

    if (std::strcmp(side, "left") == 0) {
        (*map)[pos].left_wall = wall;
    } else if (std::strcmp(side, "bottom") == 0) {
        (*map)[pos].bottom_wall = wall;
    } else {
        return luaL_error(L, "unknown wall side '%s' (expected left or bottom)",
                          side);
    }
    return 0;
}

static int l_GetTile(lua_State* L) {
    auto* map = check_map(L);
    Pos pos = check_cell(L, *map, 1);
    const map::Tile& tile = (*map)[pos];

    lua_newtable(L);
    set_field(L, "type", map::tile_type_name(tile.tile_type));
    set_field(L, "blocked", tile.blocked);
    set_field(L, "block_sight", tile.block_sight);
    set_field(L, "left_wall", map::wall_name(tile.left_wall));
    set_field(L, "bottom_wall", map::wall_name(tile.bottom_wall));
    return 1;
}

static int l_UpdateMap(lua_State* L) {
    check_map(L)->update_map();
    return 0;
}

// ================================================================
// Queries
// ================================================================

static int l_IsBlocked(lua_State* L) {
    auto* map = check_map(L);
    Pos start = check_pos(L, 1);
    i32 dx = check_int(L, 3);
    i32 dy = check_int(L, 4);

    auto blocked = map->is_blocked_along(start, dx, dy);
    if (!blocked) {
        lua_pushnil(L);
        return 1;
    }

    lua_newtable(L);
    set_field(L, "blocked_tile", blocked->blocked_tile);
    set_field(L, "wall", map::wall_name(blocked->wall_type));
    set_field(L, "x", static_cast<lua_Number>(blocked->end_pos.x));
    set_field(L, "y", static_cast<lua_Number>(blocked->end_pos.y));
    set_field(L, "direction", map::direction_name(blocked->direction));
    return 1;
}

static int l_IsInFov(lua_State* L) {
    auto* map = check_map(L);
    const Config& config = config_of(L);
    Pos start = check_pos(L, 1);
    Pos end = check_pos(L, 3);
    i32 radius = lua_isnoneornil(L, 5) ? config.fov_radius : check_int(L, 5);

    bool visible = false;
    if (config.fov_mode == FovMode::Buffered) {
        visible = map->is_in_fov_buffered(start, end, radius);
    } else {
        visible = map->is_in_fov(start, end, radius, config.crouching);
    }
    lua_pushboolean(L, visible ? 1 : 0);
    return 1;
}

static int l_ShortestPath(lua_State* L) {
    auto* map = check_map(L);
    Pos start = check_pos(L, 1);
    Pos goal = check_pos(L, 3);
    std::optional<i32> max_radius;
    if (!lua_isnoneornil(L, 5)) {
        max_radius = check_int(L, 5);
    }

    map::Pathfinder pathfinder(*map, config_of(L).max_search_nodes);
    push_pos_array(L, pathfinder.shortest_path(start, goal, max_radius));
    return 1;
}

static int l_FloodFill(lua_State* L) {
    auto* map = check_map(L);
    Pos origin = check_pos(L, 1);
    i32 radius = check_int(L, 3);

    map::Pathfinder pathfinder(*map);
    push_pos_array(L, pathfinder.flood_fill(origin, radius));
    return 1;
}

static int l_AoeFill(lua_State* L) {
    auto* map = check_map(L);
    Pos origin = check_pos(L, 1);
    i32 radius = check_int(L, 3);

    auto aoe = map::aoe_fill(*map, map::AoeEffect::Sound, origin, radius);

    // rings[d] is exposed as result[d + 1].
    lua_newtable(L);
    int i = 1;
    for (const auto& ring : aoe.rings) {
        push_pos_array(L, ring);
        lua_rawseti(L, -2, i++);
    }
    return 1;
}

void register_map_bindings(LuaState& state) {
    state.register_function("MapWidth", l_MapWidth);
    state.register_function("MapHeight", l_MapHeight);
    state.register_function("SetTile", l_SetTile);
    state.register_function("SetWall", l_SetWall);
    state.register_function("GetTile", l_GetTile);
    state.register_function("UpdateMap", l_UpdateMap);
    state.register_function("IsBlocked", l_IsBlocked);
    state.register_function("IsInFov", l_IsInFov);
    state.register_function("ShortestPath", l_ShortestPath);
    state.register_function("FloodFill", l_FloodFill);
    state.register_function("AoeFill", l_AoeFill);
    spdlog::debug("Map bindings registered");
}

} // namespace tc::lua
