#include "lua/config_loader.hpp"
#include "lua/log_bindings.hpp"
#include "lua/lua_state.hpp"

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace tc::lua {

Result<Config> ConfigLoader::load_file(const fs::path& path) {
    LuaState state;
    register_log_bindings(state);

    spdlog::info("Loading configuration: {}", path.string());
    auto result = state.do_file(path);
    if (!result) {
        return Error(result.error().kind, "Failed to execute config file: " +
                                              result.error().message);
    }
    return read_table(state.raw());
}

Result<Config> ConfigLoader::load_string(std::string_view code) {
    LuaState state;
    register_log_bindings(state);

    auto result = state.do_string(code);
    if (!result) {
        return Error(result.error().kind, "Failed to execute config: " +
                                              result.error().message);
    }
    return read_table(state.raw());
}

static Error type_error(const std::string& key, const char* expected,
                        lua_State* L, int idx) {
    return Error(ErrorKind::Config,
                 "TileCore." + key + " must be " + expected + ", got " +
                     lua_typename(L, lua_type(L, idx)));
}

Result<Config> ConfigLoader::read_table(lua_State* L) {
    lua_getglobal(L, "TileCore");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error(ErrorKind::Config,
                     "'TileCore' global is not a table after config execution");
    }
    int table = lua_gettop(L);

    Config config;
    lua_pushnil(L);
    while (lua_next(L, table) != 0) {
        // key at -2, value at -1
        if (lua_type(L, -2) != LUA_TSTRING) {
            spdlog::warn("Config: ignoring non-string key of type {}",
                         lua_typename(L, lua_type(L, -2)));
            lua_pop(L, 1);
            continue;
        }
        std::string key = lua_tostring(L, -2);
        int value = lua_gettop(L);

        std::optional<Error> err;
        if (key == "map_width" || key == "map_height" || key == "fov_radius" ||
            key == "max_search_nodes") {
            if (lua_type(L, value) != LUA_TNUMBER) {
                err = type_error(key, "a number", L, value);
            } else {
                // Range is checked on the raw number so nothing wraps.
                lua_Number raw = lua_tonumber(L, value);
                i64 lo = 0;
                i64 hi = UINT32_MAX;
                if (key == "map_width" || key == "map_height") {
                    lo = 1;
                    hi = MAX_MAP_DIMENSION;
                } else if (key == "fov_radius") {
                    hi = INT32_MAX;
                }

                if (!(raw >= static_cast<lua_Number>(lo) &&
                      raw <= static_cast<lua_Number>(hi))) {
                    err = Error(ErrorKind::Config,
                                "TileCore." + key + " must be between " +
                                    std::to_string(lo) + " and " +
                                    std::to_string(hi));
                } else if (key == "map_width") {
                    config.map_width = static_cast<i32>(raw);
                } else if (key == "map_height") {
                    config.map_height = static_cast<i32>(raw);
                } else if (key == "fov_radius") {
                    config.fov_radius = static_cast<i32>(raw);
                } else {
                    config.max_search_nodes = static_cast<u32>(raw);
                }
            }
        } else if (key == "crouching") {
            if (!lua_isboolean(L, value)) {
                err = type_error(key, "a boolean", L, value);
            } else {
                config.crouching = lua_toboolean(L, value) != 0;
            }
        } else if (key == "fov_mode") {
            const char* mode =
                lua_type(L, value) == LUA_TSTRING ? lua_tostring(L, value)
                                                  : nullptr;
            if (!mode) {
                err = type_error(key, "a string", L, value);
            } else if (std::strcmp(mode, "lines") == 0) {
                config.fov_mode = FovMode::Lines;
            } else if (std::strcmp(mode, "buffered") == 0) {
                config.fov_mode = FovMode::Buffered;
            } else {
                err = Error(ErrorKind::Config,
                            std::string("TileCore.fov_mode must be 'lines' or "
                                        "'buffered', got '") +
                                mode + "'");
            }
        } else if (key == "log_level" || key == "log_file") {
            if (lua_type(L, value) != LUA_TSTRING) {
                err = type_error(key, "a string", L, value);
            } else if (key == "log_level") {
                config.log_level = lua_tostring(L, value);
            } else {
                config.log_file = lua_tostring(L, value);
            }
        } else {
            spdlog::warn("Config: unknown key '{}' ignored", key);
        }

        if (err) {
            lua_pop(L, 3); // value, key, table
            return *err;
        }
        lua_pop(L, 1); // pop value, keep key for lua_next
    }
    lua_pop(L, 1); // pop TileCore table

    spdlog::debug("Config: {}x{} map, fov radius {} ({}), node cap {}",
                  config.map_width, config.map_height, config.fov_radius,
                  fov_mode_name(config.fov_mode), config.max_search_nodes);
    return config;
}

} // namespace tc::lua
