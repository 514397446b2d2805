#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>

struct lua_State;

namespace tc {
struct Config;
}

namespace tc::map {
class TileMap;
}

namespace tc::lua {

/// Registry keys for engine pointers reachable from C bindings.
constexpr const char* REG_TILE_MAP = "tc_tile_map";
constexpr const char* REG_CONFIG = "tc_config";

/// RAII wrapper around a Lua 5.0 state.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Set a global string variable.
    void set_global_string(const char* name, const char* value);

    /// Set a global number.
    void set_global_number(const char* name, f64 value);

    /// Set a global boolean.
    void set_global_bool(const char* name, bool value);

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

    /// Store the map the bindings operate on (not owned).
    void set_tile_map(map::TileMap* map);

    /// Store the configuration the bindings read defaults from (not owned).
    void set_config(const Config* config);

    /// Retrieve the map pointer from a lua_State (for use in C bindings).
    static map::TileMap* get_tile_map(lua_State* L);

    /// Retrieve the configuration pointer; nullptr if none was set.
    static const Config* get_config(lua_State* L);

private:
    lua_State* L_ = nullptr;
};

} // namespace tc::lua
