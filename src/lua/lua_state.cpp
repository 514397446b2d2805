#include "lua/lua_state.hpp"

#include <fstream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace tc::lua {

LuaState::LuaState() {
    L_ = lua_open();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }

    // Scenario scripts get the pure libraries only; no io or os access.
    luaopen_base(L_);
    luaopen_table(L_);
    luaopen_string(L_);
    luaopen_math(L_);
    lua_settop(L_, 0); // 5.1 leaves each library table on the stack
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_number(const char* name, f64 value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_bool(const char* name, bool value) {
    lua_pushboolean(L_, value ? 1 : 0);
    lua_setglobal(L_, name);
}

Result<void> LuaState::do_string(std::string_view code) {
    return do_buffer(code.data(), code.size(), "=string");
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error(ErrorKind::Io, "Failed to open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (!file.read(buffer.data(), size)) {
        return Error(ErrorKind::Io, "Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    if (!L_) {
        return Error(ErrorKind::Script, "Lua state not initialized");
    }

    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    int status = luaL_loadbuffer(L_, buf, len, name);
    if (status != 0) {
        std::string err = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        return Error(ErrorKind::Script, std::move(err));
    }

    status = lua_pcall(L_, 0, 0, 0);
    if (status != 0) {
        std::string err = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        return Error(ErrorKind::Script, std::move(err));
    }

    return {};
}

void LuaState::set_tile_map(map::TileMap* map) {
    lua_pushstring(L_, REG_TILE_MAP);
    lua_pushlightuserdata(L_, map);
    lua_rawset(L_, LUA_REGISTRYINDEX);
}

void LuaState::set_config(const Config* config) {
    lua_pushstring(L_, REG_CONFIG);
    lua_pushlightuserdata(L_, const_cast<Config*>(config));
    lua_rawset(L_, LUA_REGISTRYINDEX);
}

map::TileMap* LuaState::get_tile_map(lua_State* L) {
    lua_pushstring(L, REG_TILE_MAP);
    lua_rawget(L, LUA_REGISTRYINDEX);
    auto* map = static_cast<map::TileMap*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    return map;
}

const Config* LuaState::get_config(lua_State* L) {
    lua_pushstring(L, REG_CONFIG);
    lua_rawget(L, LUA_REGISTRYINDEX);
    auto* config = static_cast<const Config*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    return config;
}

} // namespace tc::lua
