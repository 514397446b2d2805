#include "lua/log_bindings.hpp"
#include "lua/lua_state.hpp"

#include <string>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
}

namespace tc::lua {

static std::string concat_args(lua_State* L) {
    int n = lua_gettop(L);
    std::string result;
    for (int i = 1; i <= n; i++) {
        if (lua_isstring(L, i)) {
            result += lua_tostring(L, i);
        } else if (lua_isnil(L, i)) {
            result += "nil";
        } else if (lua_isboolean(L, i)) {
            result += lua_toboolean(L, i) ? "true" : "false";
        } else {
            result += lua_typename(L, lua_type(L, i));
        }
    }
    return result;
}

static int l_LOG(lua_State* L) {
    spdlog::info("{}", concat_args(L));
    return 0;
}

static int l_WARN(lua_State* L) {
    spdlog::warn("{}", concat_args(L));
    return 0;
}

static int l_SPEW(lua_State* L) {
    spdlog::debug("{}", concat_args(L));
    return 0;
}

static int l_ALERT(lua_State* L) {
    spdlog::error("{}", concat_args(L));
    return 0;
}

void register_log_bindings(LuaState& state) {
    state.register_function("LOG", l_LOG);
    state.register_function("WARN", l_WARN);
    state.register_function("SPEW", l_SPEW);
    state.register_function("_ALERT", l_ALERT);
}

} // namespace tc::lua
