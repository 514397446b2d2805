#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>

struct lua_State;

namespace tc::lua {

/// Reads a Config from a Lua chunk that defines a global `TileCore` table:
///
///   TileCore = {
///       map_width = 64,
///       fov_mode = "buffered",
///   }
///
/// Recognized keys overwrite the defaults, unknown keys are logged and
/// ignored. A missing table, a value of the wrong type, or an out-of-range
/// value yields an Error of kind Config.
class ConfigLoader {
public:
    /// Execute a configuration file in a fresh state.
    Result<Config> load_file(const fs::path& path);

    /// Execute configuration source in a fresh state.
    Result<Config> load_string(std::string_view code);

private:
    /// Read the TileCore global from L into a Config.
    Result<Config> read_table(lua_State* L);
};

} // namespace tc::lua
