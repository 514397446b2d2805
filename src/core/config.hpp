#pragma once

#include "core/types.hpp"

#include <string>

namespace tc {

enum class FovMode : u8 {
    Lines,    // line walk with short-wall peeking (canonical)
    Buffered, // shadow-cast buffer corroborated by a direct wall check
};

const char* fov_mode_name(FovMode mode);

/// Largest map_width or map_height a config file may ask for.
constexpr i32 MAX_MAP_DIMENSION = 100000;

/// Runtime tuning for the probe and the scripting layer.
/// The map core never reads this; callers pass the values they need.
struct Config {
    i32 map_width = 40;
    i32 map_height = 40;
    i32 fov_radius = 10;
    bool crouching = false;
    FovMode fov_mode = FovMode::Lines;
    u32 max_search_nodes = 0; // 0 = unbounded A*
    std::string log_level = "info";
    std::string log_file;     // empty = console only
};

} // namespace tc
