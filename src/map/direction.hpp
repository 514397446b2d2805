#pragma once

#include "core/types.hpp"
#include "map/geometry.hpp"

#include <array>

namespace tc::map {

enum class Direction : u8 {
    Left,
    Right,
    Up,
    Down,
    DownLeft,
    DownRight,
    UpLeft,
    UpRight,
    Center,
};

/// Direction of a signed step; each component is clamped to {-1, 0, 1}.
/// (0, 0) is Center. +y is Down.
Direction direction_from_dxy(i32 dx, i32 dy);

/// Unit step for a direction; Center is (0, 0).
Pos direction_into_move(Direction dir);

bool is_diagonal(Direction dir);

const char* direction_name(Direction dir);

/// Every direction an actor may choose, Center last.
const std::array<Direction, 9>& move_actions();

} // namespace tc::map
