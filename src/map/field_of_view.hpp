#pragma once

#include "core/types.hpp"
#include "map/geometry.hpp"

namespace tc::map {

class TileMap;

/// Cost added on top of the distance skipped when looking over a short wall.
constexpr i32 SHORT_WALL_PEEK_COST = 1;

/// Walk line(start, end) and return the last cell the walk reaches.
///
/// Short-wall edges are looked over (unless crouching) at the cost of the
/// distance skipped plus SHORT_WALL_PEEK_COST. Tall walls and occupied cells
/// stop the walk. The walk also stops before its effective distance would
/// exceed max_dist.
Pos fov_line(const TileMap& map, Pos start, Pos end, i32 max_dist,
             bool crouching);

/// Canonical visibility test. True when start == end. False when either
/// cell is out of range or distance(start, end) >= radius.
///
/// A target is visible when the forward walk reaches it, or the reverse walk
/// reaches the observer, or the forward walk stops next to a target that
/// itself blocks sight (its near face is seen). A visible result is then
/// culled if the next-to-last cell of the line is itself not visible,
/// checked from both ends.
bool is_in_fov_lines(const TileMap& map, Pos start, Pos end, i32 radius,
                     bool crouching = false);

/// True when line(start, end) has at least three cells and its
/// next-to-last cell is not visible from start.
bool needs_culling(const TileMap& map, Pos start, Pos end, i32 radius,
                   bool crouching);

} // namespace tc::map
