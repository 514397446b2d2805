#pragma once

#include "core/types.hpp"
#include "map/direction.hpp"
#include "map/geometry.hpp"
#include "map/tile.hpp"
#include "map/visibility_buffer.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace tc::map {

/// One obstructed single-step move. Produced and consumed inside a query.
struct Blocked {
    Pos start_pos;
    Pos end_pos;
    Direction direction = Direction::Center;
    bool blocked_tile = false; // next cell is occupied or out of range
    Wall wall_type = Wall::Empty;

    bool operator==(const Blocked& o) const {
        return start_pos == o.start_pos && end_pos == o.end_pos &&
               direction == o.direction && blocked_tile == o.blocked_tile &&
               wall_type == o.wall_type;
    }
};

/// Fixed-size tile grid with edge walls, movement blocking and field of view.
///
/// Tiles are stored row-major in one contiguous array. The shadow-cast
/// visibility buffer is the only derived state; it is valid for the stored
/// (fov_pos, fov_radius) and must be refreshed with update_map() after edits
/// that change block_sight.
class TileMap {
public:
    /// All-empty map; dimensions are clamped to at least 1x1.
    TileMap(i32 width, i32 height);

    /// Build from column-major tiles (columns[x][y]). Columns must be
    /// non-empty and of equal length; throws std::invalid_argument otherwise.
    static TileMap from_columns(const std::vector<std::vector<Tile>>& columns);

    i32 width() const { return width_; }
    i32 height() const { return height_; }
    std::pair<i32, i32> size() const { return {width_, height_}; }

    bool is_within_bounds(Pos pos) const {
        return pos.x >= 0 && pos.y >= 0 && pos.x < width_ && pos.y < height_;
    }

    /// Unchecked access; pos must be within bounds.
    Tile& operator[](Pos pos) { return tiles_[index(pos)]; }
    const Tile& operator[](Pos pos) const { return tiles_[index(pos)]; }
    Tile& at(i32 x, i32 y) { return (*this)[Pos(x, y)]; }
    const Tile& at(i32 x, i32 y) const { return (*this)[Pos(x, y)]; }

    /// Checked access; nullptr when pos is out of range.
    Tile* tile_at(Pos pos);
    const Tile* tile_at(Pos pos) const;

    bool is_empty(Pos pos) const;

    // ---- Edge predicates ----------------------------------------------
    // An edge is blocked when it carries a wall or the cell beyond it is
    // occupied. Anything touching the outside of the grid counts as blocked.

    bool blocked_left(Pos pos) const;
    bool blocked_right(Pos pos) const;
    bool blocked_up(Pos pos) const;
    bool blocked_down(Pos pos) const;

    // ---- Movement blocking --------------------------------------------

    /// Classify a single step between 8-adjacent cells.
    /// Throws std::logic_error when the cells are not adjacent.
    std::optional<Blocked> move_blocked(Pos pos, Pos next_pos) const;

    /// Rasterize start -> start + (dx, dy) and report the first obstructed
    /// step. (0, 0) is never blocked.
    std::optional<Blocked> is_blocked_along(Pos start, i32 dx, i32 dy) const;

    /// First obstructed step along consecutive cells of path.
    std::optional<Blocked> path_blocked(const std::vector<Pos>& path) const;

    /// No occupied cell on line(start, end).
    bool path_clear_of_obstacles(Pos start, Pos end) const;

    // ---- Field of view ------------------------------------------------

    /// Line-walk visibility; see map/field_of_view.hpp.
    bool is_in_fov(Pos start, Pos end, i32 radius, bool crouching = false) const;

    /// is_in_fov restricted to the half-plane the observer faces.
    bool is_in_fov_direction(Pos start, Pos end, i32 radius, Direction facing) const;

    /// Shadow-cast buffer corroborated by a direct wall check. Recomputes
    /// the buffer when (start, radius) differs from the stored pair.
    bool is_in_fov_buffered(Pos start, Pos end, i32 radius);

    /// Recompute the visibility buffer for (pos, radius) and store the pair.
    void compute_fov(Pos pos, i32 radius);

    /// Update one cell's transparency in the buffer only.
    void set_cell(i32 x, i32 y, bool transparent);

    /// Re-sync buffer transparency from every tile's block_sight and
    /// recompute for the stored (pos, radius).
    void update_map();

    Pos fov_pos() const { return fov_pos_; }
    i32 fov_radius() const { return fov_radius_; }
    const VisibilityBuffer& visibility() const { return fov_; }

    // ---- Queries and edits --------------------------------------------

    /// Cells whose distance from center is < radius. Unordered, unique.
    std::vector<Pos> pos_in_radius(Pos center, i32 radius) const;

    /// True if any in-bounds 8-neighbour of pos has the given type.
    bool near_tile_type(Pos pos, TileType type) const;

    /// Fill a width x width square starting at start (clipped to bounds).
    std::vector<Pos> place_block(Pos start, i32 width, const Tile& tile);

    /// Write tile along line(start, end), clipped to bounds.
    std::vector<Pos> place_line(Pos start, Pos end, const Tile& tile);

private:
    size_t index(Pos pos) const {
        return static_cast<size_t>(pos.y) * static_cast<size_t>(width_) +
               static_cast<size_t>(pos.x);
    }

    /// Wall on the given edge, Empty when pos is out of range.
    Wall left_wall_at(Pos pos) const;
    Wall bottom_wall_at(Pos pos) const;

    i32 width_;
    i32 height_;
    std::vector<Tile> tiles_;

    VisibilityBuffer fov_;
    Pos fov_pos_{0, 0};
    i32 fov_radius_ = 1;
};

} // namespace tc::map
