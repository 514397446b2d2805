#include "map/tile_map.hpp"
#include "map/field_of_view.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace tc::map {

TileMap::TileMap(i32 width, i32 height)
    : width_(std::max(width, 1)),
      height_(std::max(height, 1)),
      fov_(width_, height_) {
    tiles_.resize(static_cast<size_t>(width_) * static_cast<size_t>(height_),
                  Tile::empty());
    update_map();
}

TileMap TileMap::from_columns(const std::vector<std::vector<Tile>>& columns) {
    if (columns.empty() || columns[0].empty()) {
        throw std::invalid_argument("TileMap::from_columns: empty tile grid");
    }

    const auto width = static_cast<i32>(columns.size());
    const auto height = static_cast<i32>(columns[0].size());

    TileMap map(width, height);
    for (i32 x = 0; x < width; ++x) {
        const auto& column = columns[static_cast<size_t>(x)];
        if (static_cast<i32>(column.size()) != height) {
            throw std::invalid_argument(
                "TileMap::from_columns: column " + std::to_string(x) +
                " has " + std::to_string(column.size()) + " tiles, expected " +
                std::to_string(height));
        }
        for (i32 y = 0; y < height; ++y) {
            map.at(x, y) = column[static_cast<size_t>(y)];
        }
    }

    map.update_map();
    return map;
}

Tile* TileMap::tile_at(Pos pos) {
    if (!is_within_bounds(pos)) return nullptr;
    return &tiles_[index(pos)];
}

const Tile* TileMap::tile_at(Pos pos) const {
    if (!is_within_bounds(pos)) return nullptr;
    return &tiles_[index(pos)];
}

bool TileMap::is_empty(Pos pos) const {
    const Tile* tile = tile_at(pos);
    return tile && tile->tile_type == TileType::Empty;
}

Wall TileMap::left_wall_at(Pos pos) const {
    const Tile* tile = tile_at(pos);
    return tile ? tile->left_wall : Wall::Empty;
}

Wall TileMap::bottom_wall_at(Pos pos) const {
    const Tile* tile = tile_at(pos);
    return tile ? tile->bottom_wall : Wall::Empty;
}

// ================================================================
// Edge predicates
// ================================================================

bool TileMap::blocked_left(Pos pos) const {
    Pos offset = move_x(pos, -1);
    if (!is_within_bounds(offset) || !is_within_bounds(pos)) return true;

    return (*this)[pos].left_wall != Wall::Empty || (*this)[offset].blocked;
}

bool TileMap::blocked_right(Pos pos) const {
    Pos offset = move_x(pos, 1);
    if (!is_within_bounds(offset) || !is_within_bounds(pos)) return true;

    return (*this)[offset].left_wall != Wall::Empty || (*this)[offset].blocked;
}

bool TileMap::blocked_down(Pos pos) const {
    Pos offset = move_y(pos, 1);
    if (!is_within_bounds(offset) || !is_within_bounds(pos)) return true;

    return (*this)[pos].bottom_wall != Wall::Empty || (*this)[offset].blocked;
}

bool TileMap::blocked_up(Pos pos) const {
    Pos offset = move_y(pos, -1);
    if (!is_within_bounds(offset) || !is_within_bounds(pos)) return true;

    return (*this)[offset].bottom_wall != Wall::Empty || (*this)[offset].blocked;
}

// ================================================================
// Movement blocking
// ================================================================

std::optional<Blocked> TileMap::move_blocked(Pos pos, Pos next_pos) const {
    if (distance(pos, next_pos) != 1) {
        throw std::logic_error(
            "move_blocked: cells (" + std::to_string(pos.x) + "," +
            std::to_string(pos.y) + ") and (" + std::to_string(next_pos.x) +
            "," + std::to_string(next_pos.y) + ") are not adjacent");
    }

    const Pos delta = next_pos - pos;
    const Direction dir = direction_from_dxy(delta.x, delta.y);

    Blocked blocked;
    blocked.start_pos = pos;
    blocked.end_pos = next_pos;
    blocked.direction = dir;

    // Every sub-check runs even after one fires so a later one can refine
    // wall_type. found_blocker alone decides the result.
    bool found_blocker = false;

    // Nothing beyond the edge of the map can be inspected.
    if (!is_within_bounds(next_pos)) {
        blocked.blocked_tile = true;
        return blocked;
    }

    if ((*this)[next_pos].blocked) {
        blocked.blocked_tile = true;
        found_blocker = true;
    }

    const Pos x_moved(next_pos.x, pos.y);
    const Pos y_moved(pos.x, next_pos.y);

    switch (dir) {
    case Direction::Left:
    case Direction::Right: {
        Pos left_wall_pos = delta.x >= 1 ? move_x(pos, delta.x) : pos;
        if (left_wall_at(left_wall_pos) != Wall::Empty) {
            blocked.wall_type = left_wall_at(left_wall_pos);
            found_blocker = true;
        }
        break;
    }

    case Direction::Up:
    case Direction::Down: {
        Pos bottom_wall_pos = delta.y >= 1 ? pos : move_y(pos, delta.y);
        if (bottom_wall_at(bottom_wall_pos) != Wall::Empty) {
            blocked.wall_type = bottom_wall_at(bottom_wall_pos);
            found_blocker = true;
        }
        break;
    }

    case Direction::DownRight: {
        if (blocked_right(pos) && blocked_down(pos)) {
            blocked.wall_type = bottom_wall_at(pos);
            found_blocker = true;
        }

        if (blocked_right(move_y(pos, -1)) && blocked_down(move_x(pos, 1))) {
            Pos blocked_pos = pos + Pos(-1, 1);
            if (is_within_bounds(blocked_pos)) {
                blocked.wall_type = bottom_wall_at(blocked_pos);
            }
            found_blocker = true;
        }

        if (blocked_right(pos) && blocked_right(y_moved)) {
            blocked.wall_type = left_wall_at(move_x(pos, 1));
            found_blocker = true;
        }

        if (blocked_down(pos) && blocked_down(x_moved)) {
            blocked.wall_type = bottom_wall_at(pos);
            found_blocker = true;
        }
        break;
    }

    case Direction::UpRight: {
        if (blocked_up(pos) && blocked_right(pos)) {
            blocked.wall_type = bottom_wall_at(move_y(pos, -1));
            found_blocker = true;
        }

        if (blocked_up(move_x(pos, 1)) && blocked_right(move_y(pos, -1))) {
            Pos blocked_pos = pos + Pos(1, -1);
            if (is_within_bounds(blocked_pos)) {
                blocked.wall_type = bottom_wall_at(blocked_pos);
            }
            found_blocker = true;
        }

        if (blocked_right(pos) && blocked_right(y_moved)) {
            blocked.wall_type = left_wall_at(move_x(pos, 1));
            found_blocker = true;
        }

        if (blocked_up(pos) && blocked_up(x_moved)) {
            blocked.wall_type = bottom_wall_at(move_y(pos, -1));
            found_blocker = true;
        }
        break;
    }

    case Direction::DownLeft: {
        if (blocked_left(pos) && blocked_down(pos)) {
            blocked.wall_type = left_wall_at(pos);
            found_blocker = true;
        }

        if (blocked_left(move_y(pos, 1)) && blocked_down(move_x(pos, -1))) {
            Pos blocked_pos = pos + Pos(1, -1);
            if (is_within_bounds(blocked_pos)) {
                blocked.wall_type = left_wall_at(blocked_pos);
            }
            found_blocker = true;
        }

        if (blocked_left(pos) && blocked_left(y_moved)) {
            blocked.wall_type = left_wall_at(pos);
            found_blocker = true;
        }

        if (blocked_down(pos) && blocked_down(x_moved)) {
            blocked.wall_type = bottom_wall_at(pos);
            found_blocker = true;
        }
        break;
    }

    case Direction::UpLeft: {
        if (blocked_left(move_y(pos, -1)) && blocked_up(move_x(pos, -1))) {
            Pos blocked_pos = pos + Pos(-1, -1);
            if (is_within_bounds(blocked_pos)) {
                blocked.wall_type = left_wall_at(blocked_pos);
            }
            found_blocker = true;
        }

        if (blocked_left(pos) && blocked_up(pos)) {
            blocked.wall_type = left_wall_at(pos);
            found_blocker = true;
        }

        if (blocked_left(pos) && blocked_left(y_moved)) {
            blocked.wall_type = left_wall_at(pos);
            found_blocker = true;
        }

        if (blocked_up(pos) && blocked_up(x_moved)) {
            Pos blocked_pos = move_y(pos, -1);
            if (is_within_bounds(blocked_pos)) {
                blocked.wall_type = bottom_wall_at(blocked_pos);
            }
            found_blocker = true;
        }
        break;
    }

    case Direction::Center:
        throw std::logic_error("move_blocked: no movement between cells");
    }

    if (found_blocker) return blocked;
    return std::nullopt;
}

std::optional<Blocked> TileMap::is_blocked_along(Pos start, i32 dx, i32 dy) const {
    if (dx == 0 && dy == 0) return std::nullopt;

    // The first step that leaves the map is blocked, so no walk needs more
    // cells than the map is wide or tall, plus the steps onto and off it.
    const size_t max_steps =
        static_cast<size_t>(std::max(width_, height_)) + 2;

    std::vector<Pos> path;
    path.push_back(start);
    auto rest = line_towards(start, dx, dy, max_steps);
    if (rest.empty()) {
        // The first step leaves the coordinate range, so it leaves the map.
        Blocked off_map;
        off_map.start_pos = start;
        off_map.end_pos = start;
        off_map.blocked_tile = true;
        return off_map;
    }
    path.insert(path.end(), rest.begin(), rest.end());

    return path_blocked(path);
}

std::optional<Blocked> TileMap::path_blocked(const std::vector<Pos>& path) const {
    for (size_t i = 1; i < path.size(); ++i) {
        auto blocked = move_blocked(path[i - 1], path[i]);
        if (blocked) return blocked;
    }
    return std::nullopt;
}

bool TileMap::path_clear_of_obstacles(Pos start, Pos end) const {
    for (const auto& p : line(start, end)) {
        const Tile* tile = tile_at(p);
        if (!tile || tile->blocked) return false;
    }
    return true;
}

// ================================================================
// Field of view
// ================================================================

bool TileMap::is_in_fov(Pos start, Pos end, i32 radius, bool crouching) const {
    return is_in_fov_lines(*this, start, end, radius, crouching);
}

bool TileMap::is_in_fov_direction(Pos start, Pos end, i32 radius,
                                  Direction facing) const {
    if (start == end) return true;
    if (!is_in_fov(start, end, radius)) return false;

    const Pos diff = end - start;
    const i32 x_sig = signedness(diff.x);
    const i32 y_sig = signedness(diff.y);

    switch (facing) {
    case Direction::Up: return y_sig < 1;
    case Direction::Down: return y_sig > -1;
    case Direction::Left: return x_sig < 1;
    case Direction::Right: return x_sig > -1;
    case Direction::DownLeft: return diff.x - diff.y < 0;
    case Direction::DownRight: return diff.x + diff.y >= 0;
    case Direction::UpLeft: return diff.x + diff.y <= 0;
    case Direction::UpRight: return diff.x - diff.y > 0;
    case Direction::Center: return false;
    }
    return false;
}

bool TileMap::is_in_fov_buffered(Pos start, Pos end, i32 radius) {
    if (start == end) return true;
    if (!is_within_bounds(start) || !is_within_bounds(end)) return false;
    if (distance(start, end) >= radius) return false;

    if (fov_pos_ != start || fov_radius_ != radius) {
        compute_fov(start, radius);
    }

    const Pos offset = end - start;
    bool blocked_by_wall = false;
    if (auto blocked = is_blocked_along(start, offset.x, offset.y)) {
        // The face of a sight-blocking target is seen from the near side.
        bool wall_face = blocked->end_pos == end && (*this)[end].block_sight;
        blocked_by_wall = !wall_face;
    }

    return !blocked_by_wall && fov_.is_visible(end.x, end.y);
}

void TileMap::compute_fov(Pos pos, i32 radius) {
    fov_pos_ = pos;
    fov_radius_ = radius;
    fov_.compute(pos.x, pos.y, radius, true);
    spdlog::trace("TileMap: fov recomputed at ({},{}) r={} ({} cells lit)",
                  pos.x, pos.y, radius, fov_.visible_count());
}

void TileMap::set_cell(i32 x, i32 y, bool transparent) {
    fov_.set_transparent(x, y, transparent);
}

void TileMap::update_map() {
    for (i32 y = 0; y < height_; ++y) {
        for (i32 x = 0; x < width_; ++x) {
            fov_.set_transparent(x, y, !at(x, y).block_sight);
        }
    }
    compute_fov(fov_pos_, fov_radius_);
}

// ================================================================
// Queries and edits
// ================================================================

std::vector<Pos> TileMap::pos_in_radius(Pos center, i32 radius) const {
    std::vector<Pos> result;
    if (radius <= 0) return result;

    std::unordered_set<Pos, PosHash> seen;

    // Rasterize toward every cell of the half-open square around center.
    // line() drops its start, so center itself is never reported.
    for (i32 x = center.x - radius; x < center.x + radius; ++x) {
        for (i32 y = center.y - radius; y < center.y + radius; ++y) {
            for (const auto& p : line(center, Pos(x, y))) {
                if (distance(center, p) < radius && seen.insert(p).second) {
                    result.push_back(p);
                }
            }
        }
    }

    return result;
}

bool TileMap::near_tile_type(Pos pos, TileType type) const {
    static constexpr i32 offsets[8][2] = {
        {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1},
    };

    for (auto& o : offsets) {
        const Tile* tile = tile_at(Pos(pos.x + o[0], pos.y + o[1]));
        if (tile && tile->tile_type == type) return true;
    }
    return false;
}

std::vector<Pos> TileMap::place_block(Pos start, i32 width, const Tile& tile) {
    std::vector<Pos> positions;
    if (width <= 0) return positions;

    const i64 x_end = std::min<i64>(static_cast<i64>(start.x) + width, width_);
    const i64 y_end = std::min<i64>(static_cast<i64>(start.y) + width, height_);
    for (i64 x = std::max<i64>(start.x, 0); x < x_end; ++x) {
        for (i64 y = std::max<i64>(start.y, 0); y < y_end; ++y) {
            Pos p(static_cast<i32>(x), static_cast<i32>(y));
            at(p.x, p.y) = tile;
            positions.push_back(p);
        }
    }
    return positions;
}

std::vector<Pos> TileMap::place_line(Pos start, Pos end, const Tile& tile) {
    std::vector<Pos> positions;
    for (const auto& p : line(start, end)) {
        if (Tile* t = tile_at(p)) {
            *t = tile;
            positions.push_back(p);
        }
    }
    return positions;
}

} // namespace tc::map
