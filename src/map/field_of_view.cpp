#include "map/field_of_view.hpp"
#include "map/tile_map.hpp"

#include <vector>

namespace tc::map {

Pos fov_line(const TileMap& map, Pos start, Pos end, i32 max_dist,
             bool crouching) {
    Pos current = start;
    i32 effective_dist = 0;

    while (current != end) {
        const Pos offset = end - current;
        auto blocked = map.is_blocked_along(current, offset.x, offset.y);

        if (!blocked) {
            if (effective_dist + distance(current, end) > max_dist) break;
            current = end;
            break;
        }

        bool peek = !crouching && !blocked->blocked_tile &&
                    blocked->wall_type == Wall::ShortWall;
        if (!peek) {
            return blocked->start_pos;
        }

        i32 cost = distance(current, blocked->end_pos) + SHORT_WALL_PEEK_COST;
        if (effective_dist + cost > max_dist) {
            return blocked->start_pos;
        }

        effective_dist += cost;
        current = blocked->end_pos;
    }

    return current;
}

bool needs_culling(const TileMap& map, Pos start, Pos end, i32 radius,
                   bool crouching) {
    auto direct = line(start, end);
    const size_t len = direct.size();
    if (len < 3) return false;

    const Pos next_to_last = direct[len - 2];
    return !is_in_fov_lines(map, start, next_to_last, radius, crouching);
}

bool is_in_fov_lines(const TileMap& map, Pos start, Pos end, i32 radius,
                     bool crouching) {
    if (start == end) return true;

    if (!map.is_within_bounds(start) || !map.is_within_bounds(end)) {
        return false;
    }

    if (distance(start, end) >= radius) return false;

    const Pos fov_end = fov_line(map, start, end, radius, crouching);

    bool visible;
    if (fov_end == end) {
        visible = true;
    } else {
        const bool visible_back =
            fov_line(map, end, start, radius, crouching) == start;
        const bool at_end = distance(fov_end, end) == 1;
        visible = visible_back || (at_end && map[end].block_sight);
    }

    if (visible) {
        visible = !(needs_culling(map, start, end, radius, crouching) ||
                    needs_culling(map, end, start, radius, crouching));
    }

    return visible;
}

} // namespace tc::map
