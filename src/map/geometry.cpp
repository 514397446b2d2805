#include "map/geometry.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace tc::map {

std::vector<Pos> line(Pos start, Pos end) {
    return line_towards(start, static_cast<i64>(end.x) - start.x,
                        static_cast<i64>(end.y) - start.y, SIZE_MAX);
}

std::vector<Pos> line_towards(Pos start, i64 dx, i64 dy, size_t max_points) {
    std::vector<Pos> points;

    i64 x = start.x;
    i64 y = start.y;
    const i64 end_x = x + dx;
    const i64 end_y = y + dy;
    const i64 step_x = dx > 0 ? 1 : (dx < 0 ? -1 : 0);
    const i64 step_y = dy > 0 ? 1 : (dy < 0 ? -1 : 0);

    // Error term seeded with the major axis length, deltas doubled.
    i64 err = std::max(step_x * dx, step_y * dy);
    dx *= 2;
    dy *= 2;

    points.reserve(std::min(static_cast<size_t>(err), max_points));

    while (points.size() < max_points) {
        if (step_x * dx > step_y * dy) {
            if (x == end_x) break;
            x += step_x;
            err -= step_y * dy;
            if (err < 0) {
                y += step_y;
                err += step_x * dx;
            }
        } else {
            if (y == end_y) break;
            y += step_y;
            err -= step_x * dx;
            if (err < 0) {
                x += step_x;
                err += step_y * dy;
            }
        }
        if (x < INT32_MIN || x > INT32_MAX || y < INT32_MIN || y > INT32_MAX) {
            break;
        }
        points.push_back({static_cast<i32>(x), static_cast<i32>(y)});
    }

    return points;
}

i32 distance(Pos a, Pos b) {
    // Every step of line() advances the major axis by one cell.
    const i64 dx = std::abs(static_cast<i64>(b.x) - a.x);
    const i64 dy = std::abs(static_cast<i64>(b.y) - a.y);
    const i64 len = std::max(dx, dy);
    return static_cast<i32>(std::min<i64>(len, INT32_MAX));
}

i32 signedness(i32 value) {
    if (value > 0) return 1;
    if (value < 0) return -1;
    return 0;
}

Pos move_towards(Pos start, Pos end, size_t num_cells) {
    if (num_cells == 0) return start;
    auto points = line(start, end);
    if (num_cells > points.size()) return end;
    return points[num_cells - 1];
}

Pos move_next_to(Pos start, Pos end) {
    if (distance(start, end) <= 1) return start;

    auto points = line(start, end);
    return points[points.size() - 2];
}

Pos in_direction_of(Pos start, Pos end) {
    Pos d = end - start;
    return {start.x + signedness(d.x), start.y + signedness(d.y)};
}

bool is_ordinal(Pos delta) {
    return (delta.x == 0 && delta.y != 0) || (delta.y == 0 && delta.x != 0);
}

Pos next_pos(Pos pos, Pos delta) {
    Pos next = pos + delta;
    next.x += signedness(delta.x);
    next.y += signedness(delta.y);
    return next;
}

} // namespace tc::map
