#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace tc::map {

/// Integer grid coordinate. +y points down (row index).
struct Pos {
    i32 x = 0;
    i32 y = 0;

    Pos() = default;
    Pos(i32 x_, i32 y_) : x(x_), y(y_) {}

    bool operator==(const Pos& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Pos& o) const { return !(*this == o); }
    bool operator<(const Pos& o) const {
        return x < o.x || (x == o.x && y < o.y);
    }

    Pos operator+(const Pos& o) const { return {x + o.x, y + o.y}; }
    Pos operator-(const Pos& o) const { return {x - o.x, y - o.y}; }
};

struct PosHash {
    size_t operator()(const Pos& p) const {
        return std::hash<u64>()((static_cast<u64>(static_cast<u32>(p.x)) << 32) |
                                static_cast<u32>(p.y));
    }
};

/// Digital line from start to end. The start cell is excluded and the end
/// cell included, so line(p, p) is empty.
std::vector<Pos> line(Pos start, Pos end);

/// The first max_points cells of line(start, start + (dx, dy)). The walk
/// runs in 64-bit and stops early at the first cell a Pos cannot hold.
std::vector<Pos> line_towards(Pos start, i64 dx, i64 dy, size_t max_points);

/// Length of line(a, b); the grid's straight-line distance.
i32 distance(Pos a, Pos b);

/// -1, 0 or 1.
i32 signedness(i32 value);

inline Pos add_pos(Pos a, Pos b) { return a + b; }
inline Pos sub_pos(Pos a, Pos b) { return a - b; }
inline Pos move_x(Pos p, i32 dx) { return {p.x + dx, p.y}; }
inline Pos move_y(Pos p, i32 dy) { return {p.x, p.y + dy}; }

/// Position num_cells steps along line(start, end), or end if the line is
/// shorter than that.
Pos move_towards(Pos start, Pos end, size_t num_cells);

/// Last cell before end on line(start, end). Returns start when the two are
/// already adjacent or equal.
Pos move_next_to(Pos start, Pos end);

/// One step from start toward end on each axis.
Pos in_direction_of(Pos start, Pos end);

/// True when delta moves along exactly one axis.
bool is_ordinal(Pos delta);

/// pos + delta, extended one more cell along every non-zero axis.
Pos next_pos(Pos pos, Pos delta);

} // namespace tc::map
