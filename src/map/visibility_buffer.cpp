#include "map/visibility_buffer.hpp"

#include <algorithm>

namespace tc::map {

VisibilityBuffer::VisibilityBuffer(i32 width, i32 height)
    : width_(std::max(width, 1)), height_(std::max(height, 1)) {
    cells_.resize(static_cast<size_t>(width_) * static_cast<size_t>(height_),
                  CellFlag::Transparent);
}

void VisibilityBuffer::set_transparent(i32 x, i32 y, bool transparent) {
    if (!in_bounds(x, y)) return;
    auto& cell = cells_[index(x, y)];
    if (transparent) {
        cell |= CellFlag::Transparent;
    } else {
        cell &= ~CellFlag::Transparent;
    }
}

bool VisibilityBuffer::is_transparent(i32 x, i32 y) const {
    if (!in_bounds(x, y)) return false;
    return has_flag(cells_[index(x, y)], CellFlag::Transparent);
}

void VisibilityBuffer::clear_visible() {
    for (auto& cell : cells_) {
        cell &= ~CellFlag::Visible;
    }
}

bool VisibilityBuffer::is_visible(i32 x, i32 y) const {
    if (!in_bounds(x, y)) return false;
    return has_flag(cells_[index(x, y)], CellFlag::Visible);
}

u32 VisibilityBuffer::visible_count() const {
    return static_cast<u32>(std::count_if(
        cells_.begin(), cells_.end(),
        [](CellFlag c) { return has_flag(c, CellFlag::Visible); }));
}

void VisibilityBuffer::compute(i32 ox, i32 oy, i32 radius, bool light_walls) {
    clear_visible();
    if (!in_bounds(ox, oy)) return;

    cells_[index(ox, oy)] |= CellFlag::Visible;

    // No octant row past the larger dimension touches the grid.
    const i32 extent = std::max(width_, height_);
    const i32 max_rows = radius > 0 ? std::min(radius, extent) : extent;

    // Octant transforms: (xx, xy, yx, yy)
    static constexpr i32 octants[8][4] = {
        {1, 0, 0, 1},   {0, 1, 1, 0},   {0, -1, 1, 0},  {-1, 0, 0, 1},
        {-1, 0, 0, -1}, {0, -1, -1, 0}, {0, 1, -1, 0},  {1, 0, 0, -1},
    };

    for (auto& o : octants) {
        cast_octant(ox, oy, 1, 1.0, 0.0, max_rows, radius, light_walls,
                    o[0], o[1], o[2], o[3]);
    }
}

void VisibilityBuffer::cast_octant(i32 ox, i32 oy, i32 row, f64 start_slope,
                                   f64 end_slope, i32 max_rows, i32 radius,
                                   bool light_walls, i32 xx, i32 xy, i32 yx,
                                   i32 yy) {
    if (start_slope < end_slope) return;

    const i64 radius_sq = static_cast<i64>(radius) * radius;
    f64 next_start = start_slope;

    for (i32 j = row; j <= max_rows; ++j) {
        bool blocked = false;
        i32 dy = -j;

        for (i32 dx = -j; dx <= 0; ++dx) {
            // Slopes through the cell's far corners
            f64 l_slope = (dx - 0.5) / (dy + 0.5);
            f64 r_slope = (dx + 0.5) / (dy - 0.5);

            if (start_slope < r_slope) continue;
            if (end_slope > l_slope) break;

            i32 x = ox + dx * xx + dy * xy;
            i32 y = oy + dx * yx + dy * yy;
            bool transparent = is_transparent(x, y);

            i64 dist_sq = static_cast<i64>(dx) * dx + static_cast<i64>(dy) * dy;
            bool in_radius = radius <= 0 || dist_sq <= radius_sq;
            if (in_bounds(x, y) && in_radius && (light_walls || transparent)) {
                cells_[index(x, y)] |= CellFlag::Visible;
            }

            if (blocked) {
                if (!transparent) {
                    next_start = r_slope;
                    continue;
                }
                blocked = false;
                start_slope = next_start;
            } else if (!transparent && j < max_rows) {
                blocked = true;
                cast_octant(ox, oy, j + 1, start_slope, l_slope, max_rows,
                            radius, light_walls, xx, xy, yx, yy);
                next_start = r_slope;
            }
        }

        if (blocked) break;
    }
}

} // namespace tc::map
