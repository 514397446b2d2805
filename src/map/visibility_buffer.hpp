#pragma once

#include "core/types.hpp"

#include <vector>

namespace tc::map {

/// Per-cell state bits of the shadow-cast buffer.
enum class CellFlag : u8 {
    None        = 0,
    Transparent = 1 << 0, // light passes through the cell
    Visible     = 1 << 1, // lit by the last compute()
};

inline CellFlag operator|(CellFlag a, CellFlag b) {
    return static_cast<CellFlag>(static_cast<u8>(a) | static_cast<u8>(b));
}
inline CellFlag operator&(CellFlag a, CellFlag b) {
    return static_cast<CellFlag>(static_cast<u8>(a) & static_cast<u8>(b));
}
inline CellFlag operator~(CellFlag a) {
    return static_cast<CellFlag>(~static_cast<u8>(a));
}
inline CellFlag& operator|=(CellFlag& a, CellFlag b) {
    a = a | b;
    return a;
}
inline CellFlag& operator&=(CellFlag& a, CellFlag b) {
    a = a & b;
    return a;
}
inline bool has_flag(CellFlag flags, CellFlag test) {
    return (static_cast<u8>(flags) & static_cast<u8>(test)) != 0;
}

/// Recursive shadow-casting field of view over a transparency grid.
/// Knows nothing about tiles or edge walls; the owner syncs transparency.
class VisibilityBuffer {
public:
    VisibilityBuffer(i32 width, i32 height);

    i32 width() const { return width_; }
    i32 height() const { return height_; }

    /// Out-of-range writes are ignored.
    void set_transparent(i32 x, i32 y, bool transparent);
    bool is_transparent(i32 x, i32 y) const;

    /// Clear Visible on every cell, keep transparency.
    void clear_visible();

    /// Light every cell seen from (ox, oy) within a Euclidean radius
    /// (radius <= 0 means unbounded). Opaque cells on the boundary of the
    /// lit area are marked visible when light_walls is set.
    void compute(i32 ox, i32 oy, i32 radius, bool light_walls = true);

    /// False for out-of-range cells.
    bool is_visible(i32 x, i32 y) const;

    /// Number of cells lit by the last compute().
    u32 visible_count() const;

private:
    bool in_bounds(i32 x, i32 y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    size_t index(i32 x, i32 y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) +
               static_cast<size_t>(x);
    }

    /// Scan one octant row by row; (xx, xy, yx, yy) maps octant-local
    /// coordinates to grid offsets.
    void cast_octant(i32 ox, i32 oy, i32 row, f64 start_slope, f64 end_slope,
                     i32 max_rows, i32 radius, bool light_walls,
                     i32 xx, i32 xy, i32 yx, i32 yy);

    i32 width_;
    i32 height_;
    std::vector<CellFlag> cells_; // [y * width_ + x]
};

} // namespace tc::map
