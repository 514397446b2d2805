#pragma once

#include "core/types.hpp"
#include "map/geometry.hpp"

#include <array>
#include <functional>
#include <optional>
#include <vector>

namespace tc::map {

class TileMap;

/// Up to eight neighbour cells held inline.
class NeighborList {
public:
    void push_back(Pos p) { items_[count_++] = p; }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    const Pos& operator[](size_t i) const { return items_[i]; }

    const Pos* begin() const { return items_.data(); }
    const Pos* end() const { return items_.data() + count_; }

    bool contains(Pos p) const;

private:
    std::array<Pos, 8> items_{};
    size_t count_ = 0;
};

/// Cells reachable from pos by one unobstructed step, in the order
/// E, SE, S, SW, W, NW, N, NE.
NeighborList reachable_neighbors(const TileMap& map, Pos pos);

class Pathfinder {
public:
    /// Cost of stepping from one cell to an adjacent one.
    using CostFn = std::function<i32(Pos from, Pos to, const TileMap& map)>;

    /// max_nodes_explored caps A* expansions; 0 leaves the search unbounded.
    explicit Pathfinder(const TileMap& map, u32 max_nodes_explored = 0);

    /// A* over the movement-blocking graph. Steps cost 1 unless cost_fn is
    /// given; the heuristic is distance() to goal. With max_radius set, cells
    /// farther than max_radius from start are not expanded. Returns the
    /// cells from start to goal inclusive, {start} when start == goal, and
    /// an empty vector when no path exists.
    std::vector<Pos> shortest_path(Pos start, Pos goal,
                                   std::optional<i32> max_radius = std::nullopt,
                                   const CostFn& cost_fn = nullptr) const;

    /// Breadth-first expansion up to radius hops. Includes origin, each cell
    /// once, in discovery order.
    std::vector<Pos> flood_fill(Pos origin, i32 radius) const;

    /// Search successors of pos: its reachable neighbours, or nothing when
    /// pos lies beyond max_radius from start.
    NeighborList astar_neighbors(Pos start, Pos pos,
                                 std::optional<i32> max_radius) const;

private:
    const TileMap& map_;
    u32 max_nodes_explored_;
};

} // namespace tc::map
