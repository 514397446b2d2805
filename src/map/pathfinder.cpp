#include "map/pathfinder.hpp"
#include "map/tile_map.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <tuple>
#include <spdlog/spdlog.h>

namespace tc::map {

bool NeighborList::contains(Pos p) const {
    return std::find(begin(), end(), p) != end();
}

NeighborList reachable_neighbors(const TileMap& map, Pos pos) {
    static constexpr i32 dirs[8][2] = {
        {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1},
    };

    NeighborList result;
    for (auto& d : dirs) {
        if (!map.is_blocked_along(pos, d[0], d[1])) {
            result.push_back(Pos(pos.x + d[0], pos.y + d[1]));
        }
    }
    return result;
}

Pathfinder::Pathfinder(const TileMap& map, u32 max_nodes_explored)
    : map_(map), max_nodes_explored_(max_nodes_explored) {}

NeighborList Pathfinder::astar_neighbors(Pos start, Pos pos,
                                         std::optional<i32> max_radius) const {
    if (max_radius && distance(start, pos) > *max_radius) {
        return {};
    }
    return reachable_neighbors(map_, pos);
}

std::vector<Pos> Pathfinder::shortest_path(Pos start, Pos goal,
                                           std::optional<i32> max_radius,
                                           const CostFn& cost_fn) const {
    spdlog::trace("Pathfinder: A* from ({},{}) to ({},{})",
                  start.x, start.y, goal.x, goal.y);

    if (start == goal) return {start};

    if (!map_.is_within_bounds(start) || !map_.is_within_bounds(goal)) {
        spdlog::debug("Pathfinder: endpoint out of range ({},{}) -> ({},{})",
                      start.x, start.y, goal.x, goal.y);
        return {};
    }

    const i32 w = map_.width();
    const size_t total = static_cast<size_t>(w) * static_cast<size_t>(map_.height());
    constexpr i32 UNVISITED = std::numeric_limits<i32>::max();
    constexpr size_t NO_PARENT = std::numeric_limits<size_t>::max();

    auto idx = [w](Pos p) -> size_t {
        return static_cast<size_t>(p.y) * static_cast<size_t>(w) +
               static_cast<size_t>(p.x);
    };
    auto pos_of = [w](size_t i) -> Pos {
        return Pos(static_cast<i32>(i % static_cast<size_t>(w)),
                   static_cast<i32>(i / static_cast<size_t>(w)));
    };

    std::vector<i32> g_cost(total, UNVISITED);
    std::vector<size_t> parent(total, NO_PARENT);
    std::vector<bool> closed(total, false);

    // (f_cost, h_cost, node_index); ties prefer nodes nearer the goal
    using PQEntry = std::tuple<i32, i32, size_t>;
    std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>> open;

    const size_t start_idx = idx(start);
    const size_t goal_idx = idx(goal);
    g_cost[start_idx] = 0;
    i32 h_start = distance(start, goal);
    open.push({h_start, h_start, start_idx});

    u32 nodes_explored = 0;
    bool found = false;

    while (!open.empty()) {
        auto [f, h, cur_idx] = open.top();
        open.pop();

        if (cur_idx == goal_idx) {
            found = true;
            break;
        }

        if (closed[cur_idx]) continue;
        closed[cur_idx] = true;

        if (max_nodes_explored_ > 0 && ++nodes_explored > max_nodes_explored_) {
            spdlog::debug("Pathfinder: A* hit search limit ({} nodes)",
                          max_nodes_explored_);
            return {};
        }

        const Pos cur = pos_of(cur_idx);
        for (const Pos& next : astar_neighbors(start, cur, max_radius)) {
            const size_t n_idx = idx(next);
            if (closed[n_idx]) continue;

            i32 step = cost_fn ? cost_fn(cur, next, map_) : 1;
            i32 new_g = g_cost[cur_idx] + step;

            if (new_g < g_cost[n_idx]) {
                g_cost[n_idx] = new_g;
                parent[n_idx] = cur_idx;
                i32 h_next = distance(next, goal);
                open.push({new_g + h_next, h_next, n_idx});
            }
        }
    }

    if (!found) {
        spdlog::debug("Pathfinder: A* found no path from ({},{}) to ({},{})",
                      start.x, start.y, goal.x, goal.y);
        return {};
    }

    std::vector<Pos> path;
    for (size_t cur = goal_idx; cur != NO_PARENT; cur = parent[cur]) {
        path.push_back(pos_of(cur));
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<Pos> Pathfinder::flood_fill(Pos origin, i32 radius) const {
    std::vector<Pos> flood;
    flood.push_back(origin);

    if (!map_.is_within_bounds(origin) || radius <= 0) return flood;

    const i32 w = map_.width();
    std::vector<bool> seen(
        static_cast<size_t>(w) * static_cast<size_t>(map_.height()), false);
    auto idx = [w](Pos p) -> size_t {
        return static_cast<size_t>(p.y) * static_cast<size_t>(w) +
               static_cast<size_t>(p.x);
    };

    seen[idx(origin)] = true;
    std::vector<Pos> current{origin};
    std::vector<Pos> next;

    for (i32 hop = 0; hop < radius && !current.empty(); ++hop) {
        next.clear();
        for (const Pos& pos : current) {
            for (const Pos& n : astar_neighbors(origin, pos, radius)) {
                if (seen[idx(n)]) continue;
                seen[idx(n)] = true;
                next.push_back(n);
                flood.push_back(n);
            }
        }
        std::swap(current, next);
    }

    return flood;
}

} // namespace tc::map
