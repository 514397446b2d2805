#include "map/aoe.hpp"
#include "map/pathfinder.hpp"
#include "map/tile_map.hpp"

#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

namespace tc::map {

const char* aoe_effect_name(AoeEffect effect) {
    switch (effect) {
    case AoeEffect::Sound: return "Sound";
    }
    return "Unknown";
}

std::vector<Pos> Aoe::positions() const {
    std::vector<Pos> result;
    for (const auto& ring : rings) {
        result.insert(result.end(), ring.begin(), ring.end());
    }
    return result;
}

Aoe aoe_fill(const TileMap& map, AoeEffect effect, Pos origin, i32 radius) {
    radius = std::max(radius, 0);

    Aoe aoe;
    aoe.effect = effect;

    const i32 blocked_radius = radius > 2 ? radius - 2 : 0;

    // The fill is bounded by the map, so the rings are sized by the
    // farthest cell kept rather than by the requested radius.
    std::vector<std::pair<Pos, i32>> kept;
    i32 max_dist = 0;
    Pathfinder pathfinder(map);
    for (const Pos& pos : pathfinder.flood_fill(origin, radius)) {
        const i32 dist = distance(origin, pos);

        // Dampened only when obstructed both ways.
        const Pos to = pos - origin;
        const Pos from = origin - pos;
        const bool blocked_to = map.is_blocked_along(origin, to.x, to.y).has_value();
        const bool blocked_from = map.is_blocked_along(pos, from.x, from.y).has_value();
        const bool blocked = blocked_to && blocked_from;

        if (blocked && dist > blocked_radius) continue;

        kept.emplace_back(pos, dist);
        max_dist = std::max(max_dist, dist);
    }

    aoe.rings.resize(static_cast<size_t>(max_dist) + 1);
    for (const auto& [pos, dist] : kept) {
        aoe.rings[static_cast<size_t>(dist)].push_back(pos);
    }
    const size_t covered = kept.size();

    spdlog::trace("aoe_fill: {} at ({},{}) r={} covers {} cells",
                  aoe_effect_name(effect), origin.x, origin.y, radius,
                  covered);
    return aoe;
}

} // namespace tc::map
