#pragma once

#include "core/types.hpp"
#include "map/geometry.hpp"

#include <vector>

namespace tc::map {

class TileMap;

enum class AoeEffect : u8 {
    Sound,
};

const char* aoe_effect_name(AoeEffect effect);

/// Cells covered by one effect, bucketed by distance from the origin.
/// rings[d] holds the cells at distance d; rings[0] is the origin. The last
/// ring is the farthest one reached, which may be short of the radius.
struct Aoe {
    AoeEffect effect = AoeEffect::Sound;
    std::vector<std::vector<Pos>> rings;

    /// All cells, ring by ring.
    std::vector<Pos> positions() const;
};

/// Flood fill radius hops from origin and bucket the result by distance().
/// Cells separated from the origin by an obstruction in both directions are
/// dropped beyond radius - 2 (clamped at 0).
Aoe aoe_fill(const TileMap& map, AoeEffect effect, Pos origin, i32 radius);

} // namespace tc::map
