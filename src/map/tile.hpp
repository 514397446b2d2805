#pragma once

#include "core/types.hpp"

namespace tc::map {

enum class TileType : u8 {
    Empty,
    ShortWall,
    Wall,
    Water,
    Exit,
};

/// Edge wall state. Ordered: Empty < ShortWall < TallWall.
enum class Wall : u8 {
    Empty     = 0, // passable, no effect on sight
    ShortWall = 1, // blocks entry, can be seen over at a cost
    TallWall  = 2, // blocks entry and sight
};

inline bool no_wall(Wall w) { return w == Wall::Empty; }

enum class Surface : u8 {
    Floor,
    Rubble,
    Grass,
};

const char* tile_type_name(TileType type);
const char* wall_name(Wall wall);
const char* surface_name(Surface surface);

/// One grid cell.
///
/// bottom_wall is the edge between (x, y) and (x, y + 1); left_wall is the
/// edge between (x, y) and (x - 1, y). The top and right edges belong to the
/// neighbouring cells.
struct Tile {
    bool blocked = false;
    bool block_sight = false;
    bool explored = false;
    TileType tile_type = TileType::Empty;
    Wall bottom_wall = Wall::Empty;
    Wall left_wall = Wall::Empty;
    char glyph = ' ';
    Surface surface = Surface::Floor;

    static Tile empty();
    static Tile water();
    static Tile wall(char glyph = ' ');
    static Tile short_wall(char glyph = ' ');
    static Tile exit();

    bool operator==(const Tile& o) const;
    bool operator!=(const Tile& o) const { return !(*this == o); }
};

} // namespace tc::map
