#include "map/tile.hpp"

namespace tc::map {

const char* tile_type_name(TileType type) {
    switch (type) {
    case TileType::Empty: return "Empty";
    case TileType::ShortWall: return "ShortWall";
    case TileType::Wall: return "Wall";
    case TileType::Water: return "Water";
    case TileType::Exit: return "Exit";
    }
    return "Unknown";
}

const char* wall_name(Wall wall) {
    switch (wall) {
    case Wall::Empty: return "empty";
    case Wall::ShortWall: return "short";
    case Wall::TallWall: return "tall";
    }
    return "unknown";
}

const char* surface_name(Surface surface) {
    switch (surface) {
    case Surface::Floor: return "Floor";
    case Surface::Rubble: return "Rubble";
    case Surface::Grass: return "Grass";
    }
    return "Unknown";
}

Tile Tile::empty() {
    return Tile{};
}

Tile Tile::water() {
    Tile t;
    t.blocked = true;
    t.tile_type = TileType::Water;
    return t;
}

Tile Tile::wall(char glyph) {
    Tile t;
    t.blocked = true;
    t.block_sight = true;
    t.tile_type = TileType::Wall;
    t.glyph = glyph;
    return t;
}

Tile Tile::short_wall(char glyph) {
    Tile t;
    t.blocked = true;
    t.tile_type = TileType::ShortWall;
    t.glyph = glyph;
    return t;
}

Tile Tile::exit() {
    Tile t;
    t.tile_type = TileType::Exit;
    return t;
}

bool Tile::operator==(const Tile& o) const {
    return blocked == o.blocked && block_sight == o.block_sight &&
           explored == o.explored && tile_type == o.tile_type &&
           bottom_wall == o.bottom_wall && left_wall == o.left_wall &&
           glyph == o.glyph && surface == o.surface;
}

} // namespace tc::map
