#include "map/direction.hpp"

namespace tc::map {

Direction direction_from_dxy(i32 dx, i32 dy) {
    dx = signedness(dx);
    dy = signedness(dy);

    if (dx == 0 && dy == 0) return Direction::Center;
    if (dx == 0) return dy < 0 ? Direction::Up : Direction::Down;
    if (dy == 0) return dx < 0 ? Direction::Left : Direction::Right;
    if (dx > 0) return dy > 0 ? Direction::DownRight : Direction::UpRight;
    return dy > 0 ? Direction::DownLeft : Direction::UpLeft;
}

Pos direction_into_move(Direction dir) {
    switch (dir) {
    case Direction::Left: return {-1, 0};
    case Direction::Right: return {1, 0};
    case Direction::Up: return {0, -1};
    case Direction::Down: return {0, 1};
    case Direction::DownLeft: return {-1, 1};
    case Direction::DownRight: return {1, 1};
    case Direction::UpLeft: return {-1, -1};
    case Direction::UpRight: return {1, -1};
    case Direction::Center: return {0, 0};
    }
    return {0, 0};
}

bool is_diagonal(Direction dir) {
    return dir == Direction::DownLeft || dir == Direction::DownRight ||
           dir == Direction::UpLeft || dir == Direction::UpRight;
}

const char* direction_name(Direction dir) {
    switch (dir) {
    case Direction::Left: return "Left";
    case Direction::Right: return "Right";
    case Direction::Up: return "Up";
    case Direction::Down: return "Down";
    case Direction::DownLeft: return "DownLeft";
    case Direction::DownRight: return "DownRight";
    case Direction::UpLeft: return "UpLeft";
    case Direction::UpRight: return "UpRight";
    case Direction::Center: return "Center";
    }
    return "Unknown";
}

const std::array<Direction, 9>& move_actions() {
    static const std::array<Direction, 9> actions = {
        Direction::Left,     Direction::Right,     Direction::Up,
        Direction::Down,     Direction::DownLeft,  Direction::DownRight,
        Direction::UpLeft,   Direction::UpRight,   Direction::Center,
    };
    return actions;
}

} // namespace tc::map
