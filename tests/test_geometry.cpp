#include <catch2/catch_test_macros.hpp>

#include "map/direction.hpp"
#include "map/geometry.hpp"

#include <string>
#include <vector>

using namespace tc;
using namespace tc::map;

// ================================================================
// Digital line and distance
// ================================================================

TEST_CASE("line excludes start and includes end", "[geometry]") {
    std::vector<Pos> expected = {Pos(1, 0), Pos(2, 1), Pos(3, 1)};
    CHECK(line(Pos(0, 0), Pos(3, 1)) == expected);
}

TEST_CASE("line to the same cell is empty", "[geometry]") {
    CHECK(line(Pos(4, 4), Pos(4, 4)).empty());
    CHECK(distance(Pos(4, 4), Pos(4, 4)) == 0);
}

TEST_CASE("line steps between 8-adjacent cells", "[geometry]") {
    Pos prev(2, 9);
    for (const Pos& p : line(prev, Pos(11, 3))) {
        CHECK(distance(prev, p) == 1);
        prev = p;
    }
    CHECK(prev == Pos(11, 3));
}

TEST_CASE("distance is the chessboard distance", "[geometry]") {
    CHECK(distance(Pos(0, 0), Pos(3, -7)) == 7);
    CHECK(distance(Pos(2, 2), Pos(5, 5)) == 3);
    CHECK(distance(Pos(5, 5), Pos(2, 2)) == 3);
    CHECK(distance(Pos(0, 0), Pos(1, 0)) == 1);
}

TEST_CASE("signedness", "[geometry]") {
    CHECK(signedness(12) == 1);
    CHECK(signedness(-3) == -1);
    CHECK(signedness(0) == 0);
}

// ================================================================
// Position helpers
// ================================================================

TEST_CASE("move_towards walks along the line", "[geometry]") {
    CHECK(move_towards(Pos(0, 0), Pos(5, 0), 2) == Pos(2, 0));
    CHECK(move_towards(Pos(0, 0), Pos(5, 0), 0) == Pos(0, 0));
    CHECK(move_towards(Pos(0, 0), Pos(5, 0), 50) == Pos(5, 0));
}

TEST_CASE("move_next_to stops one cell short", "[geometry]") {
    CHECK(move_next_to(Pos(0, 0), Pos(4, 0)) == Pos(3, 0));
    CHECK(move_next_to(Pos(0, 0), Pos(1, 1)) == Pos(0, 0));
    CHECK(move_next_to(Pos(3, 3), Pos(3, 3)) == Pos(3, 3));
}

TEST_CASE("in_direction_of takes one step per axis", "[geometry]") {
    CHECK(in_direction_of(Pos(3, 3), Pos(0, 9)) == Pos(2, 4));
    CHECK(in_direction_of(Pos(3, 3), Pos(3, 0)) == Pos(3, 2));
    CHECK(in_direction_of(Pos(3, 3), Pos(3, 3)) == Pos(3, 3));
}

TEST_CASE("is_ordinal and next_pos", "[geometry]") {
    CHECK(is_ordinal(Pos(0, 2)));
    CHECK(is_ordinal(Pos(-1, 0)));
    CHECK_FALSE(is_ordinal(Pos(1, 1)));
    CHECK_FALSE(is_ordinal(Pos(0, 0)));

    CHECK(next_pos(Pos(1, 1), Pos(2, 0)) == Pos(4, 1));
    CHECK(next_pos(Pos(1, 1), Pos(-1, -1)) == Pos(-1, -1));
}

TEST_CASE("add_pos, sub_pos, move_x, move_y", "[geometry]") {
    CHECK(add_pos(Pos(1, 2), Pos(3, 4)) == Pos(4, 6));
    CHECK(sub_pos(Pos(1, 2), Pos(3, 4)) == Pos(-2, -2));
    CHECK(move_x(Pos(1, 2), -1) == Pos(0, 2));
    CHECK(move_y(Pos(1, 2), 3) == Pos(1, 5));
}

// ================================================================
// Direction
// ================================================================

TEST_CASE("Direction from a signed step", "[geometry]") {
    CHECK(direction_from_dxy(5, -3) == Direction::UpRight);
    CHECK(direction_from_dxy(-1, 1) == Direction::DownLeft);
    CHECK(direction_from_dxy(-4, 0) == Direction::Left);
    CHECK(direction_from_dxy(1, 0) == Direction::Right);
    CHECK(direction_from_dxy(0, -2) == Direction::Up);
    CHECK(direction_from_dxy(0, 0) == Direction::Center);
}

TEST_CASE("Direction moves round-trip", "[geometry]") {
    for (Direction dir : move_actions()) {
        Pos step = direction_into_move(dir);
        CHECK(direction_from_dxy(step.x, step.y) == dir);
        CHECK(is_diagonal(dir) == (step.x != 0 && step.y != 0));
    }
    CHECK(move_actions().back() == Direction::Center);
    CHECK(std::string(direction_name(Direction::DownRight)) == "DownRight");
}
