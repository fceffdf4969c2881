//------------------------------------------------------------------------------
//
//   Copyright 2018-2019 Fetch.AI Limited
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//       http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
//
//------------------------------------------------------------------------------

#define CATCH_CONFIG_MAIN // This tells Catch to provide a main() - only do this in one cpp file
#include <catch2/catch.hpp>
#include "geometry.hpp"
#include "maze_grid.hpp"

using namespace mcc::maze;

namespace Test {

  TEST_CASE("points and walls", "[geometry]") {
    REQUIRE(Point(3, 4) == Point(3, 4));
    REQUIRE(Point(3, 4) != Point(4, 3));
    REQUIRE(manhattanDistance(Point{0, 0}, Point{3, -4}) == 7);
    Wall horizontal{0, 10, 30, 10};
    Wall vertical{10, 0, 10, 20};
    REQUIRE(horizontal.isHorizontal());
    REQUIRE_FALSE(horizontal.isVertical());
    REQUIRE(vertical.isVertical());
    REQUIRE(horizontal.length() == 30);
    REQUIRE(horizontal == Wall(Point{0, 10}, Point{30, 10}));
    REQUIRE(horizontal.to_string() == "(0,10)-(30,10)");
  }

  TEST_CASE("directions", "[geometry]") {
    for(auto dir : kDirections) {
      REQUIRE(opposite(opposite(dir)) == dir);
      REQUIRE_FALSE(isOrthogonal(dir, opposite(dir)));
      REQUIRE(deltaX(dir) + deltaX(opposite(dir)) == 0);
      REQUIRE(deltaY(dir) + deltaY(opposite(dir)) == 0);
    }
    REQUIRE(isOrthogonal(Direction::North, Direction::East));
    REQUIRE(deltaY(Direction::North) == -1);
    REQUIRE(to_string(Direction::West) == "W");
  }

  TEST_CASE("grid", "[grid]") {
    Grid<int> grid{3, 2, [](int x, int y) { return x + 10 * y; }};
    REQUIRE(grid.width() == 3);
    REQUIRE(grid.height() == 2);
    REQUIRE(grid.size() == 6);
    REQUIRE(grid.at(2, 1) == 12);
    REQUIRE(grid.index(2, 1) == 5);
    REQUIRE(grid.position(4) == Point(1, 1));
    REQUIRE(grid.contains(0, 0));
    REQUIRE_FALSE(grid.contains(3, 0));
    REQUIRE_FALSE(grid.contains(0, -1));
    std::vector<Point> odd{{1, 0}, {1, 1}};
    REQUIRE(grid.filter([](const int &v) { return v % 2 == 1; }) == odd);
    grid.at(0, 0) = 7;
    REQUIRE(grid.to_string([](const int &v) { return static_cast<char>('0' + v % 10); }) == "712\n012\n");
  }

  TEST_CASE("maze grid boundaries", "[grid]") {
    REQUIRE_THROWS_AS(MazeGrid(0, 3), MazeStructureError);
    MazeGrid grid{3, 2};
    REQUIRE(grid.at(2, 1).x() == 2);
    REQUIRE(grid.at(2, 1).y() == 1);

    SECTION("border") {
      REQUIRE(grid.isBorder(0, 0, Direction::North));
      REQUIRE(grid.isBorder(0, 0, Direction::West));
      REQUIRE(grid.isBorder(2, 1, Direction::East));
      REQUIRE(grid.isBorder(2, 1, Direction::South));
      REQUIRE_FALSE(grid.isOpen(0, 0, Direction::North));
      REQUIRE_FALSE(grid.claimBoundary(0, 0, Direction::North, true));
      REQUIRE_FALSE(grid.openBoundary(2, 1, Direction::South));
      REQUIRE_THROWS_AS(grid.setBoundary(2, 1, Direction::East, true), MazeStructureError);
      REQUIRE(grid.wallFlagCount() == 0);
    }
    SECTION("owner cells") {
      grid.setBoundary(1, 1, Direction::North, true);
      REQUIRE(grid.at(1, 0).southWall);
      REQUIRE_FALSE(grid.isOpen(1, 0, Direction::South));
      REQUIRE_FALSE(grid.isOpen(1, 1, Direction::North));
      grid.setBoundary(1, 0, Direction::West, true);
      REQUIRE(grid.at(0, 0).eastWall);
      REQUIRE_FALSE(grid.isOpen(0, 0, Direction::East));
      std::vector<Direction> open{Direction::East};
      REQUIRE(grid.openDirections(1, 0) == open);
      REQUIRE(grid.wallFlagCount() == 2);
    }
    SECTION("claimed boundaries") {
      REQUIRE(grid.claimBoundary(0, 0, Direction::South, true));
      REQUIRE(grid.isProcessed(0, 1, Direction::North));
      REQUIRE_FALSE(grid.claimBoundary(0, 1, Direction::North, false));
      REQUIRE(grid.at(0, 0).southWall);
      REQUIRE(grid.openBoundary(0, 1, Direction::North));
      REQUIRE_FALSE(grid.at(0, 0).southWall);
      REQUIRE_FALSE(grid.claimBoundary(0, 0, Direction::South, true));
      REQUIRE_FALSE(grid.at(0, 0).southWall);
    }
    SECTION("ascii rendering") {
      grid.setBoundary(0, 0, Direction::South, true);
      grid.setBoundary(1, 1, Direction::East, true);
      grid.at(2, 0).pathOrientation = PathOrientation::Horizontal;
      REQUIRE(grid.to_string() == " _____\n|_   *|\n|_ _|_|\n");
    }
    SECTION("path annotations") {
      grid.at(1, 1).pathOrientation = PathOrientation::Vertical;
      grid.at(1, 1).isJuncture = true;
      grid.at(1, 1).isWayPoint = true;
      REQUIRE(grid.at(1, 1).isOnPath());
      grid.clearPathAnnotations();
      REQUIRE_FALSE(grid.at(1, 1).isOnPath());
      REQUIRE_FALSE(grid.at(1, 1).isJuncture);
      REQUIRE_FALSE(grid.at(1, 1).isWayPoint);
    }
  }
}
