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

#include <catch2/catch.hpp>
#include <algorithm>
#include "maze_builder.hpp"
#include "maze_structure.hpp"

using namespace mcc::maze;

namespace Test {

  TEST_CASE("open 2x2 maze", "[structure]") {
    MazeStructure maze{MazeGrid{2, 2}, 10};
    REQUIRE(maze.walls().size() == 4);
    REQUIRE(maze.walls()[0] == Wall(0, 0, 20, 0));
    REQUIRE(maze.walls()[1] == Wall(0, 0, 0, 20));
    REQUIRE(maze.walls()[2] == Wall(20, 0, 20, 20));
    REQUIRE(maze.walls()[3] == Wall(0, 20, 20, 20));
    REQUIRE(maze.startLocation() == Point(5, 5));
    REQUIRE(maze.targetLocation() == Point(15, 15));
    REQUIRE(maze.maxTimesteps() == 20);
    REQUIRE(maze.shortestPathLength() == 2);
    REQUIRE(maze.scaledWidth() == 20);
    REQUIRE(maze.scaledHeight() == 20);
    REQUIRE(maze.numPartitions() == 0);
  }

  TEST_CASE("structure preconditions", "[structure]") {
    REQUIRE_THROWS_AS(MazeStructure(MazeGrid{2, 2}, 0), MazeStructureError);
    MazeGrid closed{2, 2};
    closed.setBoundary(1, 1, Direction::North, true);
    closed.setBoundary(1, 1, Direction::West, true);
    REQUIRE_THROWS_AS(MazeStructure(closed, 10), MazeStructureError);
  }

  TEST_CASE("wall extraction", "[structure]") {
    MazeGrid grid{4, 3};
    // two runs below the first row, a two cell run right of the third column
    grid.setBoundary(0, 0, Direction::South, true);
    grid.setBoundary(2, 0, Direction::South, true);
    grid.setBoundary(2, 1, Direction::East, true);
    grid.setBoundary(2, 2, Direction::East, true);
    grid.setBoundary(0, 1, Direction::East, true);
    auto walls = MazeStructure::extractWalls(grid, 10);
    std::vector<Wall> expected{Wall{0, 10, 10, 10}, Wall{20, 10, 30, 10}, Wall{10, 10, 10, 20}, Wall{30, 10, 30, 30}};
    REQUIRE(walls == expected);
    REQUIRE(walls.size() <= grid.wallFlagCount());

    MazeStructure maze{grid, 10};
    REQUIRE(maze.walls().size() == 8);
    REQUIRE(std::equal(expected.begin(), expected.end(), maze.walls().begin() + 4));
  }

  TEST_CASE("grid rebuilt from walls", "[structure]") {
    MazeBuilder builder{6, 5, 12};
    builder.applyAll({{0, 0.3, 0.7, true}, {1, 0.6, 0.2, false}, {0, 0.5, 0.5, true}, {2, 0.1, 0.9, false}});
    auto maze = builder.finalize(3);
    auto rebuilt = MazeStructure::gridFromWalls(maze.walls(), 6, 5, 12);
    REQUIRE(MazeStructure::extractWalls(rebuilt, 12) == MazeStructure::extractWalls(maze.grid(), 12));
    REQUIRE(rebuilt.wallFlagCount() == maze.grid().wallFlagCount());
    MazeStructure copy{rebuilt, 12, maze.numPartitions(), maze.genomeId()};
    REQUIRE(copy.walls() == maze.walls());
    REQUIRE(copy.maxTimesteps() == maze.maxTimesteps());
    REQUIRE(copy.solutionPath() == maze.solutionPath());

    REQUIRE_THROWS_AS(MazeStructure::gridFromWalls({Wall{5, 12, 24, 12}}, 6, 5, 12), MazeStructureError);
    REQUIRE_THROWS_AS(MazeStructure::gridFromWalls({Wall{0, 12, 12, 24}}, 6, 5, 12), MazeStructureError);
    REQUIRE_THROWS_AS(MazeStructure::gridFromWalls({Wall{0, 12, 96, 12}}, 6, 5, 12), MazeStructureError);
  }

  TEST_CASE("start and target follow the scale", "[structure]") {
    MazeStructure odd{MazeGrid{3, 2}, 7};
    REQUIRE(odd.startLocation() == Point(3, 3));
    REQUIRE(odd.targetLocation() == Point(18, 11));
    REQUIRE(odd.maxTimesteps() == 2 * 7 * 1);
    REQUIRE(odd.grid().at(0, 0).isOnPath());
    REQUIRE(odd.grid().at(2, 1).isOnPath());
  }
}
