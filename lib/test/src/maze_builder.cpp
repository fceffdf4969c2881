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
#include <random>
#include "maze_builder.hpp"
#include "path_analysis.hpp"

using namespace mcc::maze;

namespace Test {

  std::vector<SubdivisionCommand> randomCommands(std::mt19937 &gen, size_t count) {
    std::uniform_real_distribution<double> location(0.0, 1.0);
    std::uniform_int_distribution<uint32_t> room(0, 64);
    std::bernoulli_distribution horizontal(0.5);
    std::vector<SubdivisionCommand> commands;
    for(size_t i = 0; i < count; ++i)
      commands.emplace_back(room(gen), location(gen), location(gen), horizontal(gen));
    return commands;
  }

  TEST_CASE("worklist targeting", "[builder]") {
    MazeBuilder builder{4, 4, 10};
    REQUIRE(builder.pendingRooms() == 1);
    REQUIRE(builder.apply({0, 0.5, 0.0, true}));
    REQUIRE(builder.pendingRooms() == 2);
    REQUIRE(builder.pending()[0] == Room(0, 0, 4, 2));
    REQUIRE(builder.pending()[1] == Room(0, 2, 4, 2));

    REQUIRE(builder.apply({1, 0.5, 0.0, false}));
    REQUIRE(builder.grid().at(1, 3).eastWall);
    REQUIRE_FALSE(builder.grid().at(1, 2).eastWall);
    REQUIRE_FALSE(builder.grid().at(1, 0).eastWall);
    REQUIRE(builder.pendingRooms() == 3);
    REQUIRE(builder.pending()[0] == Room(0, 0, 4, 2));
    REQUIRE(builder.pending()[1] == Room(0, 2, 2, 2));
    REQUIRE(builder.pending()[2] == Room(2, 2, 2, 2));

    // indices wrap around the worklist
    REQUIRE(builder.apply({5, 0.5, 0.0, true}));
    REQUIRE(builder.grid().at(3, 2).southWall);
    REQUIRE_FALSE(builder.grid().at(2, 2).southWall);
    REQUIRE(builder.pendingRooms() == 2);
    REQUIRE(builder.numPartitions() == 3);
  }

  TEST_CASE("worklist exhaustion", "[builder]") {
    MazeBuilder builder{2, 2, 10};
    REQUIRE(builder.applyAll({{0, 0.5, 0.5, true}, {0, 0.5, 0.5, true}, {0, 0.5, 0.5, true}}) == 1);
    REQUIRE(builder.exhausted());
    REQUIRE_FALSE(builder.apply({0, 0.5, 0.5, true}));
    REQUIRE(builder.numPartitions() == 1);
    auto maze = builder.finalize(9);
    REQUIRE(maze.genomeId() == 9);
    REQUIRE(maze.numPartitions() == 1);
    REQUIRE(maze.walls().size() == 5);

    SECTION("corridors are never divided") {
      MazeBuilder corridor{1, 5, 10};
      REQUIRE(corridor.exhausted());
      REQUIRE(corridor.finalize().maxTimesteps() == 40);
    }
  }

  TEST_CASE("builder preconditions", "[builder]") {
    REQUIRE_THROWS_AS(MazeBuilder(0, 4, 10), MazeStructureError);
    REQUIRE_THROWS_AS(MazeBuilder(4, 4, 0), MazeStructureError);
    MazeBuilder builder{3, 3, 10};
    REQUIRE_THROWS_AS(builder.apply({0, 2.0, 0.5, true}), MazeStructureError);
    REQUIRE(builder.grid().wallFlagCount() == 0);
    builder.finalize();
    REQUIRE_THROWS_AS(builder.finalize(), MazeStructureError);
    REQUIRE_THROWS_AS(builder.apply({0, 0.5, 0.5, true}), MazeStructureError);
  }

  TEST_CASE("exhausted subdivision yields a perfect maze", "[builder][property]") {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> side(2, 12);
    for(int run = 0; run < 25; ++run) {
      int width = side(gen);
      int height = side(gen);
      int scale = 10 + run;
      MazeBuilder builder{width, height, scale};
      builder.applyAll(randomCommands(gen, static_cast<size_t>(width * height)));
      REQUIRE(builder.exhausted());
      auto maze = builder.finalize(static_cast<uint32_t>(run));
      size_t cells = static_cast<size_t>(width * height);
      REQUIRE(reachableCellCount(maze.grid()) == cells);
      REQUIRE(openBoundaryCount(maze.grid()) == cells - 1);
      REQUIRE(maze.walls().size() - 4 <= maze.grid().wallFlagCount());
      REQUIRE(maze.maxTimesteps() >= 0);
      REQUIRE(maze.maxTimesteps() % (2 * scale) == 0);
      REQUIRE(maze.maxTimesteps() == computeMaxTimesteps(shortestPathDistance(maze.grid()), scale));
      REQUIRE(maze.solutionPath().front() == Point(0, 0));
      REQUIRE(maze.solutionPath().back() == Point(width - 1, height - 1));
      auto report = analyzeJunctures(maze.grid(), maze.solutionPath());
      REQUIRE(report.deceptiveTurns <= report.junctures.size());
      auto rebuilt = MazeStructure::gridFromWalls(maze.walls(), width, height, scale);
      REQUIRE(MazeStructure::extractWalls(rebuilt, scale) == MazeStructure::extractWalls(maze.grid(), scale));
    }
  }

  TEST_CASE("partial subdivision stays connected", "[builder][property]") {
    std::mt19937 gen(7);
    for(int run = 0; run < 10; ++run) {
      MazeBuilder builder{20, 20, 16};
      builder.applyAll(randomCommands(gen, static_cast<size_t>(run)));
      auto maze = builder.finalize();
      REQUIRE(reachableCellCount(maze.grid()) == 400);
      REQUIRE(maze.numPartitions() == static_cast<uint32_t>(run));
    }
  }

  TEST_CASE("maze built around a trajectory", "[builder][path]") {
    std::vector<Point> trajectory{{0, 0}, {1, 0}, {2, 0}, {3, 0}, {3, 1}, {3, 2}, {3, 3}};

    SECTION("single sub-maze") {
      auto builder = MazeBuilder::aroundTrajectory(4, 4, 10, trajectory);
      REQUIRE(builder.exhausted());
      auto opening = builder.addSubMaze(Room{0, 1, 3, 3}, {{0, 0.5, 0.5, true}});
      REQUIRE(opening);
      REQUIRE(opening->cell == Point(1, 1));
      REQUIRE(opening->direction == Direction::North);
      REQUIRE(opening->distance == 1);
      REQUIRE(builder.numPartitions() == 3);

      const auto &grid = builder.grid();
      REQUIRE_FALSE(grid.at(1, 0).southWall);
      REQUIRE(grid.at(0, 0).southWall);
      REQUIRE(grid.at(2, 0).southWall);
      for(int y = 1; y < 4; ++y)
        REQUIRE(grid.at(2, y).eastWall);
      REQUIRE(grid.at(0, 2).southWall);
      REQUIRE(grid.at(2, 2).southWall);
      REQUIRE(grid.at(1, 1).eastWall);
      REQUIRE(grid.at(0, 1).southWall);
      REQUIRE(grid.wallFlagCount() == 9);

      auto maze = builder.finalize(4);
      REQUIRE(maze.solutionPath() == trajectory);
      REQUIRE(reachableCellCount(maze.grid()) == 16);
      REQUIRE(openBoundaryCount(maze.grid()) == 15);
      REQUIRE(maze.maxTimesteps() == 60);
    }
    SECTION("trajectory validation") {
      REQUIRE_THROWS_AS(MazeBuilder::aroundTrajectory(4, 4, 10, {}), MazeStructureError);
      REQUIRE_THROWS_AS(MazeBuilder::aroundTrajectory(4, 4, 10, {{1, 0}, {2, 0}, {3, 0}, {3, 1}, {3, 2}, {3, 3}}), MazeStructureError);
      REQUIRE_THROWS_AS(MazeBuilder::aroundTrajectory(4, 4, 10, {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {3, 1}, {3, 2}}), MazeStructureError);
      REQUIRE_THROWS_AS(MazeBuilder::aroundTrajectory(4, 4, 10, {{0, 0}, {1, 0}, {3, 0}, {3, 1}, {3, 2}, {3, 3}}), MazeStructureError);
      REQUIRE_THROWS_AS(MazeBuilder::aroundTrajectory(4, 4, 10, {{0, 0}, {1, 1}, {2, 1}, {3, 1}, {3, 2}, {3, 3}}), MazeStructureError);
      REQUIRE_THROWS_AS(MazeBuilder::aroundTrajectory(4, 4, 10, {{0, 0}, {1, 0}, {0, 0}, {1, 0}, {2, 0}, {3, 0}, {3, 1}, {3, 2}, {3, 3}}), MazeStructureError);
    }
    SECTION("sub-maze validation") {
      auto builder = MazeBuilder::aroundTrajectory(4, 4, 10, trajectory);
      REQUIRE_THROWS_AS(builder.addSubMaze(Room{0, 0, 2, 2}, {}), MazeStructureError);
      REQUIRE_THROWS_AS(builder.addSubMaze(Room{2, 2, 3, 3}, {}), MazeStructureError);
      builder.addSubMaze(Room{0, 1, 3, 2}, {{0, 0.5, 0.5, true}});
      REQUIRE_THROWS_AS(builder.addSubMaze(Room{0, 2, 1, 2}, {}), MazeStructureError);
      REQUIRE_THROWS_AS(builder.finalize(), MazeStructureError);

      MazeBuilder plain{4, 4, 10};
      REQUIRE_THROWS_AS(plain.addSubMaze(Room{0, 1, 3, 3}, {}), MazeStructureError);
    }
    SECTION("several sub-mazes") {
      std::vector<Point> lShaped{{0, 0}, {0, 1}, {0, 2}, {0, 3}, {0, 4}, {1, 4}, {2, 4}, {3, 4}, {4, 4}};
      auto builder = MazeBuilder::aroundTrajectory(5, 5, 10, lShaped);
      std::vector<SubdivisionCommand> commands{{0, 0.5, 0.5, false}, {0, 0.2, 0.8, true}};
      auto upper = builder.addSubMaze(Room{1, 0, 4, 2}, commands);
      auto lower = builder.addSubMaze(Room{1, 2, 4, 2}, commands);
      REQUIRE(upper->direction == Direction::West);
      REQUIRE(lower->direction == Direction::West);
      auto maze = builder.finalize();
      REQUIRE(maze.solutionPath() == lShaped);
      REQUIRE(reachableCellCount(maze.grid()) == 25);
      REQUIRE(openBoundaryCount(maze.grid()) == 24);
    }
    SECTION("sub-maze left open") {
      auto builder = MazeBuilder::aroundTrajectory(4, 4, 10, trajectory);
      builder.addSubMaze(Room{0, 1, 3, 3}, {});
      REQUIRE(builder.numPartitions() == 0);
      auto maze = builder.finalize();
      REQUIRE(reachableCellCount(maze.grid()) == 16);
      REQUIRE(maze.grid().wallFlagCount() == 5);
      REQUIRE_FALSE(maze.grid().at(0, 0).southWall);
    }
    SECTION("extracted sub-mazes") {
      auto builder = MazeBuilder::aroundTrajectory(4, 4, 10, trajectory);
      auto subMazes = builder.extractSubMazes();
      REQUIRE(subMazes.size() == 1);
      REQUIRE(subMazes[0] == Room(0, 1, 3, 3));

      std::vector<Point> lShaped{{0, 0}, {0, 1}, {0, 2}, {0, 3}, {0, 4}, {1, 4}, {2, 4}, {3, 4}, {4, 4}};
      auto bands = MazeBuilder::aroundTrajectory(5, 5, 10, lShaped).extractSubMazes();
      REQUIRE(bands.size() == 1);
      REQUIRE(bands[0] == Room(1, 0, 4, 4));

      MazeBuilder plain{4, 4, 10};
      REQUIRE_THROWS_AS(plain.extractSubMazes(), MazeStructureError);
    }
  }

  std::vector<Point> randomTrajectory(std::mt19937 &gen, int width, int height) {
    std::bernoulli_distribution right(0.5);
    std::vector<Point> trajectory{{0, 0}};
    int x = 0;
    int y = 0;
    while(x < width - 1 || y < height - 1) {
      if(y == height - 1 || (x < width - 1 && right(gen)))
        ++x;
      else
        ++y;
      trajectory.emplace_back(x, y);
    }
    return trajectory;
  }

  TEST_CASE("extracted sub-mazes yield a perfect maze", "[builder][path][property]") {
    std::mt19937 gen(11);
    std::uniform_int_distribution<int> side(2, 10);
    for(int run = 0; run < 25; ++run) {
      int width = side(gen);
      int height = side(gen);
      auto trajectory = randomTrajectory(gen, width, height);
      auto builder = MazeBuilder::aroundTrajectory(width, height, 10, trajectory);
      auto subMazes = builder.extractSubMazes();
      size_t covered = 0;
      for(auto &subMaze : subMazes) {
        covered += static_cast<size_t>(subMaze.width() * subMaze.height());
        builder.addSubMaze(subMaze, randomCommands(gen, 4));
      }
      size_t cells = static_cast<size_t>(width * height);
      REQUIRE(covered + trajectory.size() == cells);
      auto maze = builder.finalize(static_cast<uint32_t>(run));
      REQUIRE(reachableCellCount(maze.grid()) == cells);
      REQUIRE(openBoundaryCount(maze.grid()) == cells - 1);
      REQUIRE(maze.solutionPath() == trajectory);
    }
  }

  TEST_CASE("partition estimate", "[builder]") {
    REQUIRE(MazeBuilder::estimateMaxPartitions(2, 2, 50) == 1);
    REQUIRE(MazeBuilder::estimateMaxPartitions(1, 5, 50) == 0);
    auto estimate = MazeBuilder::estimateMaxPartitions(3, 3, 200, 5);
    REQUIRE(estimate >= 2);
    REQUIRE(estimate <= 4);
    REQUIRE(MazeBuilder::estimateMaxPartitions(3, 3, 200, 5) == estimate);
    REQUIRE(MazeBuilder::estimateMaxPartitions(10, 10, 20) > estimate);
    REQUIRE_THROWS_AS(MazeBuilder::estimateMaxPartitions(3, 3, 0), MazeStructureError);
  }
}
