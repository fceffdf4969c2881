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

#include "path_analysis.hpp"
#include "logger.hpp"
#include "maze_structure.hpp"
#include <algorithm>
#include <queue>

namespace mcc {
namespace maze {

namespace {

Logger logger("path-analysis");

struct SearchTree {
  std::vector<int> distance;
  std::vector<int64_t> parent;
};

SearchTree breadthFirstSearch(const MazeGrid &grid, bool stopAtTarget) {
  SearchTree tree{std::vector<int>(grid.size(), -1), std::vector<int64_t>(grid.size(), -1)};
  size_t start = grid.index(0, 0);
  size_t target = grid.index(grid.width() - 1, grid.height() - 1);
  std::queue<size_t> frontier;
  tree.distance[start] = 0;
  frontier.push(start);
  while(!frontier.empty()) {
    size_t current = frontier.front();
    frontier.pop();
    if(stopAtTarget && current == target)
      break;
    Point pos = grid.position(current);
    for(auto dir : grid.openDirections(pos.x(), pos.y())) {
      size_t next = grid.index(pos.x() + deltaX(dir), pos.y() + deltaY(dir));
      if(tree.distance[next] < 0) {
        tree.distance[next] = tree.distance[current] + 1;
        tree.parent[next] = static_cast<int64_t>(current);
        frontier.push(next);
      }
    }
  }
  return tree;
}

void checkReached(const MazeGrid &grid, const SearchTree &tree) {
  if(tree.distance[grid.index(grid.width() - 1, grid.height() - 1)] < 0)
    throw MazeStructureError("target cell of the " + std::to_string(grid.width()) + "x" + std::to_string(grid.height())
                             + " maze is unreachable from the start cell");
}

} // namespace

Direction stepDirection(const Point &from, const Point &to) {
  for(auto dir : kDirections)
    if(from.x() + deltaX(dir) == to.x() && from.y() + deltaY(dir) == to.y())
      return dir;
  throw MazeStructureError("cells " + from.to_string() + " and " + to.to_string() + " are not adjacent");
}

int shortestPathDistance(const MazeGrid &grid) {
  auto tree = breadthFirstSearch(grid, true);
  checkReached(grid, tree);
  return tree.distance[grid.index(grid.width() - 1, grid.height() - 1)];
}

std::vector<Point> solutionPath(const MazeGrid &grid) {
  auto tree = breadthFirstSearch(grid, true);
  checkReached(grid, tree);
  std::vector<Point> path;
  int64_t current = static_cast<int64_t>(grid.index(grid.width() - 1, grid.height() - 1));
  while(current >= 0) {
    path.push_back(grid.position(static_cast<size_t>(current)));
    current = tree.parent[static_cast<size_t>(current)];
  }
  std::reverse(path.begin(), path.end());
  return path;
}

int computeMaxTimesteps(int unscaledDistance, int scaleMultiplier) {
  if(unscaledDistance < 0 || scaleMultiplier <= 0)
    throw MazeStructureError("cannot compute a timestep budget for distance " + std::to_string(unscaledDistance)
                             + " and scale " + std::to_string(scaleMultiplier));
  return 2 * (scaleMultiplier * (unscaledDistance / 2));
}

size_t reachableCellCount(const MazeGrid &grid) {
  auto tree = breadthFirstSearch(grid, false);
  return static_cast<size_t>(std::count_if(tree.distance.begin(), tree.distance.end(), [](int d) { return d >= 0; }));
}

size_t openBoundaryCount(const MazeGrid &grid) {
  size_t count = 0;
  for(int y = 0; y < grid.height(); ++y) {
    for(int x = 0; x < grid.width(); ++x) {
      if(grid.isOpen(x, y, Direction::South))
        ++count;
      if(grid.isOpen(x, y, Direction::East))
        ++count;
    }
  }
  return count;
}

JunctureReport analyzeJunctures(const MazeGrid &grid, const std::vector<Point> &path) {
  JunctureReport report;
  for(size_t i = 0; i + 1 < path.size(); ++i) {
    const Point &cell = path[i];
    Direction travel = stepDirection(cell, path[i + 1]);
    if(!grid.isOpen(cell.x(), cell.y(), travel))
      throw MazeStructureError("path goes through a wall at " + cell.to_string());
    std::vector<Direction> candidates;
    for(auto dir : grid.openDirections(cell.x(), cell.y()))
      if(i == 0 || dir != opposite(stepDirection(path[i - 1], cell)))
        candidates.push_back(dir);
    if(candidates.size() <= 1)
      continue;
    report.junctures.push_back(cell);
    for(auto dir : candidates) {
      if(dir != travel && isOrthogonal(dir, travel)) {
        ++report.deceptiveTurns;
        break;
      }
    }
  }
  return report;
}

void annotateSolutionPath(MazeGrid &grid, const std::vector<Point> &path) {
  grid.clearPathAnnotations();
  for(size_t i = 0; i < path.size(); ++i) {
    auto &cell = grid.at(path[i]);
    Direction heading = Direction::East;
    if(i + 1 < path.size())
      heading = stepDirection(path[i], path[i + 1]);
    else if(i > 0)
      heading = stepDirection(path[i - 1], path[i]);
    cell.pathOrientation = isVertical(heading) ? PathOrientation::Vertical : PathOrientation::Horizontal;
    if(i > 0 && i + 1 < path.size())
      cell.isWayPoint = stepDirection(path[i - 1], path[i]) != heading;
  }
  for(auto &juncture : analyzeJunctures(grid, path).junctures)
    grid.at(juncture).isJuncture = true;
}

double computeSolutionPathDiversity(const std::vector<Point> &lhs, const std::vector<Point> &rhs) {
  if(lhs.empty() || rhs.empty())
    throw MazeStructureError("cannot compare empty solution paths");
  size_t steps = std::max(lhs.size(), rhs.size());
  double total = 0.0;
  for(size_t i = 0; i < steps; ++i)
    total += manhattanDistance(lhs[std::min(i, lhs.size() - 1)], rhs[std::min(i, rhs.size() - 1)]);
  return total / static_cast<double>(steps);
}

uint32_t countDeceptiveTurns(const MazeStructure &maze) {
  auto report = analyzeJunctures(maze.grid(), maze.solutionPath());
  logger.trace("countDeceptiveTurns genome {} has {} junctures and {} deceptive turns", maze.genomeId(),
               report.junctures.size(), report.deceptiveTurns);
  return report.deceptiveTurns;
}

double computeMazeDiversity(const MazeStructure &lhs, const MazeStructure &rhs) {
  return computeSolutionPathDiversity(lhs.solutionPath(), rhs.solutionPath());
}

} // namespace maze
} // namespace mcc
