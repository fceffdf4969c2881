#pragma once
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

#include "common.hpp"
#include "geometry.hpp"
#include "maze_grid.hpp"
#include <vector>

namespace mcc {
namespace maze {

class MazeStructure;

struct JunctureReport {
  std::vector<Point> junctures;
  uint32_t deceptiveTurns = 0;
};

/// Direction of the step between two orthogonally adjacent cells.
Direction stepDirection(const Point &from, const Point &to);

/// Breadth-first distance, in cells, from the top-left to the bottom-right cell.
/// Throws MazeStructureError when the bottom-right cell cannot be reached.
int shortestPathDistance(const MazeGrid &grid);
/// Cells of a shortest route from the top-left to the bottom-right cell, both included.
std::vector<Point> solutionPath(const MazeGrid &grid);
int computeMaxTimesteps(int unscaledDistance, int scaleMultiplier);

size_t reachableCellCount(const MazeGrid &grid);
size_t openBoundaryCount(const MazeGrid &grid);

/// A path cell is a juncture when, arrival direction excluded, more than one direction is open.
/// It is a deceptive turn when one of the open side branches is orthogonal to the direction the path takes.
/// The target cell is never a juncture.
JunctureReport analyzeJunctures(const MazeGrid &grid, const std::vector<Point> &path);
/// Resets then writes the path orientation, waypoint and juncture flags of the cells of path.
void annotateSolutionPath(MazeGrid &grid, const std::vector<Point> &path);

/// Mean Manhattan distance between the cells of two paths walked in lockstep,
/// the shorter path waiting on its last cell.
double computeSolutionPathDiversity(const std::vector<Point> &lhs, const std::vector<Point> &rhs);

uint32_t countDeceptiveTurns(const MazeStructure &maze);
double computeMazeDiversity(const MazeStructure &lhs, const MazeStructure &rhs);

} // namespace maze
} // namespace mcc
