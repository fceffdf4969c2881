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

#include "geometry.hpp"
#include "logger.hpp"
#include "maze_grid.hpp"
#include <vector>

namespace mcc {
namespace maze {

/// Finished maze: the annotated cell grid, its walls in scaled coordinates and the navigation budget.
/// Never modified once built, so it can be shared between analysis threads.
class MazeStructure {
 private:
  uint32_t genomeId_;
  int scaleMultiplier_;
  uint32_t numPartitions_;
  MazeGrid grid_;
  std::vector<Wall> walls_;
  Point startLocation_;
  Point targetLocation_;
  std::vector<Point> solutionPath_;
  int maxTimesteps_;

  static Logger logger;

 public:
  MazeStructure(MazeGrid grid, int scaleMultiplier, uint32_t numPartitions = 0, uint32_t genomeId = 0);

  uint32_t genomeId() const { return genomeId_; }
  int width() const { return grid_.width(); }
  int height() const { return grid_.height(); }
  int scaleMultiplier() const { return scaleMultiplier_; }
  int scaledWidth() const { return grid_.width() * scaleMultiplier_; }
  int scaledHeight() const { return grid_.height() * scaleMultiplier_; }
  uint32_t numPartitions() const { return numPartitions_; }
  const MazeGrid &grid() const { return grid_; }
  const std::vector<Wall> &walls() const { return walls_; }
  const Point &startLocation() const { return startLocation_; }
  const Point &targetLocation() const { return targetLocation_; }
  const std::vector<Point> &solutionPath() const { return solutionPath_; }
  int shortestPathLength() const { return static_cast<int>(solutionPath_.size()) - 1; }
  int maxTimesteps() const { return maxTimesteps_; }

  /// The four maze borders, in the order they start every wall list.
  static std::vector<Wall> borderWalls(int width, int height, int scaleMultiplier);
  /// Internal walls: maximal runs of south flags row by row, then of east flags column by column.
  static std::vector<Wall> extractWalls(const MazeGrid &grid, int scaleMultiplier);
  /// Rebuilds the wall flags of a grid from a wall list. Border walls are ignored.
  static MazeGrid gridFromWalls(const std::vector<Wall> &walls, int width, int height, int scaleMultiplier);
};

} // namespace maze
} // namespace mcc
