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

#define MCC_DEBUG_ON 1
#include "maze_structure.hpp"
#include "path_analysis.hpp"
#include <algorithm>

namespace mcc {
namespace maze {

Logger MazeStructure::logger = Logger("maze-structure");

namespace {

int checkedScale(int scaleMultiplier) {
  if(scaleMultiplier <= 0)
    throw MazeStructureError("scale multiplier must be positive, got " + std::to_string(scaleMultiplier));
  return scaleMultiplier;
}

int toCell(int coordinate, int scaleMultiplier, const Wall &wall) {
  if(coordinate % scaleMultiplier != 0)
    throw MazeStructureError("wall " + wall.to_string() + " is not aligned on the cell boundaries");
  return coordinate / scaleMultiplier;
}

} // namespace

MazeStructure::MazeStructure(MazeGrid grid, int scaleMultiplier, uint32_t numPartitions, uint32_t genomeId)
  : genomeId_{genomeId}, scaleMultiplier_{checkedScale(scaleMultiplier)}, numPartitions_{numPartitions},
    grid_{std::move(grid)},
    startLocation_{scaleMultiplier / 2, scaleMultiplier / 2},
    targetLocation_{grid_.width() * scaleMultiplier - scaleMultiplier / 2, grid_.height() * scaleMultiplier - scaleMultiplier / 2},
    solutionPath_{mcc::maze::solutionPath(grid_)},
    maxTimesteps_{computeMaxTimesteps(static_cast<int>(solutionPath_.size()) - 1, scaleMultiplier)} {
  walls_ = borderWalls(grid_.width(), grid_.height(), scaleMultiplier_);
  auto internal = extractWalls(grid_, scaleMultiplier_);
  walls_.insert(walls_.end(), internal.begin(), internal.end());
  annotateSolutionPath(grid_, solutionPath_);
  MCC_DEBUG(logger, "MazeStructure genome {} {}x{} partitions {} walls {} path length {} max timesteps {}",
            genomeId_, width(), height(), numPartitions_, walls_.size(), shortestPathLength(), maxTimesteps_);
}

std::vector<Wall> MazeStructure::borderWalls(int width, int height, int scaleMultiplier) {
  int scaledWidth = width * scaleMultiplier;
  int scaledHeight = height * scaleMultiplier;
  return {Wall{0, 0, scaledWidth, 0},
          Wall{0, 0, 0, scaledHeight},
          Wall{scaledWidth, 0, scaledWidth, scaledHeight},
          Wall{0, scaledHeight, scaledWidth, scaledHeight}};
}

std::vector<Wall> MazeStructure::extractWalls(const MazeGrid &grid, int scaleMultiplier) {
  std::vector<Wall> walls;
  for(int r = 0; r < grid.height() - 1; ++r) {
    int c = 0;
    while(c < grid.width()) {
      if(!grid.at(c, r).southWall) {
        ++c;
        continue;
      }
      int start = c;
      while(c < grid.width() && grid.at(c, r).southWall)
        ++c;
      walls.emplace_back(start * scaleMultiplier, (r + 1) * scaleMultiplier, c * scaleMultiplier, (r + 1) * scaleMultiplier);
    }
  }
  for(int c = 0; c < grid.width() - 1; ++c) {
    int r = 0;
    while(r < grid.height()) {
      if(!grid.at(c, r).eastWall) {
        ++r;
        continue;
      }
      int start = r;
      while(r < grid.height() && grid.at(c, r).eastWall)
        ++r;
      walls.emplace_back((c + 1) * scaleMultiplier, start * scaleMultiplier, (c + 1) * scaleMultiplier, r * scaleMultiplier);
    }
  }
  return walls;
}

MazeGrid MazeStructure::gridFromWalls(const std::vector<Wall> &walls, int width, int height, int scaleMultiplier) {
  checkedScale(scaleMultiplier);
  MazeGrid grid{width, height};
  for(auto &wall : walls) {
    if(wall.isHorizontal()) {
      int row = toCell(wall.start().y(), scaleMultiplier, wall);
      if(row <= 0 || row >= height)
        continue;
      int from = toCell(std::min(wall.start().x(), wall.end().x()), scaleMultiplier, wall);
      int to = toCell(std::max(wall.start().x(), wall.end().x()), scaleMultiplier, wall);
      if(from < 0 || to > width)
        throw MazeStructureError("wall " + wall.to_string() + " lies outside the maze");
      for(int c = from; c < to; ++c)
        grid.setBoundary(c, row - 1, Direction::South, true);
    } else if(wall.isVertical()) {
      int column = toCell(wall.start().x(), scaleMultiplier, wall);
      if(column <= 0 || column >= width)
        continue;
      int from = toCell(std::min(wall.start().y(), wall.end().y()), scaleMultiplier, wall);
      int to = toCell(std::max(wall.start().y(), wall.end().y()), scaleMultiplier, wall);
      if(from < 0 || to > height)
        throw MazeStructureError("wall " + wall.to_string() + " lies outside the maze");
      for(int r = from; r < to; ++r)
        grid.setBoundary(column - 1, r, Direction::East, true);
    } else {
      throw MazeStructureError("wall " + wall.to_string() + " is not axis aligned");
    }
  }
  return grid;
}

} // namespace maze
} // namespace mcc
