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

#include "maze_grid.hpp"
#include <sstream>

namespace mcc {
namespace maze {

MazeGrid::MazeGrid(int width, int height)
  : Grid<GridCell>{width > 0 ? width : 0, height > 0 ? height : 0, [](int x, int y) { return GridCell{x, y}; }} {
  if(width <= 0 || height <= 0)
    throw MazeStructureError("maze grid dimensions must be positive, got " + std::to_string(width) + "x" + std::to_string(height));
}

bool MazeGrid::isBorder(int x, int y, Direction dir) const {
  return !contains(x + deltaX(dir), y + deltaY(dir));
}

GridCell *MazeGrid::owner(int x, int y, Direction dir) {
  return const_cast<GridCell *>(static_cast<const MazeGrid &>(*this).owner(x, y, dir));
}

const GridCell *MazeGrid::owner(int x, int y, Direction dir) const {
  if(!contains(x, y) || isBorder(x, y, dir))
    return nullptr;
  switch(dir) {
  case Direction::North:
    return &at(x, y - 1);
  case Direction::West:
    return &at(x - 1, y);
  case Direction::South:
  case Direction::East:
    return &at(x, y);
  }
  return nullptr;
}

bool MazeGrid::isOpen(int x, int y, Direction dir) const {
  auto *cell = owner(x, y, dir);
  if(cell == nullptr)
    return false;
  return isVertical(dir) ? !cell->southWall : !cell->eastWall;
}

std::vector<Direction> MazeGrid::openDirections(int x, int y) const {
  std::vector<Direction> res;
  for(auto dir : kDirections)
    if(isOpen(x, y, dir))
      res.push_back(dir);
  return res;
}

bool MazeGrid::isProcessed(int x, int y, Direction dir) const {
  auto *cell = owner(x, y, dir);
  if(cell == nullptr)
    return true;
  return isVertical(dir) ? cell->horizontalBoundaryProcessed : cell->verticalBoundaryProcessed;
}

bool MazeGrid::claimBoundary(int x, int y, Direction dir, bool wall) {
  if(isProcessed(x, y, dir))
    return false;
  setBoundary(x, y, dir, wall);
  return true;
}

bool MazeGrid::openBoundary(int x, int y, Direction dir) {
  if(owner(x, y, dir) == nullptr)
    return false;
  setBoundary(x, y, dir, false);
  return true;
}

void MazeGrid::setBoundary(int x, int y, Direction dir, bool wall) {
  auto *cell = owner(x, y, dir);
  if(cell == nullptr)
    throw MazeStructureError("cannot write the border boundary " + mcc::maze::to_string(dir) + " of " + Point{x, y}.to_string());
  if(isVertical(dir)) {
    cell->southWall = wall;
    cell->horizontalBoundaryProcessed = true;
  } else {
    cell->eastWall = wall;
    cell->verticalBoundaryProcessed = true;
  }
}

size_t MazeGrid::wallFlagCount() const {
  size_t count = 0;
  for(int y = 0; y < height(); ++y) {
    for(int x = 0; x < width(); ++x) {
      const auto &cell = at(x, y);
      // flags on the border edges never become walls
      if(cell.southWall && y < height() - 1)
        ++count;
      if(cell.eastWall && x < width() - 1)
        ++count;
    }
  }
  return count;
}

void MazeGrid::clearPathAnnotations() {
  for(int y = 0; y < height(); ++y) {
    for(int x = 0; x < width(); ++x) {
      auto &cell = at(x, y);
      cell.pathOrientation = PathOrientation::None;
      cell.isJuncture = false;
      cell.isWayPoint = false;
    }
  }
}

std::string MazeGrid::to_string() const {
  std::stringstream ss;
  ss << " " << std::string(static_cast<size_t>(2 * width() - 1), '_') << "\n";
  for(int y = 0; y < height(); ++y) {
    ss << "|";
    for(int x = 0; x < width(); ++x) {
      const auto &cell = at(x, y);
      if(!isOpen(x, y, Direction::South))
        ss << '_';
      else
        ss << (cell.isOnPath() ? '*' : ' ');
      ss << (isOpen(x, y, Direction::East) ? ' ' : '|');
    }
    ss << "\n";
  }
  return ss.str();
}

} // namespace maze
} // namespace mcc
