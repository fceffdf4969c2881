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
#include "grid.hpp"
#include "grid_cell.hpp"
#include <string>
#include <vector>

namespace mcc {
namespace maze {

class MazeGrid : public Grid<GridCell> {
 private:
  GridCell *owner(int x, int y, Direction dir);
  const GridCell *owner(int x, int y, Direction dir) const;
 public:
  MazeGrid(int width, int height);

  /// True when the boundary of (x, y) in direction dir is part of the maze border.
  bool isBorder(int x, int y, Direction dir) const;
  /// True when moving from (x, y) towards dir stays inside the maze and crosses no wall.
  bool isOpen(int x, int y, Direction dir) const;
  /// Open directions of (x, y), in North, East, South, West order.
  std::vector<Direction> openDirections(int x, int y) const;
  bool isProcessed(int x, int y, Direction dir) const;

  /// Writes the boundary unless another room already claimed it. Returns whether it was written.
  bool claimBoundary(int x, int y, Direction dir, bool wall);
  /// Clears the boundary and marks it processed. Returns false on the maze border.
  bool openBoundary(int x, int y, Direction dir);
  /// Writes the boundary and marks it processed, whoever claimed it before.
  void setBoundary(int x, int y, Direction dir, bool wall);

  size_t wallFlagCount() const;
  void clearPathAnnotations();
  std::string to_string() const;
};

} // namespace maze
} // namespace mcc
