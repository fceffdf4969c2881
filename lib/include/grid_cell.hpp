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

#include <cstdint>

namespace mcc {
namespace maze {

enum class PathOrientation : uint8_t { None, Horizontal, Vertical };

// A cell only stores its south and east boundaries, the north and west ones belong to its neighbours.
class GridCell {
 private:
  int x_;
  int y_;
 public:
  bool southWall = false;
  bool eastWall = false;
  bool horizontalBoundaryProcessed = false;
  bool verticalBoundaryProcessed = false;
  PathOrientation pathOrientation = PathOrientation::None;
  bool isJuncture = false;
  bool isWayPoint = false;

  GridCell(int x, int y) : x_{x}, y_{y} {}
  int x() const { return x_; }
  int y() const { return y_; }
  bool isOnPath() const { return pathOrientation != PathOrientation::None; }
};

} // namespace maze
} // namespace mcc
