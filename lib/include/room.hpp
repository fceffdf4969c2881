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
#include "logger.hpp"
#include "maze_grid.hpp"
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace mcc {
namespace maze {

enum class WallOrientation : uint8_t { Horizontal, Vertical };

struct BoundaryOpening {
  Point cell;
  Direction direction;
  int distance;

  BoundaryOpening(Point c, Direction dir, int dist) : cell{c}, direction{dir}, distance{dist} {}
};

// Rectangular region of the grid, subdivided by a wall with a single passage.
class Room {
 private:
  int x_;
  int y_;
  int width_;
  int height_;

  struct WallPlacement {
    WallOrientation orientation;
    int wallOffset;
    int passageOffset;
  };

  static Logger logger;

  WallPlacement placement(double unscaledWallLocation, double unscaledPassageLocation, bool isHorizontalSeed) const;
  std::vector<Point> edgeCells(Direction edge) const;
  stde::optional<BoundaryOpening> openNearestToPath(MazeGrid &grid, const std::vector<std::pair<Point,Direction>> &candidates) const;
  void checkFits(const MazeGrid &grid) const;

 public:
  static constexpr int kMinimumWidth = 2;
  static constexpr int kMinimumHeight = 2;
  static constexpr double kMaxUnscaledLocation = 0.999999;
  static constexpr int kUnreachable = std::numeric_limits<int>::max();

  using Division = std::pair<stde::optional<Room>, stde::optional<Room>>;

  Room(int x, int y, int width, int height);

  int x() const { return x_; }
  int y() const { return y_; }
  int width() const { return width_; }
  int height() const { return height_; }
  bool isDividable() const { return width_ >= kMinimumWidth && height_ >= kMinimumHeight; }
  bool contains(int x, int y) const {
    return x >= x_ && y >= y_ && x < x_ + width_ && y < y_ + height_;
  }
  bool overlaps(const Room &other) const;
  bool operator==(const Room &other) const {
    return x_ == other.x_ && y_ == other.y_ && width_ == other.width_ && height_ == other.height_;
  }
  bool operator!=(const Room &other) const { return !(*this == other); }

  /// Narrow rooms are split across their long side, square rooms follow the seed.
  WallOrientation orientation(bool isHorizontalSeed) const;

  /// Lays one wall across the room with a single passage and returns the two halves.
  /// Halves below the minimum dividable size are dropped.
  /// Both locations are fractions in [0, 1]; the wall location is capped below 1 so the wall
  /// never lands on the far edge of the room.
  Division divide(MazeGrid &grid, double unscaledWallLocation, double unscaledPassageLocation, bool isHorizontalSeed) const;

  /// Walls every perimeter boundary not yet claimed by a neighbouring room or by the maze border.
  void traceEnclosure(MazeGrid &grid) const;
  /// Encloses the room and opens the perimeter cell closest to the solution path.
  stde::optional<BoundaryOpening> markBoundaries(MazeGrid &grid) const;
  /// Encloses the room and opens it next to the passage of the wall that will divide it first.
  /// Falls back to the nearest opening when neither end of the passage faces a path cell.
  stde::optional<BoundaryOpening> markBoundaries(MazeGrid &grid, double unscaledWallLocation,
                                                 double unscaledPassageLocation, bool isHorizontalSeed) const;

  /// Number of cells from cell towards dir until a path cell, kUnreachable if the border comes first.
  static int distanceToPath(const MazeGrid &grid, const Point &cell, Direction dir);

  std::string to_string() const;
};

} // namespace maze
} // namespace mcc
