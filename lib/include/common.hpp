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

#include <experimental/optional>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace stde = std::experimental;

namespace mcc {
namespace maze {

// Raised when a caller breaks a construction precondition or hands over an inconsistent maze.
class MazeStructureError : public std::logic_error {
 public:
  explicit MazeStructureError(const std::string &what) : std::logic_error{what} {}
};

enum class Direction : uint8_t { North, East, South, West };

constexpr std::array<Direction, 4> kDirections{{Direction::North, Direction::East, Direction::South, Direction::West}};

inline Direction opposite(Direction dir) {
  switch(dir) {
  case Direction::North:
    return Direction::South;
  case Direction::East:
    return Direction::West;
  case Direction::South:
    return Direction::North;
  case Direction::West:
    return Direction::East;
  }
  throw MazeStructureError("unknown direction");
}

inline bool isVertical(Direction dir) {
  return dir == Direction::North || dir == Direction::South;
}

inline bool isOrthogonal(Direction lhs, Direction rhs) {
  return isVertical(lhs) != isVertical(rhs);
}

inline int deltaX(Direction dir) {
  return dir == Direction::East ? 1 : (dir == Direction::West ? -1 : 0);
}

inline int deltaY(Direction dir) {
  return dir == Direction::South ? 1 : (dir == Direction::North ? -1 : 0);
}

std::string to_string(Direction dir);

} // namespace maze
} // namespace mcc
