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

#include <cstdlib>
#include <string>

namespace mcc {
namespace maze {

class Point {
 private:
  int x_;
  int y_;
 public:
  Point(int x, int y) : x_{x}, y_{y} {}
  int x() const { return x_; }
  int y() const { return y_; }
  bool operator==(const Point &other) const {
    return x_ == other.x_ && y_ == other.y_;
  }
  bool operator!=(const Point &other) const {
    return !(*this == other);
  }
  std::string to_string() const {
    return "(" + std::to_string(x_) + "," + std::to_string(y_) + ")";
  }
};

inline int manhattanDistance(const Point &lhs, const Point &rhs) {
  return std::abs(lhs.x() - rhs.x()) + std::abs(lhs.y() - rhs.y());
}

// Axis aligned segment in scaled maze coordinates.
class Wall {
 private:
  Point start_;
  Point end_;
 public:
  Wall(Point start, Point end) : start_{start}, end_{end} {}
  Wall(int x1, int y1, int x2, int y2) : start_{x1, y1}, end_{x2, y2} {}
  const Point &start() const { return start_; }
  const Point &end() const { return end_; }
  bool isHorizontal() const { return start_.y() == end_.y(); }
  bool isVertical() const { return start_.x() == end_.x(); }
  int length() const { return manhattanDistance(start_, end_); }
  bool operator==(const Wall &other) const {
    return start_ == other.start_ && end_ == other.end_;
  }
  bool operator!=(const Wall &other) const {
    return !(*this == other);
  }
  std::string to_string() const {
    return start_.to_string() + "-" + end_.to_string();
  }
};

} // namespace maze
} // namespace mcc
