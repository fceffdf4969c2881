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
#include "room.hpp"
#include <algorithm>
#include <cmath>

namespace mcc {
namespace maze {

constexpr int Room::kMinimumWidth;
constexpr int Room::kMinimumHeight;
constexpr double Room::kMaxUnscaledLocation;
constexpr int Room::kUnreachable;

Logger Room::logger = Logger("room");

namespace {

void checkLocation(const char *name, double location) {
  if(!std::isfinite(location) || location < 0.0 || location > 1.0)
    throw MazeStructureError(std::string(name) + " must be within [0, 1], got " + std::to_string(location));
}

constexpr std::array<Direction, 4> kEnclosureOrder{{Direction::North, Direction::South, Direction::West, Direction::East}};

} // namespace

Room::Room(int x, int y, int width, int height) : x_{x}, y_{y}, width_{width}, height_{height} {
  if(width <= 0 || height <= 0)
    throw MazeStructureError("room dimensions must be positive, got " + to_string());
}

bool Room::overlaps(const Room &other) const {
  return x_ < other.x_ + other.width_ && other.x_ < x_ + width_
      && y_ < other.y_ + other.height_ && other.y_ < y_ + height_;
}

WallOrientation Room::orientation(bool isHorizontalSeed) const {
  if(width_ < height_)
    return WallOrientation::Horizontal;
  if(height_ < width_)
    return WallOrientation::Vertical;
  return isHorizontalSeed ? WallOrientation::Horizontal : WallOrientation::Vertical;
}

Room::WallPlacement Room::placement(double unscaledWallLocation, double unscaledPassageLocation, bool isHorizontalSeed) const {
  checkLocation("wall location", unscaledWallLocation);
  checkLocation("passage location", unscaledPassageLocation);
  double wallLocation = std::min(unscaledWallLocation, kMaxUnscaledLocation);
  WallPlacement res;
  res.orientation = orientation(isHorizontalSeed);
  bool horizontal = res.orientation == WallOrientation::Horizontal;
  int span = horizontal ? height_ : width_;
  int length = horizontal ? width_ : height_;
  int minimum = horizontal ? kMinimumHeight : kMinimumWidth;
  // offset is within [0, span - 2], the wall always leaves one row (column) below (right of) it
  res.wallOffset = std::max(0, static_cast<int>(std::floor((span - minimum + 1) * wallLocation)));
  res.passageOffset = std::min(length - 1, static_cast<int>(std::floor(length * unscaledPassageLocation)));
  return res;
}

void Room::checkFits(const MazeGrid &grid) const {
  if(!grid.contains(x_, y_) || !grid.contains(x_ + width_ - 1, y_ + height_ - 1))
    throw MazeStructureError("room " + to_string() + " does not fit in a " + std::to_string(grid.width())
                             + "x" + std::to_string(grid.height()) + " grid");
}

Room::Division Room::divide(MazeGrid &grid, double unscaledWallLocation, double unscaledPassageLocation, bool isHorizontalSeed) const {
  if(!isDividable())
    throw MazeStructureError("room " + to_string() + " is below the minimum dividable size");
  checkFits(grid);
  auto wall = placement(unscaledWallLocation, unscaledPassageLocation, isHorizontalSeed);
  stde::optional<Room> first;
  stde::optional<Room> second;
  if(wall.orientation == WallOrientation::Horizontal) {
    int wallY = y_ + wall.wallOffset;
    for(int cx = x_; cx < x_ + width_; ++cx)
      grid.setBoundary(cx, wallY, Direction::South, cx != x_ + wall.passageOffset);
    first = Room{x_, y_, width_, wall.wallOffset + 1};
    second = Room{x_, wallY + 1, width_, height_ - wall.wallOffset - 1};
  } else {
    int wallX = x_ + wall.wallOffset;
    for(int cy = y_; cy < y_ + height_; ++cy)
      grid.setBoundary(wallX, cy, Direction::East, cy != y_ + wall.passageOffset);
    first = Room{x_, y_, wall.wallOffset + 1, height_};
    second = Room{wallX + 1, y_, width_ - wall.wallOffset - 1, height_};
  }
  MCC_DEBUG(logger, "Room::divide {} {} wall at offset {} passage at {} into {} and {}", to_string(),
            wall.orientation == WallOrientation::Horizontal ? "horizontally" : "vertically",
            wall.wallOffset, wall.passageOffset, first->to_string(), second->to_string());
  if(!first->isDividable())
    first = stde::nullopt;
  if(!second->isDividable())
    second = stde::nullopt;
  return std::make_pair(first, second);
}

std::vector<Point> Room::edgeCells(Direction edge) const {
  std::vector<Point> res;
  switch(edge) {
  case Direction::North:
  case Direction::South: {
    int cy = edge == Direction::North ? y_ : y_ + height_ - 1;
    for(int cx = x_; cx < x_ + width_; ++cx)
      res.emplace_back(cx, cy);
    break;
  }
  case Direction::West:
  case Direction::East: {
    int cx = edge == Direction::West ? x_ : x_ + width_ - 1;
    for(int cy = y_; cy < y_ + height_; ++cy)
      res.emplace_back(cx, cy);
    break;
  }
  }
  return res;
}

void Room::traceEnclosure(MazeGrid &grid) const {
  checkFits(grid);
  uint32_t claimed = 0;
  for(auto edge : kEnclosureOrder)
    for(auto &cell : edgeCells(edge))
      if(grid.claimBoundary(cell.x(), cell.y(), edge, true))
        ++claimed;
  logger.trace("Room::traceEnclosure {} claimed {} boundaries", to_string(), claimed);
}

int Room::distanceToPath(const MazeGrid &grid, const Point &cell, Direction dir) {
  int cx = cell.x();
  int cy = cell.y();
  int steps = 0;
  while(true) {
    cx += deltaX(dir);
    cy += deltaY(dir);
    ++steps;
    if(!grid.contains(cx, cy))
      return kUnreachable;
    if(grid.at(cx, cy).isOnPath())
      return steps;
  }
}

stde::optional<BoundaryOpening> Room::openNearestToPath(MazeGrid &grid, const std::vector<std::pair<Point,Direction>> &candidates) const {
  if(candidates.empty())
    return stde::nullopt;
  // with no path in sight of any candidate the first one is kept
  BoundaryOpening best{candidates.front().first, candidates.front().second, kUnreachable};
  for(auto &candidate : candidates) {
    int distance = distanceToPath(grid, candidate.first, candidate.second);
    if(distance < best.distance)
      best = BoundaryOpening{candidate.first, candidate.second, distance};
  }
  grid.openBoundary(best.cell.x(), best.cell.y(), best.direction);
  logger.trace("Room::markBoundaries {} opened {} of {} at distance {}", to_string(),
               mcc::maze::to_string(best.direction), best.cell.to_string(), best.distance);
  return best;
}

stde::optional<BoundaryOpening> Room::markBoundaries(MazeGrid &grid) const {
  traceEnclosure(grid);
  std::vector<std::pair<Point,Direction>> candidates;
  for(auto edge : kEnclosureOrder)
    for(auto &cell : edgeCells(edge))
      if(!grid.isBorder(cell.x(), cell.y(), edge))
        candidates.emplace_back(cell, edge);
  return openNearestToPath(grid, candidates);
}

stde::optional<BoundaryOpening> Room::markBoundaries(MazeGrid &grid, double unscaledWallLocation,
                                                     double unscaledPassageLocation, bool isHorizontalSeed) const {
  if(!isDividable())
    return markBoundaries(grid);
  auto wall = placement(unscaledWallLocation, unscaledPassageLocation, isHorizontalSeed);
  std::vector<std::pair<Point,Direction>> candidates;
  if(wall.orientation == WallOrientation::Horizontal) {
    int px = x_ + wall.passageOffset;
    candidates.emplace_back(Point{px, y_}, Direction::North);
    candidates.emplace_back(Point{px, y_ + height_ - 1}, Direction::South);
  } else {
    int py = y_ + wall.passageOffset;
    candidates.emplace_back(Point{x_, py}, Direction::West);
    candidates.emplace_back(Point{x_ + width_ - 1, py}, Direction::East);
  }
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [&grid](const std::pair<Point,Direction> &c) {
                                    return grid.isBorder(c.first.x(), c.first.y(), c.second)
                                        || distanceToPath(grid, c.first, c.second) != 1;
                                  }), candidates.end());
  if(candidates.empty())
    return markBoundaries(grid);
  traceEnclosure(grid);
  return openNearestToPath(grid, candidates);
}

std::string Room::to_string() const {
  return "[" + std::to_string(x_) + "," + std::to_string(y_) + " " + std::to_string(width_) + "x" + std::to_string(height_) + "]";
}

} // namespace maze
} // namespace mcc
