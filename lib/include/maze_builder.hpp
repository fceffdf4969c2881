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
#include "maze_structure.hpp"
#include "room.hpp"
#include <deque>
#include <vector>

namespace mcc {
namespace maze {

struct SubdivisionCommand {
  uint32_t roomIndex;
  double wallLocation;
  double passageLocation;
  bool isHorizontalSeed;

  SubdivisionCommand(uint32_t room, double wall, double passage, bool horizontal)
    : roomIndex{room}, wallLocation{wall}, passageLocation{passage}, isHorizontalSeed{horizontal} {}
};

/// Builds a maze grid one subdivision at a time, then freezes it into a MazeStructure.
/// Rooms waiting for a wall are kept in a first-in first-out worklist, a command picks the
/// room at roomIndex modulo the number of waiting rooms.
class MazeBuilder {
 private:
  int scaleMultiplier_;
  MazeGrid grid_;
  std::deque<Room> pending_;
  uint32_t numPartitions_ = 0;
  bool pathAnchored_ = false;
  bool finalized_ = false;
  std::vector<Room> subMazes_;

  static Logger logger;

  void checkNotFinalized() const;
  void divideNext(std::deque<Room> &worklist, const SubdivisionCommand &command);
  void layTrajectory(const std::vector<Point> &trajectory);

 public:
  MazeBuilder(int width, int height, int scaleMultiplier);

  /// Starts from an open grid crossed by the given solution trajectory, which must join the
  /// top-left and bottom-right cells through orthogonal steps without visiting a cell twice.
  /// The rest of the maze is then filled with addSubMaze.
  static MazeBuilder aroundTrajectory(int width, int height, int scaleMultiplier, const std::vector<Point> &trajectory);

  /// Returns false, leaving the grid untouched, when no room is left to divide.
  bool apply(const SubdivisionCommand &command);
  size_t applyAll(const std::vector<SubdivisionCommand> &commands);

  /// Encloses a room off the trajectory, opens it towards the trajectory and divides it
  /// until nothing is left to divide, cycling through the commands.
  stde::optional<BoundaryOpening> addSubMaze(const Room &room, const std::vector<SubdivisionCommand> &commands);
  /// Rectangles tiling the cells off the trajectory. Each one is a band of rows sharing the same
  /// maximal run of free cells, so one of its side columns always runs along the trajectory.
  std::vector<Room> extractSubMazes() const;

  /// Mean number of partitions over numSamples random subdivisions of a width x height maze carried to exhaustion.
  static uint32_t estimateMaxPartitions(int width, int height, uint32_t numSamples = 2000, uint32_t seed = 1);

  size_t pendingRooms() const { return pending_.size(); }
  const std::deque<Room> &pending() const { return pending_; }
  bool exhausted() const { return pending_.empty(); }
  uint32_t numPartitions() const { return numPartitions_; }
  const MazeGrid &grid() const { return grid_; }

  /// Can only be called once.
  MazeStructure finalize(uint32_t genomeId = 0);
};

} // namespace maze
} // namespace mcc
