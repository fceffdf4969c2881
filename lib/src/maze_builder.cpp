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
#include "maze_builder.hpp"
#include "path_analysis.hpp"
#include <cstdlib>
#include <random>

namespace mcc {
namespace maze {

Logger MazeBuilder::logger = Logger("maze-builder");

namespace {

int checkedScale(int scaleMultiplier) {
  if(scaleMultiplier <= 0)
    throw MazeStructureError("scale multiplier must be positive, got " + std::to_string(scaleMultiplier));
  return scaleMultiplier;
}

} // namespace

MazeBuilder::MazeBuilder(int width, int height, int scaleMultiplier)
  : scaleMultiplier_{checkedScale(scaleMultiplier)}, grid_{width, height} {
  Room root{0, 0, width, height};
  if(root.isDividable())
    pending_.push_back(root);
}

MazeBuilder MazeBuilder::aroundTrajectory(int width, int height, int scaleMultiplier, const std::vector<Point> &trajectory) {
  MazeBuilder builder{width, height, scaleMultiplier};
  builder.pending_.clear();
  builder.pathAnchored_ = true;
  builder.layTrajectory(trajectory);
  return builder;
}

void MazeBuilder::checkNotFinalized() const {
  if(finalized_)
    throw MazeStructureError("maze builder was already finalized");
}

void MazeBuilder::layTrajectory(const std::vector<Point> &trajectory) {
  if(trajectory.empty())
    throw MazeStructureError("solution trajectory is empty");
  if(trajectory.front() != Point{0, 0})
    throw MazeStructureError("solution trajectory starts at " + trajectory.front().to_string() + " instead of the top-left cell");
  Point target{grid_.width() - 1, grid_.height() - 1};
  if(trajectory.back() != target)
    throw MazeStructureError("solution trajectory ends at " + trajectory.back().to_string() + " instead of " + target.to_string());
  std::vector<int> order(grid_.size(), -1);
  for(size_t i = 0; i < trajectory.size(); ++i) {
    const Point &cell = trajectory[i];
    if(!grid_.contains(cell.x(), cell.y()))
      throw MazeStructureError("solution trajectory leaves the maze at " + cell.to_string());
    if(order[grid_.index(cell.x(), cell.y())] >= 0)
      throw MazeStructureError("solution trajectory visits " + cell.to_string() + " twice");
    order[grid_.index(cell.x(), cell.y())] = static_cast<int>(i);
    if(i > 0 && manhattanDistance(trajectory[i - 1], cell) != 1)
      throw MazeStructureError("solution trajectory jumps from " + trajectory[i - 1].to_string() + " to " + cell.to_string());
  }
  annotateSolutionPath(grid_, trajectory);
  // only consecutive trajectory cells may see each other
  for(auto &cell : trajectory) {
    int current = order[grid_.index(cell.x(), cell.y())];
    for(auto dir : {Direction::East, Direction::South}) {
      int nx = cell.x() + deltaX(dir);
      int ny = cell.y() + deltaY(dir);
      if(!grid_.contains(nx, ny))
        continue;
      int neighbour = order[grid_.index(nx, ny)];
      if(neighbour < 0)
        continue;
      grid_.claimBoundary(cell.x(), cell.y(), dir, std::abs(neighbour - current) != 1);
    }
  }
  logger.trace("MazeBuilder::layTrajectory laid {} cells in a {}x{} maze", trajectory.size(), grid_.width(), grid_.height());
}

void MazeBuilder::divideNext(std::deque<Room> &worklist, const SubdivisionCommand &command) {
  size_t index = command.roomIndex % worklist.size();
  auto halves = worklist[index].divide(grid_, command.wallLocation, command.passageLocation, command.isHorizontalSeed);
  worklist.erase(worklist.begin() + static_cast<std::ptrdiff_t>(index));
  if(halves.first)
    worklist.push_back(*halves.first);
  if(halves.second)
    worklist.push_back(*halves.second);
  ++numPartitions_;
}

bool MazeBuilder::apply(const SubdivisionCommand &command) {
  checkNotFinalized();
  if(pending_.empty())
    return false;
  divideNext(pending_, command);
  return true;
}

size_t MazeBuilder::applyAll(const std::vector<SubdivisionCommand> &commands) {
  size_t applied = 0;
  for(auto &command : commands) {
    if(!apply(command))
      break;
    ++applied;
  }
  MCC_DEBUG(logger, "MazeBuilder::applyAll applied {} of {} commands, {} rooms left", applied, commands.size(), pending_.size());
  return applied;
}

stde::optional<BoundaryOpening> MazeBuilder::addSubMaze(const Room &room, const std::vector<SubdivisionCommand> &commands) {
  checkNotFinalized();
  if(!pathAnchored_)
    throw MazeStructureError("sub-mazes can only be added around a solution trajectory");
  if(!grid_.contains(room.x(), room.y()) || !grid_.contains(room.x() + room.width() - 1, room.y() + room.height() - 1))
    throw MazeStructureError("sub-maze " + room.to_string() + " does not fit in the maze");
  for(int y = room.y(); y < room.y() + room.height(); ++y)
    for(int x = room.x(); x < room.x() + room.width(); ++x)
      if(grid_.at(x, y).isOnPath())
        throw MazeStructureError("sub-maze " + room.to_string() + " covers trajectory cell " + Point{x, y}.to_string());
  for(auto &other : subMazes_)
    if(room.overlaps(other))
      throw MazeStructureError("sub-maze " + room.to_string() + " overlaps sub-maze " + other.to_string());

  bool divided = room.isDividable() && !commands.empty();
  auto opening = divided
      ? room.markBoundaries(grid_, commands.front().wallLocation, commands.front().passageLocation, commands.front().isHorizontalSeed)
      : room.markBoundaries(grid_);
  subMazes_.push_back(room);
  if(divided) {
    std::deque<Room> worklist{room};
    size_t iteration = 0;
    while(!worklist.empty())
      divideNext(worklist, commands[iteration++ % commands.size()]);
  }
  MCC_DEBUG(logger, "MazeBuilder::addSubMaze {} opened {}", room.to_string(),
            opening ? opening->cell.to_string() + " " + mcc::maze::to_string(opening->direction) : std::string("nowhere"));
  return opening;
}

std::vector<Room> MazeBuilder::extractSubMazes() const {
  if(!pathAnchored_)
    throw MazeStructureError("sub-mazes can only be extracted around a solution trajectory");
  auto isFree = [this](int x, int y) { return !grid_.at(x, y).isOnPath(); };
  std::vector<bool> covered(grid_.size(), false);
  std::vector<Room> res;
  for(int y = 0; y < grid_.height(); ++y) {
    for(int x = 0; x < grid_.width(); ++x) {
      if(!isFree(x, y) || covered[grid_.index(x, y)])
        continue;
      int last = x;
      while(last + 1 < grid_.width() && isFree(last + 1, y))
        ++last;
      // the band grows while the next row has the very same maximal run
      int rows = 1;
      while(y + rows < grid_.height()) {
        int ny = y + rows;
        bool sameRun = (x == 0 || !isFree(x - 1, ny)) && (last == grid_.width() - 1 || !isFree(last + 1, ny));
        for(int cx = x; sameRun && cx <= last; ++cx)
          sameRun = isFree(cx, ny);
        if(!sameRun)
          break;
        ++rows;
      }
      for(int cy = y; cy < y + rows; ++cy)
        for(int cx = x; cx <= last; ++cx)
          covered[grid_.index(cx, cy)] = true;
      res.emplace_back(x, y, last - x + 1, rows);
    }
  }
  logger.trace("MazeBuilder::extractSubMazes found {} sub-mazes", res.size());
  return res;
}

uint32_t MazeBuilder::estimateMaxPartitions(int width, int height, uint32_t numSamples, uint32_t seed) {
  if(numSamples == 0)
    throw MazeStructureError("cannot estimate partitions from 0 samples");
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> location(0.0, 1.0);
  std::bernoulli_distribution horizontal(0.5);
  uint64_t total = 0;
  for(uint32_t sample = 0; sample < numSamples; ++sample) {
    MazeBuilder builder{width, height, 1};
    // the worklist head is divided first, as a first-in first-out queue
    while(builder.apply(SubdivisionCommand{0, location(gen), location(gen), horizontal(gen)}))
      ;
    total += builder.numPartitions();
  }
  return static_cast<uint32_t>(total / numSamples);
}

MazeStructure MazeBuilder::finalize(uint32_t genomeId) {
  checkNotFinalized();
  if(pathAnchored_) {
    for(int y = 0; y < grid_.height(); ++y) {
      for(int x = 0; x < grid_.width(); ++x) {
        if(grid_.at(x, y).isOnPath())
          continue;
        bool covered = false;
        for(auto &room : subMazes_)
          covered = covered || room.contains(x, y);
        if(!covered)
          throw MazeStructureError("cell " + Point{x, y}.to_string() + " is neither on the trajectory nor in a sub-maze");
      }
    }
  }
  finalized_ = true;
  logger.trace("MazeBuilder::finalize genome {} after {} partitions", genomeId, numPartitions_);
  return MazeStructure{std::move(grid_), scaleMultiplier_, numPartitions_, genomeId};
}

} // namespace maze
} // namespace mcc
