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

#include "logger.hpp"
#include "maze.pb.h"
#include "maze_structure.hpp"
#include <memory>
#include <vector>

namespace mcc {
namespace maze {

class MazeDecoder {
 private:
  int scaleMultiplier_;

  static Logger logger;

 public:
  static constexpr int kDefaultScaleMultiplier = 32;

  explicit MazeDecoder(int scaleMultiplier = kDefaultScaleMultiplier);

  int scaleMultiplier() const { return scaleMultiplier_; }

  /// Genomes carrying a trajectory are built around it, the others by plain recursive division.
  /// Without explicit sub-mazes the cells off the trajectory are split into sub-mazes automatically.
  MazeStructure decode(const pb::MazeGenome &genome) const;
  std::vector<std::shared_ptr<const MazeStructure>> decode(const pb::MazePopulation &population) const;
};

} // namespace maze
} // namespace mcc
