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
#include "maze_structure.hpp"
#include "metrics.hpp"
#include <memory>
#include <vector>

namespace mcc {
namespace maze {

using Population = std::vector<std::shared_ptr<const MazeStructure>>;

/// Batch metrics over finished mazes, spread over a pool of worker threads.
/// Results come back in population order.
class PopulationAnalyzer {
 private:
  std::size_t nbThreads_;

  static Logger logger;

 public:
  explicit PopulationAnalyzer(std::size_t nbThreads);

  std::vector<DeceptiveTurnUnit> computeDeceptiveTurns(const Population &population) const;
  /// One entry per unordered pair of mazes.
  std::vector<MazeDiversityPair> computePairwiseDiversity(const Population &population) const;
  /// Mean diversity of each maze against the rest of the population, 0 for a lone maze.
  std::vector<MazeDiversityUnit> computePopulationDiversity(const Population &population) const;
};

} // namespace maze
} // namespace mcc
