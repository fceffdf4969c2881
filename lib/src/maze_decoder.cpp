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
#include "maze_decoder.hpp"
#include "maze_builder.hpp"
#include "serialization.hpp"

namespace mcc {
namespace maze {

constexpr int MazeDecoder::kDefaultScaleMultiplier;

Logger MazeDecoder::logger = Logger("maze-decoder");

MazeDecoder::MazeDecoder(int scaleMultiplier) : scaleMultiplier_{scaleMultiplier} {
  if(scaleMultiplier <= 0)
    throw MazeStructureError("scale multiplier must be positive, got " + std::to_string(scaleMultiplier));
}

MazeStructure MazeDecoder::decode(const pb::MazeGenome &genome) const {
  MCC_DEBUG(logger, "MazeDecoder::decode {}", pbs::to_string(genome));
  auto commands = commandsFromProto(genome);
  if(genome.trajectory_size() == 0) {
    MazeBuilder builder{genome.width(), genome.height(), scaleMultiplier_};
    builder.applyAll(commands);
    return builder.finalize(genome.id());
  }
  std::vector<Point> trajectory;
  for(auto &cell : genome.trajectory())
    trajectory.push_back(fromProto(cell));
  auto builder = MazeBuilder::aroundTrajectory(genome.width(), genome.height(), scaleMultiplier_, trajectory);
  std::vector<Room> subMazes;
  for(auto &subMaze : genome.sub_mazes())
    subMazes.push_back(fromProto(subMaze));
  if(subMazes.empty())
    subMazes = builder.extractSubMazes();
  for(auto &subMaze : subMazes)
    builder.addSubMaze(subMaze, commands);
  return builder.finalize(genome.id());
}

std::vector<std::shared_ptr<const MazeStructure>> MazeDecoder::decode(const pb::MazePopulation &population) const {
  std::vector<std::shared_ptr<const MazeStructure>> res;
  for(auto &genome : population.genomes())
    res.push_back(std::make_shared<const MazeStructure>(decode(genome)));
  logger.trace("MazeDecoder::decode decoded {} genomes", res.size());
  return res;
}

} // namespace maze
} // namespace mcc
