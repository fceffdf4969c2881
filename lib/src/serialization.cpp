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

#include "serialization.hpp"

std::string pbs::to_string(const google::protobuf::Message &msg) {
  std::string output;
  google::protobuf::TextFormat::PrintToString(msg, &output);
  return output;
}

namespace mcc {
namespace maze {

pb::Point toProto(const Point &point) {
  pb::Point res;
  res.set_x(point.x());
  res.set_y(point.y());
  return res;
}

pb::Wall toProto(const Wall &wall) {
  pb::Wall res;
  *res.mutable_start() = toProto(wall.start());
  *res.mutable_end() = toProto(wall.end());
  return res;
}

pb::Room toProto(const Room &room) {
  pb::Room res;
  res.set_x(room.x());
  res.set_y(room.y());
  res.set_width(room.width());
  res.set_height(room.height());
  return res;
}

pb::MazeStructure toProto(const MazeStructure &maze) {
  pb::MazeStructure res;
  res.set_genome_id(maze.genomeId());
  res.set_width(maze.width());
  res.set_height(maze.height());
  res.set_scale_multiplier(maze.scaleMultiplier());
  res.set_scaled_width(maze.scaledWidth());
  res.set_scaled_height(maze.scaledHeight());
  *res.mutable_start_location() = toProto(maze.startLocation());
  *res.mutable_target_location() = toProto(maze.targetLocation());
  res.set_max_timesteps(maze.maxTimesteps());
  res.set_num_partitions(maze.numPartitions());
  for(auto &wall : maze.walls())
    *res.add_walls() = toProto(wall);
  for(auto &cell : maze.solutionPath())
    *res.add_solution_path() = toProto(cell);
  return res;
}

pb::DeceptiveTurnUnit toProto(const DeceptiveTurnUnit &unit) {
  pb::DeceptiveTurnUnit res;
  res.set_genome_id(unit.genomeId);
  res.set_deceptive_turns(unit.deceptiveTurns);
  return res;
}

pb::MazeDiversityUnit toProto(const MazeDiversityUnit &unit) {
  pb::MazeDiversityUnit res;
  res.set_genome_id(unit.genomeId);
  res.set_diversity_score(unit.score);
  return res;
}

pb::MazeDiversityPair toProto(const MazeDiversityPair &pair) {
  pb::MazeDiversityPair res;
  res.set_genome_id1(pair.genomeId1);
  res.set_genome_id2(pair.genomeId2);
  res.set_diversity_score(pair.score);
  return res;
}

Point fromProto(const pb::Point &point) {
  return Point{point.x(), point.y()};
}

Wall fromProto(const pb::Wall &wall) {
  return Wall{fromProto(wall.start()), fromProto(wall.end())};
}

Room fromProto(const pb::Room &room) {
  return Room{room.x(), room.y(), room.width(), room.height()};
}

SubdivisionCommand fromProto(const pb::WallGene &gene) {
  return SubdivisionCommand{gene.room_index(), gene.wall_location(), gene.passage_location(), gene.orientation_seed()};
}

std::vector<SubdivisionCommand> commandsFromProto(const pb::MazeGenome &genome) {
  std::vector<SubdivisionCommand> commands;
  commands.reserve(static_cast<size_t>(genome.genes_size()));
  for(auto &gene : genome.genes())
    commands.push_back(fromProto(gene));
  return commands;
}

} // namespace maze
} // namespace mcc
