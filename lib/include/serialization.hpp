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
#include "maze.pb.h"
#include "maze_builder.hpp"
#include "maze_structure.hpp"
#include "metrics.hpp"
#include "room.hpp"
#include <google/protobuf/message.h>
#include <google/protobuf/text_format.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using Buffer = std::vector<uint8_t>;

namespace pbs {

std::string to_string(const google::protobuf::Message &msg);

template <typename T>
T from_text(const std::string &text) {
  T t;
  if(!google::protobuf::TextFormat::ParseFromString(text, &t))
    throw std::runtime_error("cannot parse " + t.GetTypeName() + " from text format");
  return t;
}

template <typename T>
T read_text_file(const std::string &path) {
  std::ifstream in(path);
  if(!in)
    throw std::runtime_error("cannot open " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  return from_text<T>(ss.str());
}

} // namespace pbs

namespace mcc {
namespace maze {
namespace serializer {

template <typename T>
std::shared_ptr<Buffer> serialize(const T &t) {
  size_t size = t.ByteSizeLong();
  Buffer data;
  data.resize(size);
  (void)t.SerializeWithCachedSizesToArray(data.data());
  return std::make_shared<Buffer>(data);
}

template <typename T>
T deserialize(const Buffer &buffer) {
  T t;
  if(!t.ParseFromArray(buffer.data(), static_cast<int>(buffer.size())))
    throw std::runtime_error("cannot parse " + t.GetTypeName() + " from " + std::to_string(buffer.size()) + " bytes");
  return t;
}

} // namespace serializer

pb::Point toProto(const Point &point);
pb::Wall toProto(const Wall &wall);
pb::Room toProto(const Room &room);
pb::MazeStructure toProto(const MazeStructure &maze);
pb::DeceptiveTurnUnit toProto(const DeceptiveTurnUnit &unit);
pb::MazeDiversityUnit toProto(const MazeDiversityUnit &unit);
pb::MazeDiversityPair toProto(const MazeDiversityPair &pair);

Point fromProto(const pb::Point &point);
Wall fromProto(const pb::Wall &wall);
Room fromProto(const pb::Room &room);
SubdivisionCommand fromProto(const pb::WallGene &gene);
std::vector<SubdivisionCommand> commandsFromProto(const pb::MazeGenome &genome);

} // namespace maze
} // namespace mcc
