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

#include <iostream>
#include <fstream>
#include "clara.hpp"
#include "logger.hpp"
#include "maze_decoder.hpp"
#include "path_analysis.hpp"
#include "serialization.hpp"

using namespace mcc::maze;

int main(int argc, char* argv[])
{
  bool showHelp = false;
  bool render = false;
  bool verbose = false;
  bool binary = false;
  std::string genomeFile;
  std::string outputFile;
  int scaleMultiplier = MazeDecoder::kDefaultScaleMultiplier;

  auto parser = clara::Help(showHelp)
    | clara::Arg(genomeFile, "genome")("Maze genome in protobuf text format.")
    | clara::Opt(scaleMultiplier, "scale")["--scale"]["-s"]("Length of a cell side in the scaled maze.")
    | clara::Opt(render)["--render"]["-r"]("Log the maze as ascii art.")
    | clara::Opt(outputFile, "file")["--output"]["-o"]("Write the maze structure to this file instead of the standard output.")
    | clara::Opt(binary)["--binary"]["-b"]("Write the maze structure in protobuf binary format.")
    | clara::Opt(verbose)["--verbose"]["-v"]("Log construction details.");

  auto result = parser.parse(clara::Args(argc, argv));
  if(!result || showHelp || argc == 1) {
    std::cout << parser << std::endl;
    return result ? 0 : 1;
  }
  Logger::setLevel(verbose ? spdlog::level::trace : spdlog::level::info);
  Logger logger("mazegen");
  try {
    auto genome = pbs::read_text_file<pb::MazeGenome>(genomeFile);
    MazeDecoder decoder{scaleMultiplier};
    auto maze = decoder.decode(genome);
    logger.info("genome {} {}x{} partitions {} walls {} max timesteps {} deceptive turns {}", maze.genomeId(),
                maze.width(), maze.height(), maze.numPartitions(), maze.walls().size(), maze.maxTimesteps(),
                countDeceptiveTurns(maze));
    if(render)
      logger.info("maze {}\n{}", maze.genomeId(), maze.grid().to_string());
    auto structure = toProto(maze);
    if(outputFile.empty()) {
      std::cout << pbs::to_string(structure);
    } else {
      std::ofstream out(outputFile, std::ios::binary);
      if(!out)
        throw std::runtime_error("cannot write " + outputFile);
      if(binary) {
        auto buffer = serializer::serialize(structure);
        out.write(reinterpret_cast<const char *>(buffer->data()), static_cast<std::streamsize>(buffer->size()));
      } else {
        out << pbs::to_string(structure);
      }
    }
  } catch(std::exception &e) {
    logger.error("cannot build maze from {}: {}", genomeFile, e.what());
    return 1;
  }
  return 0;
}
