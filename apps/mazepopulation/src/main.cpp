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
#include <thread>
#include <algorithm>
#include "clara.hpp"
#include "logger.hpp"
#include "maze_decoder.hpp"
#include "population_analysis.hpp"
#include "serialization.hpp"

using namespace mcc::maze;

int main(int argc, char* argv[])
{
  bool showHelp = false;
  bool verbose = false;
  bool pairwise = false;
  std::string populationFile;
  std::string outputFile;
  int scaleMultiplier = MazeDecoder::kDefaultScaleMultiplier;
  uint32_t nbThreads = std::max(1u, std::thread::hardware_concurrency());

  auto parser = clara::Help(showHelp)
    | clara::Arg(populationFile, "population")("Maze population in protobuf text format.")
    | clara::Opt(scaleMultiplier, "scale")["--scale"]["-s"]("Length of a cell side in the scaled mazes.")
    | clara::Opt(nbThreads, "threads")["--threads"]["-t"]("Number of analysis threads.")
    | clara::Opt(pairwise)["--pairwise"]["-p"]("Also report the diversity of every pair of mazes.")
    | clara::Opt(outputFile, "file")["--output"]["-o"]("Write the report to this file instead of the standard output.")
    | clara::Opt(verbose)["--verbose"]["-v"]("Log construction details.");

  auto result = parser.parse(clara::Args(argc, argv));
  if(!result || showHelp || argc == 1) {
    std::cout << parser << std::endl;
    return result ? 0 : 1;
  }
  Logger::setLevel(verbose ? spdlog::level::trace : spdlog::level::info);
  Logger logger("mazepopulation");
  try {
    auto genomes = pbs::read_text_file<pb::MazePopulation>(populationFile);
    MazeDecoder decoder{scaleMultiplier};
    auto population = decoder.decode(genomes);
    logger.info("decoded {} mazes from {}", population.size(), populationFile);

    PopulationAnalyzer analyzer{nbThreads};
    pb::PopulationReport report;
    for(auto &unit : analyzer.computeDeceptiveTurns(population))
      *report.add_deceptive_turns() = toProto(unit);
    for(auto &unit : analyzer.computePopulationDiversity(population))
      *report.add_diversity() = toProto(unit);
    if(pairwise)
      for(auto &pair : analyzer.computePairwiseDiversity(population))
        *report.add_pairwise_diversity() = toProto(pair);

    if(outputFile.empty()) {
      std::cout << pbs::to_string(report);
    } else {
      std::ofstream out(outputFile);
      if(!out)
        throw std::runtime_error("cannot write " + outputFile);
      out << pbs::to_string(report);
    }
  } catch(std::exception &e) {
    logger.error("cannot analyse population {}: {}", populationFile, e.what());
    return 1;
  }
  return 0;
}
