#include <hayai.hpp>
#include "maze_decoder.hpp"
#include "path_analysis.hpp"
#include "serialization.hpp"
#include <random>

namespace mm = mcc::maze;

mm::pb::MazeGenome randomGenome(uint32_t id, int width, int height, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> location(0.0, 1.0);
  std::uniform_int_distribution<uint32_t> room(0, 1024);
  mm::pb::MazeGenome genome;
  genome.set_id(id);
  genome.set_width(width);
  genome.set_height(height);
  for(int i = 0; i < width * height; ++i) {
    auto *gene = genome.add_genes();
    gene->set_room_index(room(gen));
    gene->set_wall_location(location(gen));
    gene->set_passage_location(location(gen));
    gene->set_orientation_seed(i % 2 == 0);
  }
  return genome;
}

const mm::pb::MazeGenome small = randomGenome(1, 10, 10, 1);
const mm::pb::MazeGenome large = randomGenome(2, 40, 40, 2);
const mm::MazeStructure &largeMaze() {
  static const mm::MazeStructure maze = mm::MazeDecoder{}.decode(large);
  return maze;
}

BENCHMARK(Generation, Small, 10, 100)
{
  mm::MazeDecoder decoder;
  auto maze = decoder.decode(small);
}

BENCHMARK(Generation, Large, 10, 10)
{
  mm::MazeDecoder decoder;
  auto maze = decoder.decode(large);
}

BENCHMARK(Analysis, ShortestPath, 10, 100)
{
  auto distance = mm::shortestPathDistance(largeMaze().grid());
  (void)distance;
}

BENCHMARK(Analysis, Junctures, 10, 100)
{
  auto report = mm::analyzeJunctures(largeMaze().grid(), largeMaze().solutionPath());
  (void)report;
}

BENCHMARK(Serialization, MazeStructure, 10, 100)
{
  auto buffer = mm::serializer::serialize(mm::toProto(largeMaze()));
}
