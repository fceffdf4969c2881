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

#include "population_analysis.hpp"
#include "path_analysis.hpp"
#include "queue.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <future>
#include <utility>

namespace mcc {
namespace maze {

Logger PopulationAnalyzer::logger = Logger("population-analyzer");

namespace {

void checkPopulation(const Population &population) {
  for(auto &maze : population)
    if(!maze)
      throw MazeStructureError("population contains an empty maze");
}

// Runs task(i) for every i in [0, count) on the pool and returns the results in index order.
template <typename T>
std::vector<T> runIndexed(std::size_t nbThreads, std::size_t count, const std::function<T(std::size_t)> &task) {
  Queue<std::pair<std::size_t, T>> results;
  std::vector<std::future<void>> futures;
  {
    WorkerPool pool(std::min(nbThreads, std::max<std::size_t>(count, 1)));
    pool.run();
    for(std::size_t i = 0; i < count; ++i)
      futures.push_back(pool.post([i, &task, &results]() { results.push(std::make_pair(i, task(i))); }));
    pool.wait();
  }
  for(auto &future : futures)
    future.get();
  auto items = results.drain();
  std::sort(items.begin(), items.end(), [](const std::pair<std::size_t, T> &lhs, const std::pair<std::size_t, T> &rhs) {
    return lhs.first < rhs.first;
  });
  std::vector<T> res;
  res.reserve(items.size());
  for(auto &item : items)
    res.push_back(item.second);
  return res;
}

} // namespace

PopulationAnalyzer::PopulationAnalyzer(std::size_t nbThreads) : nbThreads_{nbThreads} {
  if(nbThreads == 0)
    throw std::runtime_error("population analysis needs at least one thread");
}

std::vector<DeceptiveTurnUnit> PopulationAnalyzer::computeDeceptiveTurns(const Population &population) const {
  checkPopulation(population);
  auto res = runIndexed<DeceptiveTurnUnit>(nbThreads_, population.size(), [&population](std::size_t i) {
      return DeceptiveTurnUnit{population[i]->genomeId(), countDeceptiveTurns(*population[i])};
    });
  logger.debug("PopulationAnalyzer::computeDeceptiveTurns {} mazes on {} threads", population.size(), nbThreads_);
  return res;
}

std::vector<MazeDiversityPair> PopulationAnalyzer::computePairwiseDiversity(const Population &population) const {
  checkPopulation(population);
  std::vector<std::pair<std::size_t, std::size_t>> pairs;
  for(std::size_t i = 0; i < population.size(); ++i)
    for(std::size_t j = i + 1; j < population.size(); ++j)
      pairs.emplace_back(i, j);
  auto res = runIndexed<MazeDiversityPair>(nbThreads_, pairs.size(), [&population, &pairs](std::size_t k) {
      auto &lhs = *population[pairs[k].first];
      auto &rhs = *population[pairs[k].second];
      return MazeDiversityPair{lhs.genomeId(), rhs.genomeId(), computeMazeDiversity(lhs, rhs)};
    });
  logger.debug("PopulationAnalyzer::computePairwiseDiversity {} pairs on {} threads", pairs.size(), nbThreads_);
  return res;
}

std::vector<MazeDiversityUnit> PopulationAnalyzer::computePopulationDiversity(const Population &population) const {
  checkPopulation(population);
  auto res = runIndexed<MazeDiversityUnit>(nbThreads_, population.size(), [&population](std::size_t i) {
      double total = 0.0;
      for(std::size_t j = 0; j < population.size(); ++j)
        if(j != i)
          total += computeMazeDiversity(*population[i], *population[j]);
      double score = population.size() > 1 ? total / static_cast<double>(population.size() - 1) : 0.0;
      return MazeDiversityUnit{population[i]->genomeId(), score};
    });
  logger.debug("PopulationAnalyzer::computePopulationDiversity {} mazes on {} threads", population.size(), nbThreads_);
  return res;
}

} // namespace maze
} // namespace mcc
