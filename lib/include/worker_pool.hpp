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

#include "asio.hpp"
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace mcc {
namespace maze {

class WorkerPool {
  using context_work = asio::executor_work_guard<asio::io_context::executor_type>;
 private:
  std::vector<std::shared_ptr<asio::io_context>> _io_contexts;
  std::vector<context_work> _works; // keeps the io_contexts running until wait()
  std::size_t _next_io_context;
  std::vector<std::shared_ptr<std::thread>> _threads;
 public:
  explicit WorkerPool(std::size_t pool_size) : _next_io_context{0} {
    if(pool_size == 0)
      throw std::runtime_error("worker pool size is 0");
    for (std::size_t i = 0; i < pool_size; ++i) {
      auto io_context = std::make_shared<asio::io_context>();
      _io_contexts.emplace_back(io_context);
      _works.push_back(asio::make_work_guard(*io_context));
    }
  }
  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;
  ~WorkerPool() {
    stop();
    join();
  }
  std::size_t size() const { return _io_contexts.size(); }
  void run() {
    for(auto &context : _io_contexts) {
      auto io_context = context;
      _threads.emplace_back(std::make_shared<std::thread>([io_context](){ io_context->run(); }));
    }
  }
  void join() {
    for(auto &t : _threads)
      if(t->joinable())
        t->join();
  }
  void stop() {
    for (auto &context : _io_contexts)
      context->stop();
  }
  /// Lets the io_contexts run out of work, then joins the threads.
  void wait() {
    for(auto &work : _works)
      work.reset();
    join();
  }
  asio::io_context& getIoContext() {
    asio::io_context& io_context = *_io_contexts[_next_io_context];
    _next_io_context = (_next_io_context + 1) % _io_contexts.size();
    return io_context;
  }
  /// Posts task on the next io_context. Exceptions thrown by task are rethrown by the future.
  template <typename F>
  std::future<void> post(F task) {
    auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
    auto future = packaged->get_future();
    asio::post(getIoContext(), [packaged]() { (*packaged)(); });
    return future;
  }
};

} // namespace maze
} // namespace mcc
