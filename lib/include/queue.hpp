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

#include <mutex>
#include <vector>

namespace mcc {
namespace maze {

// Collects results pushed from worker threads until they are drained.
template <typename T>
class Queue
{
 private:
  std::vector<T> _items;
  std::mutex _mutex;

 public:
  void push(T&& item)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _items.push_back(std::move(item));
  }

  // Takes every item pushed so far, in push order.
  std::vector<T> drain()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<T> items;
    items.swap(_items);
    return items;
  }
};

} // namespace maze
} // namespace mcc
