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
#include <cassert>
#include <functional>
#include <sstream>
#include <vector>

namespace mcc {
namespace maze {

// Row-major width x height container addressed by (x, y), y growing downwards.
template <typename T>
class Grid {
 private:
  int _width;
  int _height;
  std::vector<T> _data;
 public:
  Grid(int width, int height, const std::function<T(int,int)> &init) : _width{width}, _height{height} {
    assert(width >= 0 && height >= 0);
    _data.reserve(static_cast<size_t>(width) * static_cast<size_t>(height));
    for(int y = 0; y < _height; ++y)
      for(int x = 0; x < _width; ++x)
        _data.emplace_back(init(x, y));
  }
  int width() const { return _width; }
  int height() const { return _height; }
  size_t size() const { return _data.size(); }
  bool contains(int x, int y) const {
    return x >= 0 && y >= 0 && x < _width && y < _height;
  }
  size_t index(int x, int y) const {
    assert(contains(x, y));
    return static_cast<size_t>(y) * _width + x;
  }
  Point position(size_t index) const {
    assert(index < _data.size());
    return Point{static_cast<int>(index % _width), static_cast<int>(index / _width)};
  }
  const T &at(int x, int y) const {
    return _data[index(x, y)];
  }
  T &at(int x, int y) {
    return _data[index(x, y)];
  }
  const T &at(const Point &pos) const {
    return at(pos.x(), pos.y());
  }
  T &at(const Point &pos) {
    return at(pos.x(), pos.y());
  }
  std::vector<Point> filter(const std::function<bool(const T&)> &pred) const {
    std::vector<Point> res;
    for(size_t i = 0; i < _data.size(); ++i)
      if(pred(_data[i]))
        res.push_back(position(i));
    return res;
  }
  std::string to_string(const std::function<char(const T&)> &render) const {
    std::stringstream ss;
    for(int y = 0; y < _height; ++y) {
      for(int x = 0; x < _width; ++x) {
        ss << render(at(x, y));
      }
      ss << "\n";
    }
    return ss.str();
  }
};

} // namespace maze
} // namespace mcc
