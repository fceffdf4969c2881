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

#include "common.hpp"

namespace mcc {
namespace maze {

std::string to_string(Direction dir) {
  switch(dir) {
  case Direction::North:
    return "N";
  case Direction::East:
    return "E";
  case Direction::South:
    return "S";
  case Direction::West:
    return "W";
  }
  return "?";
}

} // namespace maze
} // namespace mcc
