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

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <utility>

// Define MCC_DEBUG_ON before including this header to keep the debug traces of a translation unit.
#if defined(MCC_DEBUG_ON) && !defined(NDEBUG)
#define MCC_DEBUG(logger, ...) logger.debug(__VA_ARGS__)
#else
#define MCC_DEBUG(logger, ...)
#endif

namespace mcc {
namespace maze {

class Logger {
 private:
  std::string section_;
  std::shared_ptr<spdlog::logger> logger_;

  std::string prefixed(const std::string &fmt) const {
    return "[" + section_ + "] " + fmt;
  }

 public:
  static constexpr const char *logger_name = "mcc-maze";

  explicit Logger(std::string section);

  template <typename... Args>
  void trace(const std::string &fmt, Args &&... args) {
    logger_->trace(fmt::runtime(prefixed(fmt)), std::forward<Args>(args)...);
  }
  template <typename... Args>
  void debug(const std::string &fmt, Args &&... args) {
    logger_->debug(fmt::runtime(prefixed(fmt)), std::forward<Args>(args)...);
  }
  template <typename... Args>
  void info(const std::string &fmt, Args &&... args) {
    logger_->info(fmt::runtime(prefixed(fmt)), std::forward<Args>(args)...);
  }
  template <typename... Args>
  void warn(const std::string &fmt, Args &&... args) {
    logger_->warn(fmt::runtime(prefixed(fmt)), std::forward<Args>(args)...);
  }
  template <typename... Args>
  void error(const std::string &fmt, Args &&... args) {
    logger_->error(fmt::runtime(prefixed(fmt)), std::forward<Args>(args)...);
  }

  static void setLevel(spdlog::level::level_enum level);
};

} // namespace maze
} // namespace mcc
