#ifndef CORE_RUNNING_TASK_HPP
#define CORE_RUNNING_TASK_HPP

#include <chrono>
#include <string>

#include "core/unit_key.hpp"

namespace core {

struct RunningTaskInfo {
  UnitKey key;
  std::string description;
  int32_t attempt;
  std::chrono::time_point<std::chrono::system_clock> started;

  RunningTaskInfo(UnitKey unit_key, int32_t attempt)
      : key(std::move(unit_key)),
        description(key.ToString()),
        attempt(attempt),
        started(std::chrono::system_clock::now()) {}
};

}  // namespace core

#endif
