#pragma once

#include <cstdint>
#include <string>
#include <tuple>

namespace sparkscope::model {

using JobId      = std::uint64_t;
using StageId    = std::uint64_t;
using TaskId     = std::uint64_t;
using ExecutorId = std::string;

struct StageKey {
  StageId       stage_id = 0;
  std::uint32_t attempt  = 0;

  bool operator==(const StageKey& o) const noexcept {
    return stage_id == o.stage_id && attempt == o.attempt;
  }
  bool operator!=(const StageKey& o) const noexcept {
    return !(*this == o);
  }
  bool operator<(const StageKey& o) const noexcept {
    return std::tie(stage_id, attempt) < std::tie(o.stage_id, o.attempt);
  }
};

struct TaskKey {
  TaskId        task_id = 0;
  std::uint32_t attempt = 0;

  bool operator==(const TaskKey& o) const noexcept {
    return task_id == o.task_id && attempt == o.attempt;
  }
  bool operator!=(const TaskKey& o) const noexcept {
    return !(*this == o);
  }
  bool operator<(const TaskKey& o) const noexcept {
    return std::tie(task_id, attempt) < std::tie(o.task_id, o.attempt);
  }
};

inline std::string ToString(const StageKey& key) {
  return std::to_string(key.stage_id) + "." + std::to_string(key.attempt);
}

inline std::string ToString(const TaskKey& key) {
  return std::to_string(key.task_id) + "." + std::to_string(key.attempt);
}

} // namespace sparkscope::model
