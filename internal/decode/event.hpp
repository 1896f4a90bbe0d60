#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/entities.hpp"

namespace sparkscope::decode {

using model::TimePoint;

struct StageInfo {
  model::StageKey key;

  std::optional<std::string>    name;
  std::optional<std::uint64_t>  num_tasks;
  std::vector<model::StageId>   parent_ids;
  std::uint32_t                 rdd_count = 0;
  std::optional<TimePoint>      submission_time;
  std::optional<TimePoint>      completion_time;
  std::optional<std::string>    failure_reason;
};

struct TaskInfo {
  model::TaskKey key;

  std::optional<std::uint64_t> index;
  model::ExecutorId            executor_id;
  std::optional<std::string>   host;
  std::optional<TimePoint>     launch_time;
  std::optional<TimePoint>     finish_time;
  bool                         speculative = false;
  bool                         failed      = false;
  bool                         killed      = false;
};

struct TaskEndReason {
  // Discriminator of the reason record, e.g. "Success", "ExceptionFailure".
  std::string kind;
  // Kind plus any detail fields, kept for display.
  std::string text;
};

struct ApplicationStart {
  std::string                app_id;
  std::string                name;
  std::optional<std::string> attempt_id;
  std::optional<std::string> user;
  std::optional<TimePoint>   timestamp;
};

struct ApplicationEnd {
  std::optional<TimePoint> timestamp;
};

struct LogStart {
  std::optional<std::string> version;
};

struct JobStart {
  model::JobId               job_id = 0;
  std::optional<TimePoint>   submission_time;
  std::vector<model::StageId> stage_ids;
  std::vector<StageInfo>     stage_infos;
  std::optional<std::string> description;
  std::optional<std::string> job_group;
};

struct JobEnd {
  model::JobId               job_id = 0;
  std::optional<TimePoint>   completion_time;
  std::string                result;
  std::optional<std::string> message;
};

struct StageSubmitted {
  StageInfo                   stage;
  std::optional<model::JobId> job_id;
};

struct StageCompleted {
  StageInfo stage;
};

struct TaskStart {
  model::StageKey stage;
  TaskInfo        info;
};

struct TaskEnd {
  model::StageKey                   stage;
  TaskInfo                          info;
  TaskEndReason                     reason;
  std::optional<model::TaskMetrics> metrics;
};

struct ExecutorAdded {
  model::ExecutorId            executor_id;
  std::optional<TimePoint>     timestamp;
  std::optional<std::string>   host;
  std::optional<std::uint32_t> total_cores;
};

struct ExecutorRemoved {
  model::ExecutorId          executor_id;
  std::optional<TimePoint>   timestamp;
  std::optional<std::string> reason;
};

struct BlockManagerAdded {
  model::ExecutorId            executor_id;
  std::optional<std::string>   host;
  std::optional<std::uint64_t> max_memory;
};

struct EnvironmentUpdate {
  std::map<model::EnvironmentCategory, model::PropertyList> categories;
};

struct Unrecognized {
  std::string kind;
};

using Event = std::variant<ApplicationStart, ApplicationEnd, LogStart, JobStart, JobEnd, StageSubmitted, StageCompleted, TaskStart, TaskEnd,
                           ExecutorAdded, ExecutorRemoved, BlockManagerAdded, EnvironmentUpdate, Unrecognized>;

} // namespace sparkscope::decode
