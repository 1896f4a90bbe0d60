#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/ids.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/task_metrics.hpp"
#include "internal/util/time.hpp"

namespace sparkscope::model {

using util::TimePoint;

struct Application {
  std::string                app_id;
  std::string                name;
  std::optional<std::string> attempt_id;
  std::optional<std::string> user;
  std::optional<std::string> version;

  std::optional<TimePoint> start_time;
  std::optional<TimePoint> end_time;

  ApplicationStatus status = ApplicationStatus::kRunning;

  // False for a placeholder created by an end event.
  bool start_seen = false;
};

struct Job {
  JobId id = 0;

  std::optional<std::string> description;
  std::optional<std::string> job_group;

  std::optional<TimePoint> submission_time;
  std::optional<TimePoint> completion_time;

  JobStatus                  status = JobStatus::kRunning;
  std::optional<std::string> failure_reason;

  // Insertion-ordered, no duplicates.
  std::vector<StageId> stage_ids;

  bool start_seen = false;

  void AddStage(StageId stage_id);
};

struct Stage {
  StageKey key;

  std::optional<std::string>   name;
  std::optional<std::uint64_t> num_tasks;
  std::optional<JobId>         job_id;
  std::vector<StageId>         parent_ids;
  std::uint32_t                rdd_count = 0;

  std::optional<TimePoint> submission_time;
  std::optional<TimePoint> completion_time;

  StageStatus                status = StageStatus::kPending;
  std::optional<std::string> failure_reason;

  std::set<TaskKey> task_ids;
};

struct Task {
  TaskKey  key;
  StageKey stage;

  ExecutorId                   executor_id;
  std::optional<std::string>   host;
  std::optional<std::uint64_t> index;
  bool                         speculative = false;

  std::optional<TimePoint> launch_time;
  std::optional<TimePoint> finish_time;

  TaskStatus                 status = TaskStatus::kRunning;
  std::optional<std::string> failure_reason;
  std::optional<std::string> failure_category;

  TaskMetrics metrics;

  bool start_seen = false;
};

struct Executor {
  ExecutorId id;

  std::optional<std::string>   host;
  std::optional<std::uint32_t> total_cores;
  std::optional<std::uint64_t> max_memory;

  std::optional<TimePoint> added_time;
  std::optional<TimePoint> removed_time;

  ExecutorStatus             status = ExecutorStatus::kActive;
  std::optional<std::string> removal_reason;
};

enum class EnvironmentCategory : std::uint8_t {
  kSparkProperties  = 0,
  kSystemProperties = 1,
  kClasspath        = 2,
  kHadoopProperties = 3,
};

inline constexpr std::size_t kEnvironmentCategoryCount = 4;

constexpr std::string_view ToString(EnvironmentCategory category) {
  switch (category) {
    case EnvironmentCategory::kSparkProperties:
      return "Spark Properties";
    case EnvironmentCategory::kSystemProperties:
      return "System Properties";
    case EnvironmentCategory::kClasspath:
      return "Classpath Entries";
    case EnvironmentCategory::kHadoopProperties:
      return "Hadoop Properties";
  }
  return "Unknown";
}

using PropertyList = std::vector<std::pair<std::string, std::string>>;

struct Environment {
  std::map<EnvironmentCategory, PropertyList> categories;
};

inline void Job::AddStage(StageId stage_id) {
  for (const auto id : stage_ids) {
    if (id == stage_id) return;
  }
  stage_ids.push_back(stage_id);
}

} // namespace sparkscope::model
