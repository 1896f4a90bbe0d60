#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "internal/model/entities.hpp"
#include "internal/store/entity_store.hpp"

namespace sparkscope::aggregate {

struct TaskCounts {
  std::uint64_t running   = 0;
  std::uint64_t succeeded = 0;
  std::uint64_t failed    = 0;
  std::uint64_t killed    = 0;

  void          Add(model::TaskStatus status);
  std::uint64_t Total() const {
    return running + succeeded + failed + killed;
  }
};

struct StageCounts {
  std::uint32_t pending  = 0;
  std::uint32_t active   = 0;
  std::uint32_t complete = 0;
  std::uint32_t failed   = 0;
  std::uint32_t skipped  = 0;

  void Add(model::StageStatus status);
};

/*
  Sum and maximum of every task metric, in kTaskMetricFields order.
  Metrics a task did not report contribute nothing.
*/
class MetricRollup {
 public:
  void Add(const model::TaskMetrics& metrics);

  std::uint64_t Sum(model::TaskMetrics::Value model::TaskMetrics::*field) const;
  std::uint64_t Max(model::TaskMetrics::Value model::TaskMetrics::*field) const;

  std::uint64_t SumAt(std::size_t index) const {
    return sum_[index];
  }
  std::uint64_t MaxAt(std::size_t index) const {
    return max_[index];
  }

  std::uint64_t ShuffleBytesRead() const;

 private:
  static std::size_t IndexOf(model::TaskMetrics::Value model::TaskMetrics::*field);

  std::array<std::uint64_t, model::kTaskMetricFields.size()> sum_{};
  std::array<std::uint64_t, model::kTaskMetricFields.size()> max_{};
};

struct StageSummary {
  model::StageKey key;
  TaskCounts      tasks;

  // Over tasks with both launch and finish known.
  std::optional<std::uint64_t> min_duration_ms;
  std::optional<std::uint64_t> median_duration_ms;
  std::optional<std::uint64_t> max_duration_ms;

  // Over SUCCESS tasks only.
  MetricRollup metrics;

  // Succeeded over expected, clamped to [0, 100]; 0 when expected is unknown.
  double percent_complete = 0.0;
};

struct ExecutorSummary {
  model::ExecutorId id;
  TaskCounts        tasks;

  // Over every finished task with a known launch time.
  std::uint64_t task_time_ms = 0;

  // Over SUCCESS tasks only.
  MetricRollup metrics;

  std::uint64_t ActiveTasks() const {
    return tasks.running;
  }
};

struct JobSummary {
  model::JobId  id = 0;
  StageCounts   stages;
  TaskCounts    tasks;
  std::uint64_t tasks_expected = 0;

  std::optional<std::uint64_t> duration_ms;
  bool                         in_progress = false;
};

struct ApplicationSummary {
  std::optional<std::uint64_t> duration_ms;
  bool                         in_progress = false;

  std::size_t jobs      = 0;
  std::size_t stages    = 0;
  std::size_t tasks     = 0;
  std::size_t executors = 0;
};

/*
  Read-only rollups computed from the current store contents.

  Nothing here is cached, so a summary can never drift from its tasks.
  The store must outlive the aggregator and must not be mutated while a
  summary is being computed.
*/
class Aggregator {
 public:
  explicit Aggregator(const store::EntityStore& store);

  // Throw util::NotFound for unknown identifiers.
  StageSummary    SummarizeStage(const model::StageKey& key) const;
  ExecutorSummary SummarizeExecutor(const model::ExecutorId& id) const;
  JobSummary      SummarizeJob(model::JobId id) const;

  ApplicationSummary SummarizeApplication() const;

  static double PercentComplete(std::uint64_t succeeded, const std::optional<std::uint64_t>& expected);

 private:
  const store::EntityStore& store_;
};

} // namespace sparkscope::aggregate
