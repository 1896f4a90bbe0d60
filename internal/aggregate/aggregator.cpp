#include "aggregator.hpp"

#include <algorithm>
#include <vector>

#include "internal/util/errors.hpp"

namespace sparkscope::aggregate {

using namespace sparkscope::model;

// ------------------------------------------------------------
// Counters
// ------------------------------------------------------------

void TaskCounts::Add(TaskStatus status) {
  switch (status) {
    case TaskStatus::kRunning:
      ++running;
      break;
    case TaskStatus::kSuccess:
      ++succeeded;
      break;
    case TaskStatus::kFailed:
      ++failed;
      break;
    case TaskStatus::kKilled:
      ++killed;
      break;
  }
}

void StageCounts::Add(StageStatus status) {
  switch (status) {
    case StageStatus::kPending:
      ++pending;
      break;
    case StageStatus::kActive:
      ++active;
      break;
    case StageStatus::kComplete:
      ++complete;
      break;
    case StageStatus::kFailed:
      ++failed;
      break;
    case StageStatus::kSkipped:
      ++skipped;
      break;
  }
}

// ------------------------------------------------------------
// MetricRollup
// ------------------------------------------------------------

void MetricRollup::Add(const TaskMetrics& metrics) {
  for (std::size_t i = 0; i < kTaskMetricFields.size(); ++i) {
    const auto& value = metrics.*kTaskMetricFields[i].field;
    if (!value) continue;
    sum_[i] += *value;
    max_[i] = std::max(max_[i], *value);
  }
}

std::size_t MetricRollup::IndexOf(TaskMetrics::Value TaskMetrics::*field) {
  for (std::size_t i = 0; i < kTaskMetricFields.size(); ++i) {
    if (kTaskMetricFields[i].field == field) return i;
  }
  throw util::InvalidArgument("unknown task metric field");
}

std::uint64_t MetricRollup::Sum(TaskMetrics::Value TaskMetrics::*field) const {
  return sum_[IndexOf(field)];
}

std::uint64_t MetricRollup::Max(TaskMetrics::Value TaskMetrics::*field) const {
  return max_[IndexOf(field)];
}

std::uint64_t MetricRollup::ShuffleBytesRead() const {
  return Sum(&TaskMetrics::shuffle_remote_bytes_read) + Sum(&TaskMetrics::shuffle_local_bytes_read);
}

// ------------------------------------------------------------
// Aggregator
// ------------------------------------------------------------

Aggregator::Aggregator(const store::EntityStore& store) : store_(store) {
}

double Aggregator::PercentComplete(std::uint64_t succeeded, const std::optional<std::uint64_t>& expected) {
  if (!expected || *expected == 0) {
    return 0.0;
  }
  const double pct = 100.0 * static_cast<double>(succeeded) / static_cast<double>(*expected);
  return std::clamp(pct, 0.0, 100.0);
}

StageSummary Aggregator::SummarizeStage(const StageKey& key) const {
  const auto* stage = store_.FindStage(key);
  if (!stage) {
    throw util::NotFound("stage attempt not found: " + ToString(key));
  }

  StageSummary summary;
  summary.key = key;

  std::vector<std::uint64_t> durations;
  for (const auto* task : store_.TasksForStage(key)) {
    summary.tasks.Add(task->status);
    if (auto elapsed = util::ElapsedMillis(task->launch_time, task->finish_time)) {
      durations.push_back(*elapsed);
    }
    if (task->status == TaskStatus::kSuccess) {
      summary.metrics.Add(task->metrics);
    }
  }

  if (!durations.empty()) {
    std::sort(durations.begin(), durations.end());
    const auto mid             = durations.size() / 2;
    summary.min_duration_ms    = durations.front();
    summary.max_duration_ms    = durations.back();
    summary.median_duration_ms = durations.size() % 2 == 1 ? durations[mid] : (durations[mid - 1] + durations[mid]) / 2;
  }

  summary.percent_complete = PercentComplete(summary.tasks.succeeded, stage->num_tasks);
  return summary;
}

ExecutorSummary Aggregator::SummarizeExecutor(const ExecutorId& id) const {
  if (!store_.FindExecutor(id)) {
    throw util::NotFound("executor not found: " + id);
  }

  ExecutorSummary summary;
  summary.id = id;

  for (const auto* task : store_.TasksForExecutor(id)) {
    summary.tasks.Add(task->status);
    if (auto elapsed = util::ElapsedMillis(task->launch_time, task->finish_time)) {
      summary.task_time_ms += *elapsed;
    }
    if (task->status == TaskStatus::kSuccess) {
      summary.metrics.Add(task->metrics);
    }
  }
  return summary;
}

JobSummary Aggregator::SummarizeJob(JobId id) const {
  const auto* job = store_.FindJob(id);
  if (!job) {
    throw util::NotFound("job not found: " + std::to_string(id));
  }

  JobSummary summary;
  summary.id = id;

  for (const auto stage_id : job->stage_ids) {
    const auto attempts = store_.AttemptsOf(stage_id);
    if (attempts.empty()) continue;

    const auto* latest = attempts.back();
    summary.stages.Add(latest->status);
    if (latest->status != StageStatus::kSkipped) {
      summary.tasks_expected += latest->num_tasks.value_or(0);
    }

    for (const auto* attempt : attempts) {
      for (const auto* task : store_.TasksForStage(attempt->key)) {
        summary.tasks.Add(task->status);
      }
    }
  }

  summary.in_progress = job->status == JobStatus::kRunning;
  if (!summary.in_progress) {
    summary.duration_ms = util::ElapsedMillis(job->submission_time, job->completion_time);
  }
  return summary;
}

ApplicationSummary Aggregator::SummarizeApplication() const {
  ApplicationSummary summary;
  summary.jobs      = store_.JobCount();
  summary.stages    = store_.Stages().size();
  summary.tasks     = store_.TaskCount();
  summary.executors = store_.ExecutorCount();

  if (const auto* app = store_.FindApplication()) {
    summary.in_progress = app->status == ApplicationStatus::kRunning;
    if (!summary.in_progress) {
      summary.duration_ms = util::ElapsedMillis(app->start_time, app->end_time);
    }
  }
  return summary;
}

} // namespace sparkscope::aggregate
