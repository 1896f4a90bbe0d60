#include "snapshot_builder.hpp"

#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/format.hpp"
#include "internal/util/time.hpp"

namespace sparkscope::snapshot {

using namespace sparkscope::model;
namespace v1 = sparkscope::history::v1;

namespace {

std::string Label(std::string_view label) {
  return std::string(label);
}

std::string OrDash(const std::optional<std::string>& value) {
  return value ? *value : "-";
}

std::string BytesOrDash(const TaskMetrics::Value& value) {
  return value ? util::FormatBytes(*value) : "-";
}

} // namespace

SnapshotBuilder::SnapshotBuilder(const store::EntityStore& store) : store_(store), aggregator_(store) {
}

// ------------------------------------------------------------
// Application
// ------------------------------------------------------------

v1::ApplicationView SnapshotBuilder::BuildApplication() const {
  v1::ApplicationView view;

  const auto* app = store_.FindApplication();
  if (!app) {
    view.set_known(false);
    view.set_status("UNKNOWN");
    return view;
  }

  const auto summary = aggregator_.SummarizeApplication();

  view.set_known(true);
  view.set_app_id(app->app_id);
  view.set_name(app->name);
  view.set_attempt_id(app->attempt_id.value_or(""));
  view.set_user(OrDash(app->user));
  view.set_version(OrDash(app->version));
  view.set_status(Label(ToString(app->status)));
  view.set_start_time(util::FormatTimestamp(app->start_time));
  view.set_end_time(util::FormatTimestamp(app->end_time));
  view.set_duration(summary.in_progress ? "in progress" : util::FormatDuration(summary.duration_ms));
  view.set_duration_ms(summary.duration_ms.value_or(0));
  return view;
}

// ------------------------------------------------------------
// Jobs
// ------------------------------------------------------------

v1::JobsView SnapshotBuilder::BuildJobs() const {
  v1::JobsView view;

  for (const auto* job : store_.JobsInSubmissionOrder()) {
    const auto summary = aggregator_.SummarizeJob(job->id);
    auto*      row     = view.add_rows();

    row->set_job_id(job->id);
    row->set_name(job->description ? *job->description : "Job " + std::to_string(job->id));
    row->set_status(Label(ToString(job->status)));
    row->set_submission_time(util::FormatTimestamp(job->submission_time));
    row->set_duration(summary.in_progress ? "in progress" : util::FormatDuration(summary.duration_ms));
    for (const auto stage_id : job->stage_ids) {
      row->add_stage_ids(stage_id);
    }
    row->set_stages_complete(summary.stages.complete);
    row->set_stages_failed(summary.stages.failed);
    row->set_stages_skipped(summary.stages.skipped);
    row->set_stages_active(summary.stages.active);
    row->set_tasks_total(summary.tasks_expected);
    row->set_tasks_succeeded(summary.tasks.succeeded);
    row->set_tasks_failed(summary.tasks.failed);
    row->set_tasks_killed(summary.tasks.killed);
    row->set_tasks_active(summary.tasks.running);
    row->set_failure_reason(job->failure_reason.value_or(""));

    switch (job->status) {
      case JobStatus::kRunning:
        view.set_running(view.running() + 1);
        break;
      case JobStatus::kSucceeded:
        view.set_succeeded(view.succeeded() + 1);
        break;
      case JobStatus::kFailed:
        view.set_failed(view.failed() + 1);
        break;
    }
  }
  return view;
}

// ------------------------------------------------------------
// Stages
// ------------------------------------------------------------

v1::StageRow SnapshotBuilder::BuildStageRow(const Stage& stage, const aggregate::StageSummary& summary) const {
  v1::StageRow row;
  row.set_stage_id(stage.key.stage_id);
  row.set_attempt(stage.key.attempt);
  row.set_name(stage.name ? *stage.name : "Stage " + std::to_string(stage.key.stage_id));
  row.set_status(Label(ToString(stage.status)));
  row.set_tasks_expected(stage.num_tasks.value_or(0));
  row.set_tasks_succeeded(summary.tasks.succeeded);
  row.set_tasks_failed(summary.tasks.failed);
  row.set_tasks_killed(summary.tasks.killed);
  row.set_tasks_running(summary.tasks.running);
  row.set_percent_complete(summary.percent_complete);
  row.set_submission_time(util::FormatTimestamp(stage.submission_time));

  if (auto elapsed = util::ElapsedMillis(stage.submission_time, stage.completion_time)) {
    row.set_duration(util::FormatDuration(*elapsed));
  } else if (stage.status == StageStatus::kActive) {
    row.set_duration("running");
  } else {
    row.set_duration("-");
  }

  const auto& m = summary.metrics;
  row.set_input(util::FormatBytes(m.Sum(&TaskMetrics::input_bytes_read)));
  row.set_output(util::FormatBytes(m.Sum(&TaskMetrics::output_bytes_written)));
  row.set_shuffle_read(util::FormatBytes(m.ShuffleBytesRead()));
  row.set_shuffle_write(util::FormatBytes(m.Sum(&TaskMetrics::shuffle_bytes_written)));
  row.set_memory_spilled(util::FormatBytes(m.Sum(&TaskMetrics::memory_bytes_spilled)));
  row.set_disk_spilled(util::FormatBytes(m.Sum(&TaskMetrics::disk_bytes_spilled)));
  row.set_failure_reason(stage.failure_reason.value_or(""));
  if (stage.job_id) {
    row.set_has_job(true);
    row.set_job_id(*stage.job_id);
  }
  return row;
}

v1::StagesView SnapshotBuilder::BuildStages() const {
  v1::StagesView view;

  for (const auto& [key, stage] : store_.Stages()) {
    *view.add_rows() = BuildStageRow(stage, aggregator_.SummarizeStage(key));

    switch (stage.status) {
      case StageStatus::kPending:
        view.set_pending(view.pending() + 1);
        break;
      case StageStatus::kActive:
        view.set_active(view.active() + 1);
        break;
      case StageStatus::kComplete:
        view.set_complete(view.complete() + 1);
        break;
      case StageStatus::kFailed:
        view.set_failed(view.failed() + 1);
        break;
      case StageStatus::kSkipped:
        view.set_skipped(view.skipped() + 1);
        break;
    }
  }
  return view;
}

v1::StageDetail SnapshotBuilder::BuildStageDetail(const StageKey& key) const {
  const auto* stage = store_.FindStage(key);
  if (!stage) {
    throw util::NotFound("stage attempt not found: " + ToString(key));
  }

  const auto      summary = aggregator_.SummarizeStage(key);
  v1::StageDetail detail;
  *detail.mutable_stage() = BuildStageRow(*stage, summary);
  detail.set_min_duration(util::FormatDuration(summary.min_duration_ms));
  detail.set_median_duration(util::FormatDuration(summary.median_duration_ms));
  detail.set_max_duration(util::FormatDuration(summary.max_duration_ms));

  for (std::size_t i = 0; i < kTaskMetricFields.size(); ++i) {
    auto* metric = detail.add_metrics();
    metric->set_name(std::string(kTaskMetricFields[i].name));
    metric->set_sum(summary.metrics.SumAt(i));
    metric->set_max(summary.metrics.MaxAt(i));
  }
  return detail;
}

// ------------------------------------------------------------
// Tasks
// ------------------------------------------------------------

v1::TasksView SnapshotBuilder::BuildTasks(const StageKey& key) const {
  if (!store_.FindStage(key)) {
    throw util::NotFound("stage attempt not found: " + ToString(key));
  }

  v1::TasksView view;
  view.set_stage_id(key.stage_id);
  view.set_attempt(key.attempt);

  // Launch order rather than the stage's id order.
  for (const auto* task : store_.TasksInLaunchOrder()) {
    if (task->stage != key) continue;

    auto* row = view.add_rows();
    row->set_task_id(task->key.task_id);
    row->set_attempt(task->key.attempt);
    row->set_index(task->index.value_or(0));
    row->set_executor_id(task->executor_id);
    row->set_host(OrDash(task->host));
    row->set_status(Label(ToString(task->status)));
    row->set_launch_time(util::FormatTimestamp(task->launch_time));
    row->set_duration(util::FormatDuration(util::ElapsedMillis(task->launch_time, task->finish_time)));
    row->set_gc_time(util::FormatDuration(task->metrics.gc_time_ms));
    row->set_memory_spilled(BytesOrDash(task->metrics.memory_bytes_spilled));
    row->set_disk_spilled(BytesOrDash(task->metrics.disk_bytes_spilled));
    row->set_shuffle_read(BytesOrDash(task->metrics.ShuffleBytesRead()));
    row->set_shuffle_write(BytesOrDash(task->metrics.shuffle_bytes_written));
    row->set_failure_reason(task->failure_reason.value_or(""));
    row->set_category(task->failure_category.value_or(""));
    row->set_speculative(task->speculative);
  }
  return view;
}

// ------------------------------------------------------------
// Executors
// ------------------------------------------------------------

v1::ExecutorsView SnapshotBuilder::BuildExecutors() const {
  v1::ExecutorsView view;
  std::uint64_t     total_memory = 0;

  for (const auto* executor : store_.ExecutorsInAddOrder()) {
    const auto summary = aggregator_.SummarizeExecutor(executor->id);
    auto*      row     = view.add_rows();

    row->set_executor_id(executor->id);
    row->set_host(OrDash(executor->host));
    row->set_status(Label(ToString(executor->status)));
    row->set_cores(executor->total_cores ? std::to_string(*executor->total_cores) : "-");
    row->set_max_memory(BytesOrDash(executor->max_memory));
    row->set_active_tasks(static_cast<std::uint32_t>(summary.ActiveTasks()));
    row->set_tasks_complete(summary.tasks.succeeded);
    row->set_tasks_failed(summary.tasks.failed);
    row->set_tasks_killed(summary.tasks.killed);
    row->set_task_time(util::FormatDuration(summary.task_time_ms));
    row->set_gc_time(util::FormatDuration(summary.metrics.Sum(&TaskMetrics::gc_time_ms)));
    row->set_input(util::FormatBytes(summary.metrics.Sum(&TaskMetrics::input_bytes_read)));
    row->set_shuffle_read(util::FormatBytes(summary.metrics.ShuffleBytesRead()));
    row->set_shuffle_write(util::FormatBytes(summary.metrics.Sum(&TaskMetrics::shuffle_bytes_written)));
    row->set_added_time(util::FormatTimestamp(executor->added_time));
    row->set_removed_time(util::FormatTimestamp(executor->removed_time));
    row->set_removal_reason(executor->removal_reason.value_or(""));

    if (executor->status == ExecutorStatus::kActive) {
      view.set_active(view.active() + 1);
    } else {
      view.set_removed(view.removed() + 1);
    }
    view.set_total_cores(view.total_cores() + executor->total_cores.value_or(0));
    total_memory += executor->max_memory.value_or(0);
  }

  view.set_total_memory(util::FormatBytes(total_memory));
  return view;
}

// ------------------------------------------------------------
// Environment
// ------------------------------------------------------------

v1::EnvironmentView SnapshotBuilder::BuildEnvironment() const {
  v1::EnvironmentView view;

  for (const auto& [category, properties] : store_.environment().categories) {
    auto* out = view.add_categories();
    out->set_name(std::string(ToString(category)));
    for (const auto& [key, value] : properties) {
      auto* prop = out->add_properties();
      prop->set_key(key);
      prop->set_value(value);
    }
  }
  return view;
}

v1::Snapshot SnapshotBuilder::Build() const {
  v1::Snapshot snapshot;
  *snapshot.mutable_application() = BuildApplication();
  *snapshot.mutable_jobs()        = BuildJobs();
  *snapshot.mutable_stages()      = BuildStages();
  *snapshot.mutable_executors()   = BuildExecutors();
  *snapshot.mutable_environment() = BuildEnvironment();
  return snapshot;
}

} // namespace sparkscope::snapshot
