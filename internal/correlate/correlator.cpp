#include "correlator.hpp"

#include <utility>
#include <variant>

namespace sparkscope::correlate {

using namespace sparkscope::model;

namespace {

constexpr const char* kJobSucceeded = "JobSucceeded";

template <typename T>
void FillIfPresent(std::optional<T>& dst, const std::optional<T>& src) {
  if (src) dst = src;
}

template <typename T>
void FillIfAbsent(std::optional<T>& dst, const std::optional<T>& src) {
  if (!dst) dst = src;
}

} // namespace

Correlator::Correlator(store::EntityStore& store, TaskClassifier classifier) : store_(store), classifier_(std::move(classifier)) {
}

Correlator::Outcome Correlator::Apply(const decode::Event& event) {
  Outcome out;
  std::visit([this, &out](const auto& ev) { On(ev, out); }, event);
  return out;
}

// ------------------------------------------------------------
// Placeholders
// ------------------------------------------------------------

Application& Correlator::EnsureApplication() {
  if (auto* app = store_.MutableApplication()) {
    return *app;
  }
  return store_.InsertApplication(Application{});
}

Job& Correlator::EnsureJob(JobId id) {
  if (auto* job = store_.MutableJob(id)) {
    return *job;
  }
  Job job;
  job.id = id;
  return store_.InsertJob(std::move(job));
}

Stage& Correlator::EnsureStage(const StageKey& key) {
  if (auto* stage = store_.MutableStage(key)) {
    return *stage;
  }
  Stage stage;
  stage.key = key;
  return store_.InsertStage(std::move(stage));
}

Executor& Correlator::EnsureExecutor(const ExecutorId& id) {
  if (auto* executor = store_.MutableExecutor(id)) {
    return *executor;
  }
  Executor executor;
  executor.id = id;
  return store_.InsertExecutor(std::move(executor));
}

void Correlator::MergeStageInfo(Stage& stage, const decode::StageInfo& info) {
  FillIfPresent(stage.name, info.name);
  FillIfPresent(stage.num_tasks, info.num_tasks);
  FillIfPresent(stage.submission_time, info.submission_time);
  if (!info.parent_ids.empty()) stage.parent_ids = info.parent_ids;
  if (info.rdd_count != 0) stage.rdd_count = info.rdd_count;
}

// ------------------------------------------------------------
// Application
// ------------------------------------------------------------

void Correlator::On(const decode::ApplicationStart& ev, Outcome& out) {
  auto* existing = store_.MutableApplication();
  if (existing && existing->start_seen) {
    out.anomalies.push_back("second application start '" + ev.app_id + "' ignored; keeping '" + existing->app_id + "'");
    return;
  }

  auto& app      = existing ? *existing : EnsureApplication();
  app.app_id     = ev.app_id;
  app.name       = ev.name;
  app.start_time = ev.timestamp;
  app.start_seen = true;
  FillIfPresent(app.attempt_id, ev.attempt_id);
  FillIfPresent(app.user, ev.user);
}

void Correlator::On(const decode::ApplicationEnd& ev, Outcome&) {
  auto& app = EnsureApplication();
  FillIfPresent(app.end_time, ev.timestamp);
  app.status = ApplicationStatus::kFinished;
}

void Correlator::On(const decode::LogStart& ev, Outcome&) {
  if (!ev.version) return;
  EnsureApplication().version = ev.version;
}

// ------------------------------------------------------------
// Jobs
// ------------------------------------------------------------

void Correlator::On(const decode::JobStart& ev, Outcome&) {
  auto& job = EnsureJob(ev.job_id);
  FillIfPresent(job.submission_time, ev.submission_time);
  FillIfPresent(job.description, ev.description);
  FillIfPresent(job.job_group, ev.job_group);
  job.start_seen = true;

  for (const auto& info : ev.stage_infos) {
    job.AddStage(info.key.stage_id);
    auto& stage = EnsureStage(info.key);
    FillIfAbsent(stage.name, info.name);
    FillIfAbsent(stage.num_tasks, info.num_tasks);
    if (stage.parent_ids.empty()) stage.parent_ids = info.parent_ids;
    if (stage.rdd_count == 0) stage.rdd_count = info.rdd_count;
    if (!stage.job_id) stage.job_id = ev.job_id;
  }

  for (const auto stage_id : ev.stage_ids) {
    job.AddStage(stage_id);
    if (store_.AttemptsOf(stage_id).empty()) {
      EnsureStage(StageKey{stage_id, 0});
    }
    for (auto* attempt : store_.AttemptsOf(stage_id)) {
      if (!attempt->job_id) attempt->job_id = ev.job_id;
    }
  }
}

void Correlator::On(const decode::JobEnd& ev, Outcome&) {
  auto& job = EnsureJob(ev.job_id);
  FillIfPresent(job.completion_time, ev.completion_time);

  if (ev.result == kJobSucceeded) {
    job.status = JobStatus::kSucceeded;
    job.failure_reason.reset();
  } else {
    job.status         = JobStatus::kFailed;
    std::string reason = ev.result.empty() ? "no job result reported" : ev.result;
    if (ev.message && !ev.message->empty()) {
      reason += ": " + *ev.message;
    }
    job.failure_reason = std::move(reason);
  }

  // Stages the job declared but never submitted were skipped. Tasks seen
  // under an attempt prove it ran even if its submission was lost.
  for (const auto stage_id : job.stage_ids) {
    for (auto* attempt : store_.AttemptsOf(stage_id)) {
      if (attempt->status == StageStatus::kPending && attempt->task_ids.empty()) {
        attempt->status = StageStatus::kSkipped;
      }
    }
  }
}

// ------------------------------------------------------------
// Stages
// ------------------------------------------------------------

void Correlator::On(const decode::StageSubmitted& ev, Outcome&) {
  const auto& key   = ev.stage.key;
  auto&       stage = EnsureStage(key);
  MergeStageInfo(stage, ev.stage);

  std::optional<JobId> job_id = ev.job_id ? ev.job_id : stage.job_id;
  bool                 superseded = false;

  for (auto* attempt : store_.AttemptsOf(key.stage_id)) {
    if (!job_id && attempt->job_id) job_id = attempt->job_id;

    if (attempt->key.attempt < key.attempt) {
      if (CanTransition(attempt->status, StageStatus::kSkipped)) {
        attempt->status = StageStatus::kSkipped;
      }
    } else if (attempt->key.attempt > key.attempt) {
      superseded = true;
    }
  }

  const auto next = superseded ? StageStatus::kSkipped : StageStatus::kActive;
  if (CanTransition(stage.status, next)) {
    stage.status = next;
  }

  if (job_id) {
    stage.job_id = job_id;
    EnsureJob(*job_id).AddStage(key.stage_id);
  }
}

void Correlator::On(const decode::StageCompleted& ev, Outcome&) {
  auto& stage = EnsureStage(ev.stage.key);
  MergeStageInfo(stage, ev.stage);
  FillIfPresent(stage.completion_time, ev.stage.completion_time);

  if (ev.stage.failure_reason) {
    stage.status         = StageStatus::kFailed;
    stage.failure_reason = ev.stage.failure_reason;
  } else {
    stage.status = StageStatus::kComplete;
    stage.failure_reason.reset();
  }
}

// ------------------------------------------------------------
// Tasks
// ------------------------------------------------------------

Task Correlator::LoadTask(const TaskKey& key, const StageKey& stage, Outcome& out) const {
  if (const auto* existing = store_.FindTask(key)) {
    if (existing->stage != stage) {
      out.anomalies.push_back("task " + ToString(key) + " reported under stage " + ToString(stage) + "; keeping stage " +
                              ToString(existing->stage));
    }
    return *existing;
  }

  Task task;
  task.key   = key;
  task.stage = stage;
  return task;
}

void Correlator::StoreTask(Task task) {
  EnsureStage(task.stage).task_ids.insert(task.key);
  EnsureExecutor(task.executor_id);
  store_.PutTask(std::move(task));
}

void Correlator::On(const decode::TaskStart& ev, Outcome& out) {
  auto task = LoadTask(ev.info.key, ev.stage, out);

  task.executor_id = ev.info.executor_id;
  task.speculative = ev.info.speculative;
  task.start_seen  = true;
  FillIfPresent(task.host, ev.info.host);
  FillIfPresent(task.index, ev.info.index);
  FillIfPresent(task.launch_time, ev.info.launch_time);

  StoreTask(std::move(task));
}

void Correlator::On(const decode::TaskEnd& ev, Outcome& out) {
  auto task = LoadTask(ev.info.key, ev.stage, out);

  task.executor_id = ev.info.executor_id;
  task.speculative = ev.info.speculative;
  FillIfPresent(task.host, ev.info.host);
  FillIfPresent(task.index, ev.info.index);
  FillIfPresent(task.launch_time, ev.info.launch_time);
  task.finish_time = ev.info.finish_time;

  const auto verdict = classifier_.Classify(ev.reason, ev.info.killed);
  task.status        = verdict.status;
  if (verdict.status == TaskStatus::kSuccess) {
    task.failure_reason.reset();
    task.failure_category.reset();
  } else {
    task.failure_reason   = ev.reason.text;
    task.failure_category = verdict.category;
  }

  // Replayed task-end replaces, never accumulates.
  task.metrics = ev.metrics.value_or(TaskMetrics{});

  StoreTask(std::move(task));
}

// ------------------------------------------------------------
// Executors
// ------------------------------------------------------------

void Correlator::On(const decode::ExecutorAdded& ev, Outcome&) {
  auto& executor = EnsureExecutor(ev.executor_id);
  FillIfPresent(executor.host, ev.host);
  FillIfPresent(executor.total_cores, ev.total_cores);
  FillIfPresent(executor.added_time, ev.timestamp);
}

void Correlator::On(const decode::ExecutorRemoved& ev, Outcome&) {
  auto& executor = EnsureExecutor(ev.executor_id);
  executor.status = ExecutorStatus::kRemoved;
  FillIfPresent(executor.removed_time, ev.timestamp);
  FillIfPresent(executor.removal_reason, ev.reason);
}

void Correlator::On(const decode::BlockManagerAdded& ev, Outcome&) {
  auto& executor = EnsureExecutor(ev.executor_id);
  FillIfAbsent(executor.host, ev.host);
  FillIfPresent(executor.max_memory, ev.max_memory);
}

// ------------------------------------------------------------
// Environment
// ------------------------------------------------------------

void Correlator::On(const decode::EnvironmentUpdate& ev, Outcome&) {
  for (const auto& [category, properties] : ev.categories) {
    store_.ReplaceCategory(category, properties);
  }
}

void Correlator::On(const decode::Unrecognized&, Outcome&) {
}

} // namespace sparkscope::correlate
