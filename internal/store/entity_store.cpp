#include "entity_store.hpp"

#include <limits>
#include <utility>

#include "internal/util/errors.hpp"

namespace sparkscope::store {

using namespace sparkscope::model;

// ------------------------------------------------------------
// Application
// ------------------------------------------------------------

const Application* EntityStore::FindApplication() const {
  return application_ ? &*application_ : nullptr;
}

Application* EntityStore::MutableApplication() {
  return application_ ? &*application_ : nullptr;
}

Application& EntityStore::InsertApplication(Application app) {
  if (application_) {
    throw util::AlreadyExists("application already recorded: " + application_->app_id);
  }
  application_ = std::move(app);
  return *application_;
}

// ------------------------------------------------------------
// Jobs
// ------------------------------------------------------------

const Job* EntityStore::FindJob(JobId id) const {
  auto it = jobs_.find(id);
  return it == jobs_.end() ? nullptr : &it->second;
}

Job* EntityStore::MutableJob(JobId id) {
  auto it = jobs_.find(id);
  return it == jobs_.end() ? nullptr : &it->second;
}

Job& EntityStore::InsertJob(Job job) {
  const auto id       = job.id;
  auto [it, inserted] = jobs_.emplace(id, std::move(job));
  if (!inserted) {
    throw util::AlreadyExists("job already recorded: " + std::to_string(id));
  }
  job_order_.push_back(id);
  return it->second;
}

std::vector<const Job*> EntityStore::JobsInSubmissionOrder() const {
  std::vector<const Job*> out;
  out.reserve(job_order_.size());
  for (const auto id : job_order_) {
    out.push_back(&jobs_.at(id));
  }
  return out;
}

// ------------------------------------------------------------
// Stages
// ------------------------------------------------------------

const Stage* EntityStore::FindStage(const StageKey& key) const {
  auto it = stages_.find(key);
  return it == stages_.end() ? nullptr : &it->second;
}

Stage* EntityStore::MutableStage(const StageKey& key) {
  auto it = stages_.find(key);
  return it == stages_.end() ? nullptr : &it->second;
}

Stage& EntityStore::InsertStage(Stage stage) {
  const auto key      = stage.key;
  auto [it, inserted] = stages_.emplace(key, std::move(stage));
  if (!inserted) {
    throw util::AlreadyExists("stage attempt already recorded: " + ToString(key));
  }
  return it->second;
}

std::vector<Stage*> EntityStore::AttemptsOf(StageId id) {
  std::vector<Stage*> out;
  for (auto it = stages_.lower_bound(StageKey{id, 0}); it != stages_.end() && it->first.stage_id == id; ++it) {
    out.push_back(&it->second);
  }
  return out;
}

std::vector<const Stage*> EntityStore::AttemptsOf(StageId id) const {
  std::vector<const Stage*> out;
  for (auto it = stages_.lower_bound(StageKey{id, 0}); it != stages_.end() && it->first.stage_id == id; ++it) {
    out.push_back(&it->second);
  }
  return out;
}

const Stage* EntityStore::LatestAttempt(StageId id) const {
  const auto attempts = AttemptsOf(id);
  return attempts.empty() ? nullptr : attempts.back();
}

// ------------------------------------------------------------
// Tasks
// ------------------------------------------------------------

EntityStore::LaunchOrderKey EntityStore::OrderKey(const Task& task) {
  if (!task.launch_time) {
    return {true, std::numeric_limits<std::int64_t>::max(), task.key};
  }
  return {false, util::ToUnixMillis(*task.launch_time), task.key};
}

const Task* EntityStore::FindTask(const TaskKey& key) const {
  auto it = tasks_.find(key);
  return it == tasks_.end() ? nullptr : &it->second;
}

void EntityStore::PutTask(Task task) {
  if (auto it = tasks_.find(task.key); it != tasks_.end()) {
    task_order_.erase(OrderKey(it->second));
    if (it->second.executor_id != task.executor_id) {
      auto by_exec = tasks_by_executor_.find(it->second.executor_id);
      if (by_exec != tasks_by_executor_.end()) {
        by_exec->second.erase(task.key);
      }
    }
  }

  task_order_.insert(OrderKey(task));
  tasks_by_executor_[task.executor_id].insert(task.key);
  tasks_[task.key] = std::move(task);
}

std::vector<const Task*> EntityStore::TasksInLaunchOrder() const {
  std::vector<const Task*> out;
  out.reserve(task_order_.size());
  for (const auto& entry : task_order_) {
    out.push_back(&tasks_.at(std::get<2>(entry)));
  }
  return out;
}

std::vector<const Task*> EntityStore::TasksForStage(const StageKey& key) const {
  std::vector<const Task*> out;

  const auto* stage = FindStage(key);
  if (!stage) {
    return out;
  }

  out.reserve(stage->task_ids.size());
  for (const auto& task_key : stage->task_ids) {
    if (const auto* task = FindTask(task_key)) {
      out.push_back(task);
    }
  }
  return out;
}

std::vector<const Task*> EntityStore::TasksForExecutor(const ExecutorId& id) const {
  std::vector<const Task*> out;

  auto it = tasks_by_executor_.find(id);
  if (it == tasks_by_executor_.end()) {
    return out;
  }

  out.reserve(it->second.size());
  for (const auto& task_key : it->second) {
    out.push_back(&tasks_.at(task_key));
  }
  return out;
}

// ------------------------------------------------------------
// Executors
// ------------------------------------------------------------

const Executor* EntityStore::FindExecutor(const ExecutorId& id) const {
  auto it = executors_.find(id);
  return it == executors_.end() ? nullptr : &it->second;
}

Executor* EntityStore::MutableExecutor(const ExecutorId& id) {
  auto it = executors_.find(id);
  return it == executors_.end() ? nullptr : &it->second;
}

Executor& EntityStore::InsertExecutor(Executor executor) {
  auto id             = executor.id;
  auto [it, inserted] = executors_.emplace(id, std::move(executor));
  if (!inserted) {
    throw util::AlreadyExists("executor already recorded: " + id);
  }
  executor_order_.push_back(std::move(id));
  return it->second;
}

std::vector<const Executor*> EntityStore::ExecutorsInAddOrder() const {
  std::vector<const Executor*> out;
  out.reserve(executor_order_.size());
  for (const auto& id : executor_order_) {
    out.push_back(&executors_.at(id));
  }
  return out;
}

// ------------------------------------------------------------
// Environment
// ------------------------------------------------------------

void EntityStore::ReplaceCategory(EnvironmentCategory category, PropertyList properties) {
  environment_.categories[category] = std::move(properties);
}

} // namespace sparkscope::store
