#pragma once

#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/model/entities.hpp"

namespace sparkscope::store {

/*
  Owns every reconstructed entity of one application.

  Lookups return nullptr for unknown identifiers; creating a placeholder is
  always an explicit Insert/Put by the caller. Nothing is ever erased.

  Not synchronized: HistorySession serializes writers against readers.
*/
class EntityStore {
 public:
  // ------------------------------------------------------------
  // Application
  // ------------------------------------------------------------
  const model::Application* FindApplication() const;
  model::Application*       MutableApplication();
  model::Application&       InsertApplication(model::Application app);

  // ------------------------------------------------------------
  // Jobs (kept in first-reference order)
  // ------------------------------------------------------------
  const model::Job* FindJob(model::JobId id) const;
  model::Job*       MutableJob(model::JobId id);
  model::Job&       InsertJob(model::Job job);

  std::vector<const model::Job*> JobsInSubmissionOrder() const;
  std::size_t                    JobCount() const {
    return jobs_.size();
  }

  // ------------------------------------------------------------
  // Stages (ordered by stage id, then attempt)
  // ------------------------------------------------------------
  const model::Stage* FindStage(const model::StageKey& key) const;
  model::Stage*       MutableStage(const model::StageKey& key);
  model::Stage&       InsertStage(model::Stage stage);

  // All attempts of one stage id, lowest attempt first.
  std::vector<model::Stage*>       AttemptsOf(model::StageId id);
  std::vector<const model::Stage*> AttemptsOf(model::StageId id) const;
  const model::Stage*              LatestAttempt(model::StageId id) const;

  const std::map<model::StageKey, model::Stage>& Stages() const {
    return stages_;
  }

  // ------------------------------------------------------------
  // Tasks (ordered by launch time, then task id; unknown launch last)
  // ------------------------------------------------------------
  const model::Task* FindTask(const model::TaskKey& key) const;

  // Inserts or replaces; keeps the secondary indices in step.
  void PutTask(model::Task task);

  std::vector<const model::Task*> TasksInLaunchOrder() const;
  std::vector<const model::Task*> TasksForStage(const model::StageKey& key) const;
  std::vector<const model::Task*> TasksForExecutor(const model::ExecutorId& id) const;
  std::size_t                     TaskCount() const {
    return tasks_.size();
  }

  // ------------------------------------------------------------
  // Executors (kept in first-reference order)
  // ------------------------------------------------------------
  const model::Executor* FindExecutor(const model::ExecutorId& id) const;
  model::Executor*       MutableExecutor(const model::ExecutorId& id);
  model::Executor&       InsertExecutor(model::Executor executor);

  std::vector<const model::Executor*> ExecutorsInAddOrder() const;
  std::size_t                         ExecutorCount() const {
    return executors_.size();
  }

  // ------------------------------------------------------------
  // Environment
  // ------------------------------------------------------------
  void                      ReplaceCategory(model::EnvironmentCategory category, model::PropertyList properties);
  const model::Environment& environment() const {
    return environment_;
  }

 private:
  // (launch-unknown, launch millis, task key)
  using LaunchOrderKey = std::tuple<bool, std::int64_t, model::TaskKey>;

  static LaunchOrderKey OrderKey(const model::Task& task);

  std::optional<model::Application> application_;

  std::unordered_map<model::JobId, model::Job> jobs_;
  std::vector<model::JobId>                    job_order_;

  std::map<model::StageKey, model::Stage> stages_;

  std::map<model::TaskKey, model::Task>                         tasks_;
  std::set<LaunchOrderKey>                                      task_order_;
  std::unordered_map<model::ExecutorId, std::set<model::TaskKey>> tasks_by_executor_;

  std::unordered_map<model::ExecutorId, model::Executor> executors_;
  std::vector<model::ExecutorId>                         executor_order_;

  model::Environment environment_;
};

} // namespace sparkscope::store
