#include "internal/store/entity_store.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using namespace sparkscope::model;
using sparkscope::store::EntityStore;
using sparkscope::util::FromUnixMillis;

Task MakeTask(TaskId id, StageKey stage, const std::string& executor, std::optional<std::int64_t> launch_ms) {
  Task task;
  task.key         = TaskKey{id, 0};
  task.stage       = stage;
  task.executor_id = executor;
  if (launch_ms) task.launch_time = FromUnixMillis(*launch_ms);
  return task;
}

void TestLookupsDoNotCreatePlaceholders() {
  EntityStore store;
  assert(store.FindApplication() == nullptr);
  assert(store.FindJob(1) == nullptr);
  assert(store.FindStage(StageKey{1, 0}) == nullptr);
  assert(store.FindTask(TaskKey{1, 0}) == nullptr);
  assert(store.FindExecutor("1") == nullptr);
  assert(store.JobCount() == 0);
  assert(store.Stages().empty());
  assert(store.TasksForStage(StageKey{1, 0}).empty());
  assert(store.TasksForExecutor("1").empty());
}

void TestDuplicateInsertIsAlreadyExists() {
  EntityStore store;

  Job job;
  job.id = 4;
  store.InsertJob(job);

  bool threw = false;
  try {
    store.InsertJob(job);
  } catch (const sparkscope::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw && "second InsertJob must fail");

  store.InsertApplication(Application{});
  threw = false;
  try {
    store.InsertApplication(Application{});
  } catch (const sparkscope::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  Stage stage;
  stage.key = StageKey{2, 1};
  store.InsertStage(stage);
  threw = false;
  try {
    store.InsertStage(stage);
  } catch (const sparkscope::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestJobsAndExecutorsKeepFirstReferenceOrder() {
  EntityStore store;
  for (const JobId id : {7, 2, 5}) {
    Job job;
    job.id = id;
    store.InsertJob(job);
  }
  const auto jobs = store.JobsInSubmissionOrder();
  assert(jobs.size() == 3);
  assert(jobs[0]->id == 7 && jobs[1]->id == 2 && jobs[2]->id == 5);

  for (const char* id : {"driver", "10", "2"}) {
    Executor executor;
    executor.id = id;
    store.InsertExecutor(executor);
  }
  const auto executors = store.ExecutorsInAddOrder();
  assert(executors.size() == 3);
  assert(executors[0]->id == "driver" && executors[1]->id == "10" && executors[2]->id == "2");
}

void TestStageAttemptsAreOrdered() {
  EntityStore store;
  for (const auto& key : {StageKey{3, 1}, StageKey{1, 0}, StageKey{3, 0}, StageKey{4, 0}}) {
    Stage stage;
    stage.key = key;
    store.InsertStage(stage);
  }

  const auto attempts = store.AttemptsOf(3);
  assert(attempts.size() == 2);
  assert(attempts[0]->key.attempt == 0 && attempts[1]->key.attempt == 1);
  assert(store.LatestAttempt(3)->key.attempt == 1);
  assert(store.LatestAttempt(9) == nullptr);

  auto it = store.Stages().begin();
  assert(it->first == (StageKey{1, 0}));
  ++it;
  assert(it->first == (StageKey{3, 0}));
}

void TestTasksOrderByLaunchWithUnknownLast() {
  EntityStore store;
  const StageKey stage{0, 0};
  store.PutTask(MakeTask(5, stage, "1", 3000));
  store.PutTask(MakeTask(1, stage, "1", std::nullopt));
  store.PutTask(MakeTask(3, stage, "2", 1000));
  store.PutTask(MakeTask(2, stage, "2", 3000));

  const auto ordered = store.TasksInLaunchOrder();
  assert(ordered.size() == 4);
  assert(ordered[0]->key.task_id == 3);
  assert(ordered[1]->key.task_id == 2);
  assert(ordered[2]->key.task_id == 5);
  assert(ordered[3]->key.task_id == 1);
}

void TestPutTaskReindexesOnReplace() {
  EntityStore store;
  const StageKey stage{0, 0};
  store.PutTask(MakeTask(1, stage, "1", std::nullopt));
  store.PutTask(MakeTask(2, stage, "1", 2000));

  // Launch time learned late and executor corrected.
  store.PutTask(MakeTask(1, stage, "2", 1000));

  assert(store.TaskCount() == 2);
  const auto ordered = store.TasksInLaunchOrder();
  assert(ordered.size() == 2);
  assert(ordered[0]->key.task_id == 1);

  assert(store.TasksForExecutor("1").size() == 1);
  assert(store.TasksForExecutor("2").size() == 1);
  assert(store.TasksForExecutor("2")[0]->key.task_id == 1);
}

void TestTasksForStageFollowsStageMembership() {
  EntityStore store;
  Stage       stage;
  stage.key = StageKey{1, 0};
  stage.task_ids.insert(TaskKey{2, 0});
  stage.task_ids.insert(TaskKey{9, 0});
  store.InsertStage(stage);

  store.PutTask(MakeTask(2, stage.key, "1", 100));
  store.PutTask(MakeTask(9, stage.key, "1", 50));
  store.PutTask(MakeTask(4, StageKey{2, 0}, "1", 10));

  const auto tasks = store.TasksForStage(stage.key);
  assert(tasks.size() == 2);
  assert(tasks[0]->key.task_id == 2 && tasks[1]->key.task_id == 9);
}

void TestReplaceCategoryIsWholesale() {
  EntityStore store;
  store.ReplaceCategory(EnvironmentCategory::kSparkProperties, {{"a", "1"}, {"b", "2"}});
  store.ReplaceCategory(EnvironmentCategory::kSystemProperties, {{"java.version", "17"}});
  store.ReplaceCategory(EnvironmentCategory::kSparkProperties, {{"c", "3"}});

  const auto& categories = store.environment().categories;
  assert(categories.size() == 2);
  assert(categories.at(EnvironmentCategory::kSparkProperties).size() == 1);
  assert(categories.at(EnvironmentCategory::kSparkProperties)[0].first == "c");
  assert(categories.at(EnvironmentCategory::kSystemProperties)[0].second == "17");
}

} // namespace

int main() {
  TestLookupsDoNotCreatePlaceholders();
  TestDuplicateInsertIsAlreadyExists();
  TestJobsAndExecutorsKeepFirstReferenceOrder();
  TestStageAttemptsAreOrdered();
  TestTasksOrderByLaunchWithUnknownLast();
  TestPutTaskReindexesOnReplace();
  TestTasksForStageFollowsStageMembership();
  TestReplaceCategoryIsWholesale();

  std::cout << "sparkscope_unit_entity_store: pass\n";
  return 0;
}
