#include "internal/snapshot/snapshot_builder.hpp"

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <string>

#include "internal/correlate/correlator.hpp"
#include "internal/decode/record_decoder.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sparkscope::model;
using sparkscope::correlate::Correlator;
using sparkscope::decode::RecordDecoder;
using sparkscope::snapshot::SnapshotBuilder;
using sparkscope::store::EntityStore;

void Feed(EntityStore& store, std::initializer_list<const char*> lines) {
  RecordDecoder decoder;
  Correlator    correlator(store);
  for (const auto* line : lines) {
    auto result = decoder.Decode(line);
    assert(result.event.has_value() && "test line must decode");
    correlator.Apply(*result.event);
  }
}

constexpr const char* kAppStart =
    R"({"Event":"SparkListenerApplicationStart","App Name":"etl","App ID":"app-1","Timestamp":1700000000000})";
constexpr const char* kAppEnd = R"({"Event":"SparkListenerApplicationEnd","Timestamp":1700000090000})";
constexpr const char* kExec1 =
    R"({"Event":"SparkListenerExecutorAdded","Timestamp":1700000001000,"Executor ID":"1","Executor Info":{"Host":"node-a","Total Cores":4}})";
constexpr const char* kExec2 =
    R"({"Event":"SparkListenerExecutorAdded","Timestamp":1700000001500,"Executor ID":"2","Executor Info":{"Host":"node-b","Total Cores":8}})";
constexpr const char* kBlockManager1 =
    R"({"Event":"SparkListenerBlockManagerAdded","Block Manager ID":{"Executor ID":"1","Host":"node-a"},"Maximum Memory":1073741824})";
constexpr const char* kJobStart =
    R"({"Event":"SparkListenerJobStart","Job ID":0,"Submission Time":1700000002000,"Stage Infos":[{"Stage ID":1,"Stage Attempt ID":0,"Stage Name":"map at etl.py:12","Number of Tasks":2},{"Stage ID":0,"Stage Attempt ID":0,"Number of Tasks":4}],"Stage IDs":[1,0]})";
constexpr const char* kStage1Sub =
    R"({"Event":"SparkListenerStageSubmitted","Stage Info":{"Stage ID":1,"Stage Attempt ID":0,"Stage Name":"map at etl.py:12","Number of Tasks":2,"Submission Time":1700000002100}})";
constexpr const char* kTask7Start =
    R"({"Event":"SparkListenerTaskStart","Stage ID":1,"Stage Attempt ID":0,"Task Info":{"Task ID":7,"Index":1,"Attempt":0,"Launch Time":1700000002300,"Executor ID":"2","Host":"node-b"}})";
constexpr const char* kTask3Start =
    R"({"Event":"SparkListenerTaskStart","Stage ID":1,"Stage Attempt ID":0,"Task Info":{"Task ID":3,"Index":0,"Attempt":0,"Launch Time":1700000002500,"Executor ID":"1","Host":"node-a"}})";
constexpr const char* kTask7End =
    R"({"Event":"SparkListenerTaskEnd","Stage ID":1,"Stage Attempt ID":0,"Task End Reason":{"Reason":"Success"},"Task Info":{"Task ID":7,"Index":1,"Attempt":0,"Launch Time":1700000002300,"Executor ID":"2","Host":"node-b","Finish Time":1700000003500},"Task Metrics":{"Executor Run Time":1100,"JVM GC Time":40,"Memory Bytes Spilled":2048,"Shuffle Write Metrics":{"Shuffle Bytes Written":1536}}})";
constexpr const char* kTask3End =
    R"({"Event":"SparkListenerTaskEnd","Stage ID":1,"Stage Attempt ID":0,"Task End Reason":{"Reason":"TaskKilled","Kill Reason":"another attempt succeeded"},"Task Info":{"Task ID":3,"Index":0,"Attempt":0,"Launch Time":1700000002500,"Executor ID":"1","Host":"node-a","Finish Time":1700000002900,"Killed":true},"Task Metrics":{"Memory Bytes Spilled":999}})";

EntityStore MakeStore() {
  EntityStore store;
  Feed(store, {kAppStart, kExec1, kExec2, kBlockManager1, kJobStart, kStage1Sub, kTask7Start, kTask3Start, kTask7End, kTask3End});
  return store;
}

void TestEmptyStoreRendersUnknownApplication() {
  EntityStore     store;
  SnapshotBuilder builder(store);

  const auto snapshot = builder.Build();
  assert(!snapshot.application().known());
  assert(snapshot.application().status() == "UNKNOWN");
  assert(snapshot.jobs().rows_size() == 0);
  assert(snapshot.stages().rows_size() == 0);
  assert(snapshot.executors().rows_size() == 0);
  assert(snapshot.executors().total_memory() == "0 B");
  assert(snapshot.environment().categories_size() == 0);
}

void TestApplicationView() {
  auto            store = MakeStore();
  SnapshotBuilder builder(store);

  auto app = builder.BuildApplication();
  assert(app.known());
  assert(app.app_id() == "app-1");
  assert(app.status() == "RUNNING");
  assert(app.start_time() == "2023-11-14 22:13:20");
  assert(app.end_time() == "N/A");
  assert(app.duration() == "in progress");
  assert(app.user() == "-");

  Feed(store, {kAppEnd});
  app = builder.BuildApplication();
  assert(app.status() == "FINISHED");
  assert(app.duration() == "1.5 min");
  assert(app.duration_ms() == 90000);
}

void TestJobsView() {
  const auto      store = MakeStore();
  SnapshotBuilder builder(store);

  const auto jobs = builder.BuildJobs();
  assert(jobs.rows_size() == 1);
  assert(jobs.running() == 1);

  const auto& row = jobs.rows(0);
  assert(row.name() == "Job 0");
  assert(row.status() == "RUNNING");
  assert(row.duration() == "in progress");
  assert(row.stage_ids_size() == 2 && row.stage_ids(0) == 1 && row.stage_ids(1) == 0);
  assert(row.tasks_total() == 6);
  assert(row.tasks_succeeded() == 1);
  assert(row.tasks_killed() == 1);
  assert(row.stages_active() == 1);
}

void TestStagesViewIsSortedAndLabelled() {
  const auto      store = MakeStore();
  SnapshotBuilder builder(store);

  const auto stages = builder.BuildStages();
  assert(stages.rows_size() == 2);
  assert(stages.pending() == 1 && stages.active() == 1);

  const auto& pending = stages.rows(0);
  assert(pending.stage_id() == 0);
  assert(pending.name() == "Stage 0");
  assert(pending.status() == "PENDING");
  assert(pending.duration() == "-");
  assert(pending.has_job() && pending.job_id() == 0);

  const auto& active = stages.rows(1);
  assert(active.stage_id() == 1);
  assert(active.name() == "map at etl.py:12");
  assert(active.duration() == "running");
  assert(active.tasks_expected() == 2);
  assert(active.percent_complete() == 50.0);
  // Killed tasks do not contribute spill.
  assert(active.memory_spilled() == "2.0 KiB");
  assert(active.shuffle_write() == "1.5 KiB");
  assert(active.shuffle_read() == "0 B");
}

void TestTasksViewUsesLaunchOrder() {
  const auto      store = MakeStore();
  SnapshotBuilder builder(store);

  const auto tasks = builder.BuildTasks(StageKey{1, 0});
  assert(tasks.stage_id() == 1 && tasks.attempt() == 0);
  assert(tasks.rows_size() == 2);

  const auto& first = tasks.rows(0);
  assert(first.task_id() == 7);
  assert(first.status() == "SUCCESS");
  assert(first.duration() == "1.2 s");
  assert(first.gc_time() == "40 ms");
  assert(first.shuffle_read() == "-");
  assert(first.category().empty());

  const auto& second = tasks.rows(1);
  assert(second.task_id() == 3);
  assert(second.status() == "KILLED");
  assert(second.category() == "Killed");
  assert(second.failure_reason().find("another attempt succeeded") != std::string::npos);

  assert(builder.BuildTasks(StageKey{0, 0}).rows_size() == 0);

  bool threw = false;
  try {
    builder.BuildTasks(StageKey{1, 1});
  } catch (const sparkscope::util::NotFound& e) {
    threw = std::string(e.what()).find("1.1") != std::string::npos;
  }
  assert(threw);
}

void TestStageDetailListsEveryMetric() {
  const auto      store = MakeStore();
  SnapshotBuilder builder(store);

  const auto detail = builder.BuildStageDetail(StageKey{1, 0});
  assert(detail.stage().stage_id() == 1);
  assert(detail.min_duration() == "400 ms");
  assert(detail.max_duration() == "1.2 s");
  assert(detail.metrics_size() == static_cast<int>(kTaskMetricFields.size()));

  bool found = false;
  for (const auto& metric : detail.metrics()) {
    if (metric.name() == "memory_bytes_spilled") {
      assert(metric.sum() == 2048 && metric.max() == 2048);
      found = true;
    }
  }
  assert(found);

  bool threw = false;
  try {
    builder.BuildStageDetail(StageKey{5, 0});
  } catch (const sparkscope::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestExecutorsView() {
  const auto      store = MakeStore();
  SnapshotBuilder builder(store);

  const auto executors = builder.BuildExecutors();
  assert(executors.rows_size() == 2);
  assert(executors.active() == 2 && executors.removed() == 0);
  assert(executors.total_cores() == 12);
  assert(executors.total_memory() == "1.0 GiB");

  const auto& first = executors.rows(0);
  assert(first.executor_id() == "1");
  assert(first.max_memory() == "1.0 GiB");
  assert(first.tasks_killed() == 1);
  assert(first.cores() == "4");

  const auto& second = executors.rows(1);
  assert(second.max_memory() == "-");
  assert(second.tasks_complete() == 1);
  assert(second.shuffle_write() == "1.5 KiB");
}

void TestEnvironmentCategoriesInFixedOrder() {
  EntityStore store;
  Feed(store, {R"({"Event":"SparkListenerEnvironmentUpdate","Hadoop Properties":{"fs.defaultFS":"hdfs://nn"},"Spark Properties":{"spark.master":"yarn","spark.app.name":"etl"}})"});

  SnapshotBuilder builder(store);
  const auto      env = builder.BuildEnvironment();
  assert(env.categories_size() == 2);
  assert(env.categories(0).name() == "Spark Properties");
  assert(env.categories(0).properties(0).key() == "spark.app.name");
  assert(env.categories(1).name() == "Hadoop Properties");
}

} // namespace

int main() {
  TestEmptyStoreRendersUnknownApplication();
  TestApplicationView();
  TestJobsView();
  TestStagesViewIsSortedAndLabelled();
  TestTasksViewUsesLaunchOrder();
  TestStageDetailListsEveryMetric();
  TestExecutorsView();
  TestEnvironmentCategoriesInFixedOrder();

  std::cout << "sparkscope_unit_snapshot_builder: pass\n";
  return 0;
}
