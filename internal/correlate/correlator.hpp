#pragma once

#include <string>
#include <vector>

#include "internal/correlate/task_classifier.hpp"
#include "internal/decode/event.hpp"
#include "internal/store/entity_store.hpp"

namespace sparkscope::correlate {

/*
  Applies decoded events to an EntityStore, one at a time, to completion.

  Unknown parents are created as placeholders rather than rejected. Source
  anomalies (a second application start, a task reported under two stages)
  do not change the first recorded context and are returned to the caller.
*/
class Correlator {
 public:
  struct Outcome {
    std::vector<std::string> anomalies;
  };

  explicit Correlator(store::EntityStore& store, TaskClassifier classifier = TaskClassifier());

  Outcome Apply(const decode::Event& event);

 private:
  void On(const decode::ApplicationStart& ev, Outcome& out);
  void On(const decode::ApplicationEnd& ev, Outcome& out);
  void On(const decode::LogStart& ev, Outcome& out);
  void On(const decode::JobStart& ev, Outcome& out);
  void On(const decode::JobEnd& ev, Outcome& out);
  void On(const decode::StageSubmitted& ev, Outcome& out);
  void On(const decode::StageCompleted& ev, Outcome& out);
  void On(const decode::TaskStart& ev, Outcome& out);
  void On(const decode::TaskEnd& ev, Outcome& out);
  void On(const decode::ExecutorAdded& ev, Outcome& out);
  void On(const decode::ExecutorRemoved& ev, Outcome& out);
  void On(const decode::BlockManagerAdded& ev, Outcome& out);
  void On(const decode::EnvironmentUpdate& ev, Outcome& out);
  void On(const decode::Unrecognized& ev, Outcome& out);

  model::Application& EnsureApplication();
  model::Job&         EnsureJob(model::JobId id);
  model::Stage&       EnsureStage(const model::StageKey& key);
  model::Executor&    EnsureExecutor(const model::ExecutorId& id);

  // Starts from the stored task, or a placeholder attributed to `stage`.
  model::Task LoadTask(const model::TaskKey& key, const model::StageKey& stage, Outcome& out) const;
  void        StoreTask(model::Task task);

  static void MergeStageInfo(model::Stage& stage, const decode::StageInfo& info);

  store::EntityStore& store_;
  TaskClassifier      classifier_;
};

} // namespace sparkscope::correlate
