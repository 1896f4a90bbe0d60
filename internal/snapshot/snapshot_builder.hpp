#pragma once

#include "internal/aggregate/aggregator.hpp"
#include "internal/store/entity_store.hpp"
#include "sparkscope/history/v1/snapshot.pb.h"

namespace sparkscope::snapshot {

/*
  Builds display-ready views from an EntityStore.

  Every view is a self-contained protobuf message: rows already sorted,
  durations and sizes already formatted. The builder never mutates the
  store; the caller is responsible for holding the store still while a
  view is built.
*/
class SnapshotBuilder {
 public:
  explicit SnapshotBuilder(const store::EntityStore& store);

  sparkscope::history::v1::ApplicationView BuildApplication() const;
  sparkscope::history::v1::JobsView        BuildJobs() const;
  sparkscope::history::v1::StagesView      BuildStages() const;
  sparkscope::history::v1::ExecutorsView   BuildExecutors() const;
  sparkscope::history::v1::EnvironmentView BuildEnvironment() const;

  // Throw util::NotFound for an unknown stage attempt.
  sparkscope::history::v1::TasksView   BuildTasks(const model::StageKey& key) const;
  sparkscope::history::v1::StageDetail BuildStageDetail(const model::StageKey& key) const;

  // All five tab views; diagnostics are left to the caller.
  sparkscope::history::v1::Snapshot Build() const;

 private:
  sparkscope::history::v1::StageRow BuildStageRow(const model::Stage& stage, const aggregate::StageSummary& summary) const;

  const store::EntityStore& store_;
  aggregate::Aggregator     aggregator_;
};

} // namespace sparkscope::snapshot
