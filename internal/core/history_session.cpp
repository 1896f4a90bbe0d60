#include "history_session.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/snapshot/snapshot_builder.hpp"

namespace sparkscope::core {

namespace v1 = sparkscope::history::v1;

namespace {

v1::LoadStatus ToProto(ingest::LoadStatus status) {
  switch (status) {
    case ingest::LoadStatus::kLoading:
      return v1::LOAD_STATUS_LOADING;
    case ingest::LoadStatus::kComplete:
      return v1::LOAD_STATUS_COMPLETE;
    case ingest::LoadStatus::kCancelled:
      return v1::LOAD_STATUS_CANCELLED;
  }
  return v1::LOAD_STATUS_UNSPECIFIED;
}

} // namespace

HistorySession::HistorySession(const sparkscope::runtime::config::RuntimeConfig& config)
    : HistorySession(correlate::TaskClassifier::FromConfig(config.classification()), static_cast<std::size_t>(config.ingest().max_line_bytes()),
                     config.ingest().diagnostic_sample_limit()) {
}

HistorySession::HistorySession(correlate::TaskClassifier classifier, std::size_t max_line_bytes, std::size_t sample_limit)
    : decoder_(max_line_bytes), correlator_(store_, std::move(classifier)), diagnostics_(sample_limit) {
}

// ------------------------------------------------------------
// Writer
// ------------------------------------------------------------

decode::DecodeStatus HistorySession::ApplyLine(std::uint64_t line_number, std::string_view line) {
  auto result = decoder_.Decode(line);

  std::unique_lock lock(mutex_);
  switch (result.status) {
    case decode::DecodeStatus::kBlank:
      diagnostics_.RecordBlank();
      break;

    case decode::DecodeStatus::kMalformed:
      diagnostics_.RecordMalformed(line_number, result.message);
      SPARKSCOPE_LOG_DEBUG("Skipped malformed line", {observability::UIntField("line", line_number), observability::StringField("error", result.message)});
      break;

    case decode::DecodeStatus::kUnrecognized:
      diagnostics_.RecordUnrecognized(line_number, result.message);
      SPARKSCOPE_LOG_DEBUG("Skipped unrecognized event", {observability::UIntField("line", line_number), observability::StringField("detail", result.message)});
      break;

    case decode::DecodeStatus::kOk: {
      auto outcome = correlator_.Apply(*result.event);
      diagnostics_.RecordApplied();
      for (const auto& anomaly : outcome.anomalies) {
        diagnostics_.RecordAnomaly(line_number, anomaly);
        SPARKSCOPE_LOG_WARN("Source anomaly", {observability::UIntField("line", line_number), observability::StringField("detail", anomaly)});
      }
      break;
    }
  }
  return result.status;
}

void HistorySession::FinishLoad(ingest::LoadStatus status) {
  std::unique_lock lock(mutex_);
  diagnostics_.set_status(status);
}

// ------------------------------------------------------------
// Readers
// ------------------------------------------------------------

v1::Snapshot HistorySession::Snapshot() const {
  std::shared_lock lock(mutex_);
  auto             snapshot = snapshot::SnapshotBuilder(store_).Build();
  *snapshot.mutable_diagnostics() = DiagnosticsUnlocked();
  return snapshot;
}

v1::TasksView HistorySession::Tasks(const model::StageKey& key) const {
  std::shared_lock lock(mutex_);
  return snapshot::SnapshotBuilder(store_).BuildTasks(key);
}

v1::StageDetail HistorySession::StageDetail(const model::StageKey& key) const {
  std::shared_lock lock(mutex_);
  return snapshot::SnapshotBuilder(store_).BuildStageDetail(key);
}

v1::Diagnostics HistorySession::Diagnostics() const {
  std::shared_lock lock(mutex_);
  return DiagnosticsUnlocked();
}

aggregate::ApplicationSummary HistorySession::Summary() const {
  std::shared_lock lock(mutex_);
  return aggregate::Aggregator(store_).SummarizeApplication();
}

ingest::LoadStatus HistorySession::load_status() const {
  std::shared_lock lock(mutex_);
  return diagnostics_.status();
}

v1::Diagnostics HistorySession::DiagnosticsUnlocked() const {
  v1::Diagnostics out;
  out.set_status(ToProto(diagnostics_.status()));
  out.set_lines_read(diagnostics_.lines_read());
  out.set_lines_applied(diagnostics_.lines_applied());
  out.set_lines_blank(diagnostics_.lines_blank());
  out.set_lines_malformed(diagnostics_.lines_malformed());
  out.set_lines_unrecognized(diagnostics_.lines_unrecognized());
  out.set_lines_skipped(diagnostics_.lines_skipped());
  out.set_anomalies(diagnostics_.anomalies());
  for (const auto& sample : diagnostics_.samples()) {
    out.add_samples(sample);
  }
  return out;
}

} // namespace sparkscope::core
