#pragma once

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string_view>

#include "internal/aggregate/aggregator.hpp"
#include "internal/correlate/correlator.hpp"
#include "internal/decode/record_decoder.hpp"
#include "internal/ingest/load_diagnostics.hpp"
#include "internal/store/entity_store.hpp"
#include "sparkscope/history/v1/snapshot.pb.h"

namespace sparkscope::runtime::config {
class RuntimeConfig;
}

namespace sparkscope::core {

/*
  Owns the reconstructed state of one event log.

  One writer (the loader) applies lines; any number of readers take views.
  A line is decoded outside the lock and applied under the exclusive lock,
  and every view is built under the shared lock, so a reader sees the state
  between two lines and never part of one.
*/
class HistorySession {
 public:
  explicit HistorySession(const sparkscope::runtime::config::RuntimeConfig& config);
  HistorySession(correlate::TaskClassifier classifier, std::size_t max_line_bytes, std::size_t sample_limit);

  HistorySession(const HistorySession&)            = delete;
  HistorySession& operator=(const HistorySession&) = delete;

  decode::DecodeStatus ApplyLine(std::uint64_t line_number, std::string_view line);
  void                 FinishLoad(ingest::LoadStatus status);

  sparkscope::history::v1::Snapshot    Snapshot() const;
  sparkscope::history::v1::TasksView   Tasks(const model::StageKey& key) const;
  sparkscope::history::v1::StageDetail StageDetail(const model::StageKey& key) const;
  sparkscope::history::v1::Diagnostics Diagnostics() const;

  aggregate::ApplicationSummary Summary() const;
  ingest::LoadStatus            load_status() const;

  // Runs fn(const store::EntityStore&, const ingest::LoadDiagnostics&)
  // under the shared lock.
  template <typename Fn>
  auto Read(Fn&& fn) const {
    std::shared_lock lock(mutex_);
    return fn(static_cast<const store::EntityStore&>(store_), static_cast<const ingest::LoadDiagnostics&>(diagnostics_));
  }

 private:
  sparkscope::history::v1::Diagnostics DiagnosticsUnlocked() const;

  const decode::RecordDecoder decoder_;

  mutable std::shared_mutex mutex_;
  store::EntityStore        store_;
  correlate::Correlator     correlator_;
  ingest::LoadDiagnostics   diagnostics_;
};

} // namespace sparkscope::core
