#pragma once

#include <atomic>
#include <cstdint>

#include "internal/ingest/line_source.hpp"
#include "internal/ingest/load_diagnostics.hpp"

namespace sparkscope::core {
class HistorySession;
}

namespace sparkscope::ingest {

struct LoadResult {
  LoadStatus    status = LoadStatus::kLoading;
  std::uint64_t lines  = 0;
};

/*
  Drives a LineSource into a HistorySession until the source is exhausted
  or cancellation is requested.

  Cancellation is checked between lines. Whatever was applied before it
  stays in the session and the session is marked CANCELLED. A read error
  from the source propagates as util::SourceUnavailable after the session
  has been marked CANCELLED.
*/
class EventLogLoader {
 public:
  static LoadResult Load(LineSource& source, core::HistorySession& session, const std::atomic<bool>* cancel = nullptr);
};

} // namespace sparkscope::ingest
