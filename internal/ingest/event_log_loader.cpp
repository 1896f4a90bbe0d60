#include "event_log_loader.hpp"

#include <chrono>
#include <string>

#include "internal/core/history_session.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sparkscope::ingest {

using observability::StringField;
using observability::UIntField;

LoadResult EventLogLoader::Load(LineSource& source, core::HistorySession& session, const std::atomic<bool>* cancel) {
  SPARKSCOPE_LOG_INFO("Loading event log", {StringField("source", source.name())});

  const auto  started = std::chrono::steady_clock::now();
  LoadResult  result;
  std::string line;

  try {
    while (true) {
      if (cancel && cancel->load(std::memory_order_relaxed)) {
        result.status = LoadStatus::kCancelled;
        break;
      }
      if (!source.Next(line)) {
        result.status = LoadStatus::kComplete;
        break;
      }
      session.ApplyLine(source.line_number(), line);
      ++result.lines;
    }
  } catch (const util::SourceUnavailable& e) {
    session.FinishLoad(LoadStatus::kCancelled);
    SPARKSCOPE_LOG_ERROR("Event log read failed", {StringField("source", source.name()), StringField("error", e.what())});
    throw;
  }

  session.FinishLoad(result.status);

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  const auto diagnostics = session.Diagnostics();
  SPARKSCOPE_LOG_INFO("Event log loaded",
                      {StringField("source", source.name()), StringField("status", ToString(result.status)), UIntField("lines", result.lines),
                       UIntField("applied", diagnostics.lines_applied()), UIntField("malformed", diagnostics.lines_malformed()),
                       UIntField("unrecognized", diagnostics.lines_unrecognized()), UIntField("anomalies", diagnostics.anomalies()),
                       UIntField("elapsed_ms", static_cast<std::uint64_t>(elapsed_ms))});
  return result;
}

} // namespace sparkscope::ingest
