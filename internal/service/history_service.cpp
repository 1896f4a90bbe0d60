#include "history_service.hpp"

#include "internal/core/history_session.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sparkscope::service {

using namespace sparkscope::history::v1;

namespace {

model::StageKey ToStageKey(bool has_stage, const StageAttemptRef& ref) {
  if (!has_stage) {
    throw util::InvalidArgument("stage reference is required");
  }
  return model::StageKey{ref.stage_id(), ref.attempt()};
}

void LogFailure(const char* route, const std::exception& ex) {
  SPARKSCOPE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
}

} // namespace

HistoryService::HistoryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

Snapshot HistoryService::GetSnapshot(const GetSnapshotRequest&) {
  return ctx_.session->Snapshot();
}

TasksView HistoryService::ListTasks(const ListTasksRequest& req) {
  try {
    return ctx_.session->Tasks(ToStageKey(req.has_stage(), req.stage()));
  } catch (const std::exception& ex) {
    LogFailure("HistoryService.ListTasks", ex);
    throw;
  }
}

StageDetail HistoryService::GetStageDetail(const GetStageDetailRequest& req) {
  try {
    return ctx_.session->StageDetail(ToStageKey(req.has_stage(), req.stage()));
  } catch (const std::exception& ex) {
    LogFailure("HistoryService.GetStageDetail", ex);
    throw;
  }
}

Diagnostics HistoryService::GetDiagnostics(const GetDiagnosticsRequest&) {
  return ctx_.session->Diagnostics();
}

} // namespace sparkscope::service
