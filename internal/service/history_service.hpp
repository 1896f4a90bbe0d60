#pragma once

#include "api/sparkscope/history/v1.hpp"
#include "service_context.hpp"

namespace sparkscope::service {

/*
  Read side of a HistorySession, shaped after the wire API.

  Requests naming an unknown stage attempt fail with util::NotFound and a
  request without a stage reference fails with util::InvalidArgument.
*/
class HistoryService {
 public:
  explicit HistoryService(ServiceContext ctx);

  sparkscope::history::v1::Snapshot    GetSnapshot(const sparkscope::history::v1::GetSnapshotRequest& req);
  sparkscope::history::v1::TasksView   ListTasks(const sparkscope::history::v1::ListTasksRequest& req);
  sparkscope::history::v1::StageDetail GetStageDetail(const sparkscope::history::v1::GetStageDetailRequest& req);
  sparkscope::history::v1::Diagnostics GetDiagnostics(const sparkscope::history::v1::GetDiagnosticsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace sparkscope::service
