#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "api/sparkscope/history/v1.hpp"
#include "internal/service/history_service.hpp"

namespace sparkscope::grpc {

class HistoryServer final : public sparkscope::history::v1::SparkHistoryService::Service {
 public:
  explicit HistoryServer(std::shared_ptr<sparkscope::service::HistoryService> svc);

  ::grpc::Status GetSnapshot(::grpc::ServerContext*, const sparkscope::history::v1::GetSnapshotRequest*, sparkscope::history::v1::Snapshot*) override;

  ::grpc::Status ListTasks(::grpc::ServerContext*, const sparkscope::history::v1::ListTasksRequest*, sparkscope::history::v1::TasksView*) override;

  ::grpc::Status GetStageDetail(::grpc::ServerContext*, const sparkscope::history::v1::GetStageDetailRequest*,
                                sparkscope::history::v1::StageDetail*) override;

  ::grpc::Status GetDiagnostics(::grpc::ServerContext*, const sparkscope::history::v1::GetDiagnosticsRequest*,
                                sparkscope::history::v1::Diagnostics*) override;

 private:
  std::shared_ptr<sparkscope::service::HistoryService> service_;
};

} // namespace sparkscope::grpc
