#include "history_server.hpp"

#include "grpc_error.hpp"

namespace sparkscope::grpc {

using namespace sparkscope::history::v1;

HistoryServer::HistoryServer(std::shared_ptr<sparkscope::service::HistoryService> svc) : service_(std::move(svc)) {
}

::grpc::Status HistoryServer::GetSnapshot(::grpc::ServerContext*, const GetSnapshotRequest* req, Snapshot* resp) {
  try {
    *resp = service_->GetSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HistoryServer::ListTasks(::grpc::ServerContext*, const ListTasksRequest* req, TasksView* resp) {
  try {
    *resp = service_->ListTasks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HistoryServer::GetStageDetail(::grpc::ServerContext*, const GetStageDetailRequest* req, StageDetail* resp) {
  try {
    *resp = service_->GetStageDetail(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HistoryServer::GetDiagnostics(::grpc::ServerContext*, const GetDiagnosticsRequest* req, Diagnostics* resp) {
  try {
    *resp = service_->GetDiagnostics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sparkscope::grpc
