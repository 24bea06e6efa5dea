#include "update_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace rollout::grpc {

namespace {

template <typename Fn>
::grpc::Status Handle(std::string_view rpc, Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    auto status = ToStatus(e);
    observability::LogWarn("rpc failed", {observability::StringField("rpc", rpc),
                                          observability::IntField("code", static_cast<int>(status.error_code())),
                                          observability::StringField("error", e.what())});
    return status;
  }
}

} // namespace

UpdateServer::UpdateServer(std::shared_ptr<rollout::service::UpdateService> svc) : service_(std::move(svc)) {
}

::grpc::Status UpdateServer::Upgrade(::grpc::ServerContext*, const v1::UpgradeRequest* req, v1::UpgradeResponse* resp) {
  return Handle("Upgrade", [&] { *resp = service_->Upgrade(*req); });
}

::grpc::Status UpdateServer::Rollback(::grpc::ServerContext*, const v1::RollbackRequest* req, v1::UpgradeResponse* resp) {
  return Handle("Rollback", [&] { *resp = service_->Rollback(*req); });
}

::grpc::Status UpdateServer::Status(::grpc::ServerContext*, const v1::StatusRequest* req, v1::StatusResponse* resp) {
  return Handle("Status", [&] { *resp = service_->Status(*req); });
}

::grpc::Status UpdateServer::Abort(::grpc::ServerContext*, const v1::AbortRequest* req, v1::AbortResponse* resp) {
  return Handle("Abort", [&] { *resp = service_->Abort(*req); });
}

::grpc::Status UpdateServer::ListSessions(::grpc::ServerContext*, const v1::ListSessionsRequest* req,
                                          v1::ListSessionsResponse* resp) {
  return Handle("ListSessions", [&] { *resp = service_->ListSessions(*req); });
}

::grpc::Status UpdateServer::Prune(::grpc::ServerContext*, const v1::PruneRequest* req, v1::PruneResponse* resp) {
  return Handle("Prune", [&] { *resp = service_->Prune(*req); });
}

::grpc::Status UpdateServer::ListBackups(::grpc::ServerContext*, const v1::ListBackupsRequest* req,
                                         v1::ListBackupsResponse* resp) {
  return Handle("ListBackups", [&] { *resp = service_->ListBackups(*req); });
}

} // namespace rollout::grpc
