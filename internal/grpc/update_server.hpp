#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/update_service.hpp"
#include "rollout/manager/v1/update_service.grpc.pb.h"

namespace rollout::grpc {

namespace v1 = rollout::manager::v1;

class UpdateServer final : public v1::UpdateService::Service {
 public:
  explicit UpdateServer(std::shared_ptr<rollout::service::UpdateService> svc);

  ::grpc::Status Upgrade(::grpc::ServerContext*, const v1::UpgradeRequest*, v1::UpgradeResponse*) override;

  ::grpc::Status Rollback(::grpc::ServerContext*, const v1::RollbackRequest*, v1::UpgradeResponse*) override;

  ::grpc::Status Status(::grpc::ServerContext*, const v1::StatusRequest*, v1::StatusResponse*) override;

  ::grpc::Status Abort(::grpc::ServerContext*, const v1::AbortRequest*, v1::AbortResponse*) override;

  ::grpc::Status ListSessions(::grpc::ServerContext*, const v1::ListSessionsRequest*, v1::ListSessionsResponse*) override;

  ::grpc::Status Prune(::grpc::ServerContext*, const v1::PruneRequest*, v1::PruneResponse*) override;

  ::grpc::Status ListBackups(::grpc::ServerContext*, const v1::ListBackupsRequest*, v1::ListBackupsResponse*) override;

 private:
  std::shared_ptr<rollout::service::UpdateService> service_;
};

} // namespace rollout::grpc
