#pragma once

#include "rollout/manager/v1/update_service.pb.h"
#include "service_context.hpp"

namespace rollout::service {

namespace v1 = rollout::manager::v1;

/*
  Operator surface of the daemon. Converts wire requests into
  orchestrator calls and terminal outcomes back into responses.
  Exceptions are left to the transport layer.
*/
class UpdateService {
 public:
  explicit UpdateService(ServiceContext ctx);

  v1::UpgradeResponse Upgrade(const v1::UpgradeRequest& req);

  v1::UpgradeResponse Rollback(const v1::RollbackRequest& req);

  v1::StatusResponse Status(const v1::StatusRequest& req);

  v1::AbortResponse Abort(const v1::AbortRequest& req);

  v1::ListSessionsResponse ListSessions(const v1::ListSessionsRequest& req);

  // keep == 0 uses the configured retention.
  v1::PruneResponse Prune(const v1::PruneRequest& req);

  // Empty store_id lists every configured store.
  v1::ListBackupsResponse ListBackups(const v1::ListBackupsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace rollout::service
