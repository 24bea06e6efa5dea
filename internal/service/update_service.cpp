#include "update_service.hpp"

#include <stdexcept>

#include "internal/backup/database_migrator.hpp"
#include "internal/core/update_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/util/errors.hpp"

namespace rollout::service {

namespace {

v1::UpgradeResponse ToResponse(const core::UpgradeOutcome& outcome) {
  v1::UpgradeResponse resp;
  *resp.mutable_session() = outcome.session;
  resp.set_outcome(outcome.outcome);
  resp.set_manual_intervention_required(outcome.manual_intervention_required);
  for (const auto& step : outcome.plan) {
    resp.add_plan(step);
  }
  resp.set_message(outcome.message);
  return resp;
}

} // namespace

UpdateService::UpdateService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.orchestrator || !ctx_.state || !ctx_.migrator) {
    throw std::invalid_argument("UpdateService requires orchestrator, state and migrator");
  }
}

v1::UpgradeResponse UpdateService::Upgrade(const v1::UpgradeRequest& req) {
  if (req.target_version().empty()) {
    throw util::ValidationError("target_version is required");
  }

  core::UpgradeRequest request;
  request.target_version    = req.target_version();
  request.strategy          = req.strategy();
  request.dry_run           = req.dry_run();
  request.skip_backup       = req.skip_backup();
  request.verify_signatures = !req.has_verify_signatures() || req.verify_signatures();
  request.timeout_seconds   = req.timeout_seconds();

  observability::LogInfo("upgrade requested", {observability::StringField("target_version", request.target_version),
                                               observability::BoolField("dry_run", request.dry_run)});

  return ToResponse(ctx_.orchestrator->Upgrade(request));
}

v1::UpgradeResponse UpdateService::Rollback(const v1::RollbackRequest& req) {
  return ToResponse(ctx_.orchestrator->Rollback(req.session_id()));
}

v1::StatusResponse UpdateService::Status(const v1::StatusRequest& req) {
  auto view = ctx_.orchestrator->Status(req.session_id());

  v1::StatusResponse resp;
  *resp.mutable_session() = std::move(view.session);
  for (auto& unit : view.units) {
    *resp.add_units() = std::move(unit);
  }
  return resp;
}

v1::AbortResponse UpdateService::Abort(const v1::AbortRequest& req) {
  if (req.session_id().empty()) {
    throw util::ValidationError("session_id is required");
  }
  if (!ctx_.state->Get(req.session_id())) {
    throw util::NotFound("session not found: " + req.session_id());
  }

  v1::AbortResponse resp;
  resp.set_accepted(ctx_.orchestrator->Abort(req.session_id()));
  return resp;
}

v1::ListSessionsResponse UpdateService::ListSessions(const v1::ListSessionsRequest& req) {
  v1::ListSessionsResponse resp;
  for (auto& session : req.active_only() ? ctx_.state->ListActive() : ctx_.state->ListAll()) {
    *resp.add_sessions() = std::move(session);
  }
  return resp;
}

v1::PruneResponse UpdateService::Prune(const v1::PruneRequest& req) {
  const std::size_t keep = req.keep() > 0 ? req.keep() : ctx_.retention;

  v1::PruneResponse resp;
  resp.set_removed(static_cast<std::uint32_t>(ctx_.state->Prune(keep)));
  return resp;
}

v1::ListBackupsResponse UpdateService::ListBackups(const v1::ListBackupsRequest& req) {
  std::vector<std::string> stores;
  if (req.store_id().empty()) {
    stores = ctx_.migrator->StoreIds();
  } else {
    stores.push_back(req.store_id());
  }

  v1::ListBackupsResponse resp;
  for (const auto& store : stores) {
    for (auto& record : ctx_.migrator->ListBackups(store)) {
      *resp.add_backups() = std::move(record);
    }
  }
  return resp;
}

} // namespace rollout::service
