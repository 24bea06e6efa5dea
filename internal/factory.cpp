#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/backup/database_migrator.hpp"
#include "internal/backup/store_adapter.hpp"
#include "internal/core/update_orchestrator.hpp"
#include "internal/db/file/file_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/deploy/docker_runtime.hpp"
#include "internal/deploy/driver_factory.hpp"
#include "internal/deploy/traffic_router.hpp"
#include "internal/grpc/update_server.hpp"
#include "internal/health/health_evaluator.hpp"
#include "internal/health/health_probe.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/update_service.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/util/time.hpp"
#include "internal/verify/signature_lookup.hpp"
#include "internal/verify/signature_verifier.hpp"

namespace rollout::factory {

using rollout::runtime::config::RuntimeConfig;
using std::chrono::milliseconds;

namespace {

std::shared_ptr<db::SessionRepository> BuildRepository(const RuntimeConfig& config) {
  const auto& state = config.state();

  if (state.backend() == "sqlite") {
    std::filesystem::create_directories(std::filesystem::path(state.sqlite_path()).parent_path());
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(state.sqlite_path());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  if (state.backend() == "file") {
    return std::make_shared<db::file::FileRepository>(std::filesystem::path(state.dir()) / "sessions");
  }

  if (state.backend() == "memory") {
    observability::LogWarn("memory session store: sessions do not survive a restart");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  throw std::runtime_error("unknown state backend: " + state.backend());
}

health::HealthPolicy BuildHealthPolicy(const RuntimeConfig& config) {
  const auto&          health = config.health();
  health::HealthPolicy policy;
  if (health.attempts() > 0) policy.attempts = health.attempts();
  policy.interval      = util::ToMillis(health.interval(), policy.interval);
  policy.deadline      = util::ToMillis(health.deadline(), policy.deadline);
  policy.probe_timeout = util::ToMillis(health.probe_timeout(), policy.probe_timeout);
  return policy;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Durable session state
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto state_manager = std::make_shared<state::StateManager>(repository, std::filesystem::path(config.state().dir()) / "locks");

  // ------------------------------------------------------------------
  // Persistent stores and their backups
  // ------------------------------------------------------------------
  std::vector<std::shared_ptr<backup::StoreAdapter>> stores;
  for (const auto& store : config.stores()) {
    stores.push_back(backup::MakeStoreAdapter(store));
  }

  backup::MigratorOptions migrator_options;
  migrator_options.dir            = config.backup().dir();
  migrator_options.max_backups    = config.backup().max_backups();
  migrator_options.timeout        = util::ToMillis(config.backup().timeout(), migrator_options.timeout);
  migrator_options.min_free_bytes = config.backup().min_free_bytes();
  auto migrator                   = std::make_shared<backup::DatabaseMigrator>(stores, migrator_options);

  // ------------------------------------------------------------------
  // Signature verification
  // ------------------------------------------------------------------
  const auto& signatures = config.signatures();
  auto        lookup     = std::make_shared<verify::CosignLookup>(signatures);
  auto        verifier   = std::make_shared<verify::SignatureVerifier>(lookup, signatures.parallelism(),
                                                                       util::ToMillis(signatures.timeout(), milliseconds(60000)));

  // ------------------------------------------------------------------
  // Deployment
  // ------------------------------------------------------------------
  const auto& deployment = config.deployment();
  auto        runtime    = std::make_shared<deploy::DockerRuntime>(deployment.docker_path(), milliseconds(60000));
  auto        router     = std::make_shared<deploy::FileTrafficRouter>(deployment.routing_file(), deployment.reload_command(),
                                                                       milliseconds(30000));
  auto        probe      = std::make_shared<health::CommandUnitProbe>(deployment, runtime);
  auto        evaluator  = std::make_shared<health::HealthEvaluator>(probe, stores, BuildHealthPolicy(config));
  auto        drivers    = std::make_shared<deploy::DriverFactory>(runtime, router, evaluator, deploy::MakeDriverOptions(deployment));

  // ------------------------------------------------------------------
  // Orchestrator
  // ------------------------------------------------------------------
  core::OrchestratorOptions options;
  options.deployment_target = config.state().deployment_target();
  if (auto strategy = model::ParseStrategy(config.defaults().strategy())) {
    options.default_strategy = *strategy;
  }
  options.phase_timeout  = util::ToMillis(config.defaults().phase_timeout(), options.phase_timeout);
  options.min_free_bytes = config.backup().min_free_bytes();

  app.orchestrator = std::make_shared<core::UpdateOrchestrator>(state_manager, migrator, verifier, evaluator, drivers, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator = app.orchestrator;
  ctx.state        = state_manager;
  ctx.migrator     = migrator;
  ctx.retention    = config.state().retention();

  app.update_service = std::make_shared<service::UpdateService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::UpdateServer>(app.update_service));

  return app;
}

} // namespace rollout::factory
