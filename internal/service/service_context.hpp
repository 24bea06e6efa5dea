#pragma once

#include <cstddef>
#include <memory>

namespace rollout::core {
class UpdateOrchestrator;
}
namespace rollout::state {
class StateManager;
}
namespace rollout::backup {
class DatabaseMigrator;
}

namespace rollout::service {

/*
  Dependency container shared by the service layer.
*/
struct ServiceContext {
  std::shared_ptr<rollout::core::UpdateOrchestrator> orchestrator;
  std::shared_ptr<rollout::state::StateManager>      state;
  std::shared_ptr<rollout::backup::DatabaseMigrator> migrator;
  std::size_t                                        retention = 50;
};

} // namespace rollout::service
