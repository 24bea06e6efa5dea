#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace rollout::core {
class UpdateOrchestrator;
}
namespace rollout::service {
class UpdateService;
}

namespace rollout::factory {

/*
  Application

  Owns every long-lived object of the daemon. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<core::UpdateOrchestrator>     orchestrator;
  std::shared_ptr<service::UpdateService>       update_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows the concrete session
  store, container runtime, router and store adapters.
*/
Application Build(const rollout::runtime::config::RuntimeConfig& config);

} // namespace rollout::factory
