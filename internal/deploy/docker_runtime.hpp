#pragma once

#include <chrono>
#include <string>

#include "container_runtime.hpp"

namespace rollout::deploy {

// docker CLI. One container per unit, named after the unit identity.
class DockerRuntime final : public ContainerRuntime {
 public:
  DockerRuntime(std::string docker_path, std::chrono::milliseconds command_timeout);

  std::vector<RunningUnit> List() override;
  void                     Start(const UnitSpec& spec) override;
  void                     Remove(const std::string& identity) override;
  bool                     IsHealthy(const std::string& identity, std::chrono::milliseconds timeout) override;
  bool                     ImageAvailable(const std::string& image_ref, std::chrono::milliseconds timeout) override;

  // Parses one line of the `docker ps` listing format used by List().
  static bool ParseListLine(const std::string& line, RunningUnit* unit);

 private:
  std::string               docker_;
  std::chrono::milliseconds timeout_;
};

} // namespace rollout::deploy
