#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rollout::deploy {

// Labels carried by every managed unit.
inline constexpr const char* kLabelManaged    = "rollout.managed";
inline constexpr const char* kLabelService    = "rollout.service";
inline constexpr const char* kLabelGeneration = "rollout.generation";
inline constexpr const char* kLabelVersion    = "rollout.version";

struct UnitSpec {
  std::string              identity;
  std::string              service;
  std::string              generation;
  std::string              version;
  std::string              image_ref;
  std::vector<std::string> run_args;
};

struct RunningUnit {
  std::string identity;
  std::string service;
  std::string generation;
  std::string version;
  bool        running = false;
};

/*
  Container engine as seen by the deployment drivers.

  Mutating calls throw util::DeploymentError. Remove is idempotent.
*/
class ContainerRuntime {
 public:
  virtual ~ContainerRuntime() = default;

  virtual std::vector<RunningUnit> List() = 0;

  virtual void Start(const UnitSpec& spec) = 0;

  virtual void Remove(const std::string& identity) = 0;

  virtual bool IsHealthy(const std::string& identity, std::chrono::milliseconds timeout) = 0;

  virtual bool ImageAvailable(const std::string& image_ref, std::chrono::milliseconds timeout) = 0;
};

} // namespace rollout::deploy
