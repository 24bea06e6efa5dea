#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace rollout::deploy {

// Pointer naming the generation that receives traffic.
class TrafficRouter {
 public:
  virtual ~TrafficRouter() = default;

  // Empty when nothing has been routed yet.
  virtual std::string Current() = 0;

  // Atomic flip. Throws util::DeploymentError and leaves the old pointer
  // in place when the switch cannot be completed.
  virtual void Switch(const std::string& generation) = 0;

  virtual void Clear() = 0;
};

/*
  The pointer is a one-line file replaced with an atomic rename. The
  optional reload command (`{generation}` expanded) tells the proxy to
  re-read it; a failing reload puts the previous pointer back.
*/
class FileTrafficRouter final : public TrafficRouter {
 public:
  FileTrafficRouter(std::filesystem::path routing_file, std::string reload_command, std::chrono::milliseconds timeout);

  std::string Current() override;
  void        Switch(const std::string& generation) override;
  void        Clear() override;

 private:
  void Reload(const std::string& generation);

  std::filesystem::path     routing_file_;
  std::string               reload_command_;
  std::chrono::milliseconds timeout_;
};

} // namespace rollout::deploy
