#include "traffic_router.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace rollout::deploy {

FileTrafficRouter::FileTrafficRouter(std::filesystem::path routing_file, std::string reload_command,
                                     std::chrono::milliseconds timeout)
    : routing_file_(std::move(routing_file)), reload_command_(std::move(reload_command)), timeout_(timeout) {
}

std::string FileTrafficRouter::Current() {
  auto contents = util::ReadFile(routing_file_);
  if (!contents) return {};

  std::string generation = *contents;
  while (!generation.empty() && (generation.back() == '\n' || generation.back() == ' ')) generation.pop_back();
  return generation;
}

void FileTrafficRouter::Reload(const std::string& generation) {
  if (reload_command_.empty()) return;

  auto result = util::RunShell(util::ExpandTemplate(reload_command_, "generation", generation), timeout_);
  if (!result.Ok()) {
    throw util::DeploymentError("traffic reload failed" + std::string(result.timed_out ? " (timed out)" : "") + ": " +
                                util::Summarize(result));
  }
}

void FileTrafficRouter::Switch(const std::string& generation) {
  const auto previous = Current();

  try {
    util::WriteFileAtomic(routing_file_, generation + "\n");
  } catch (const std::runtime_error& e) {
    throw util::DeploymentError(std::string("routing pointer write failed: ") + e.what());
  }

  const auto restore = [&] {
    if (previous.empty()) {
      std::filesystem::remove(routing_file_);
    } else {
      util::WriteFileAtomic(routing_file_, previous + "\n");
    }
  };

  try {
    Reload(generation);
  } catch (const util::DeploymentError&) {
    restore();
    throw;
  } catch (const util::CommandError& e) {
    restore();
    throw util::DeploymentError(std::string("traffic reload failed: ") + e.what());
  }

  observability::LogInfo("traffic switched", {observability::StringField("from", previous),
                                               observability::StringField("to", generation)});
}

void FileTrafficRouter::Clear() {
  std::error_code ec;
  std::filesystem::remove(routing_file_, ec);
  if (ec) {
    throw util::DeploymentError("routing pointer remove failed: " + ec.message());
  }
}

} // namespace rollout::deploy
