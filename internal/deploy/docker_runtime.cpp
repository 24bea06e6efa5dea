#include "docker_runtime.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace rollout::deploy {

namespace {

constexpr char kFieldSeparator = '|';

std::string Trim(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) text.pop_back();
  while (!text.empty() && text.front() == ' ') text.erase(text.begin());
  return text;
}

} // namespace

DockerRuntime::DockerRuntime(std::string docker_path, std::chrono::milliseconds command_timeout)
    : docker_(std::move(docker_path)), timeout_(command_timeout) {
}

bool DockerRuntime::ParseListLine(const std::string& line, RunningUnit* unit) {
  std::vector<std::string> fields;
  std::stringstream        in(line);
  std::string              field;
  while (std::getline(in, field, kFieldSeparator)) {
    fields.push_back(Trim(field));
  }
  if (fields.size() != 5 || fields[0].empty()) {
    return false;
  }

  unit->identity   = fields[0];
  unit->service    = fields[1];
  unit->generation = fields[2];
  unit->version    = fields[3];
  unit->running    = fields[4] == "running";
  return true;
}

std::vector<RunningUnit> DockerRuntime::List() {
  const std::string format = "{{.Names}}|{{.Label \"" + std::string(kLabelService) + "\"}}|{{.Label \"" +
                             kLabelGeneration + "\"}}|{{.Label \"" + kLabelVersion + "\"}}|{{.State}}";

  util::CommandResult result;
  try {
    result = util::RunChecked({docker_, "ps", "-a", "--filter", std::string("label=") + kLabelManaged + "=1",
                               "--format", format},
                              timeout_, "docker ps");
  } catch (const util::CommandError& e) {
    throw util::DeploymentError(e.what());
  }

  std::vector<RunningUnit> units;
  std::stringstream        lines(result.out);
  std::string              line;
  while (std::getline(lines, line)) {
    RunningUnit unit;
    if (ParseListLine(line, &unit)) {
      units.push_back(std::move(unit));
    }
  }
  return units;
}

void DockerRuntime::Start(const UnitSpec& spec) {
  std::vector<std::string> argv = {docker_,
                                   "run",
                                   "-d",
                                   "--name",
                                   spec.identity,
                                   "--restart",
                                   "unless-stopped",
                                   "--label",
                                   std::string(kLabelManaged) + "=1",
                                   "--label",
                                   std::string(kLabelService) + "=" + spec.service,
                                   "--label",
                                   std::string(kLabelGeneration) + "=" + spec.generation,
                                   "--label",
                                   std::string(kLabelVersion) + "=" + spec.version};
  argv.insert(argv.end(), spec.run_args.begin(), spec.run_args.end());
  argv.push_back(spec.image_ref);

  try {
    util::RunChecked(argv, timeout_, "docker run " + spec.identity);
  } catch (const util::CommandError& e) {
    throw util::DeploymentError(e.what());
  }
  observability::LogInfo("unit started", {observability::StringField("unit", spec.identity),
                                           observability::StringField("image", spec.image_ref)});
}

void DockerRuntime::Remove(const std::string& identity) {
  util::CommandResult result;
  try {
    result = util::RunCommand({docker_, "rm", "-f", identity}, timeout_);
  } catch (const util::CommandError& e) {
    throw util::DeploymentError(e.what());
  }
  if (result.Ok() || result.err.find("No such container") != std::string::npos) {
    observability::LogInfo("unit removed", {observability::StringField("unit", identity)});
    return;
  }
  throw util::DeploymentError("docker rm " + identity + " failed: " + util::Summarize(result));
}

bool DockerRuntime::IsHealthy(const std::string& identity, std::chrono::milliseconds timeout) {
  util::CommandResult result;
  try {
    result = util::RunCommand(
        {docker_, "inspect", "--format", "{{.State.Running}} {{if .State.Health}}{{.State.Health.Status}}{{end}}", identity},
        timeout);
  } catch (const util::CommandError& e) {
    observability::LogWarn("docker inspect failed", {observability::StringField("unit", identity),
                                                     observability::StringField("error", e.what())});
    return false;
  }
  if (!result.Ok()) return false;

  std::istringstream in(result.out);
  std::string        running;
  std::string        health;
  in >> running >> health;
  return running == "true" && (health.empty() || health == "healthy");
}

bool DockerRuntime::ImageAvailable(const std::string& image_ref, std::chrono::milliseconds timeout) {
  try {
    if (util::RunCommand({docker_, "image", "inspect", image_ref}, timeout).Ok()) return true;
    return util::RunCommand({docker_, "manifest", "inspect", image_ref}, timeout).Ok();
  } catch (const util::CommandError& e) {
    observability::LogWarn("image lookup failed", {observability::StringField("image", image_ref),
                                                   observability::StringField("error", e.what())});
    return false;
  }
}

} // namespace rollout::deploy
