#include <cassert>
#include <fstream>
#include <iostream>

#include "internal/deploy/docker_runtime.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

using namespace rollout;
using namespace std::chrono_literals;

namespace {

// A docker stand-in that answers the handful of subcommands the runtime uses
// and appends every invocation to `calls`.
std::filesystem::path WriteFakeDocker(const std::filesystem::path& dir) {
  const auto path = dir / "docker";
  std::ofstream out(path);
  out << "#!/bin/sh\n"
      << "echo \"$@\" >> \"" << (dir / "calls").string() << "\"\n"
      << "case \"$1\" in\n"
      << "  ps) printf 'api-blue-0|api|blue|1.0|running\\napi-blue-1|api|blue|1.0|exited\\nnot a unit\\n' ;;\n"
      << "  inspect) if [ \"$4\" = api-blue-0 ]; then echo 'true healthy'; "
      << "elif [ \"$4\" = api-blue-2 ]; then echo 'true starting'; else echo 'false'; fi ;;\n"
      << "  image|manifest) if [ \"$3\" = registry/slow:1 ]; then sleep 5; fi\n"
      << "    [ \"$1\" = image ] && [ \"$3\" = registry/api:1.0 ] && exit 0\n"
      << "    [ \"$1\" = manifest ] && [ \"$3\" = registry/api:2.0 ] && exit 0\n"
      << "    exit 1 ;;\n"
      << "  run) case \"$*\" in *broken*) echo 'pull access denied' >&2; exit 125 ;; esac ;;\n"
      << "  rm) if [ \"$3\" = ghost ]; then echo 'Error: No such container: ghost' >&2; exit 1; fi\n"
      << "    if [ \"$3\" = stuck ]; then echo 'permission denied' >&2; exit 1; fi ;;\n"
      << "esac\n";
  out.close();
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path;
}

void TestParseListLine() {
  deploy::RunningUnit unit;
  assert(deploy::DockerRuntime::ParseListLine("api-green-1|api|green|2.0|running\n", &unit));
  assert(unit.identity == "api-green-1");
  assert(unit.service == "api");
  assert(unit.generation == "green");
  assert(unit.version == "2.0");
  assert(unit.running);

  assert(deploy::DockerRuntime::ParseListLine("worker-blue-0|worker|blue|1.0|exited", &unit));
  assert(!unit.running);

  assert(!deploy::DockerRuntime::ParseListLine("", &unit));
  assert(!deploy::DockerRuntime::ParseListLine("|api|blue|1.0|running", &unit));
  assert(!deploy::DockerRuntime::ParseListLine("api-blue-0|api|blue|running", &unit));
}

void TestListAndHealth() {
  const auto             dir = testing::FreshDir("docker_runtime_list");
  deploy::DockerRuntime runtime(WriteFakeDocker(dir).string(), 5000ms);

  const auto units = runtime.List();
  assert(units.size() == 2);
  assert(units[0].identity == "api-blue-0" && units[0].running);
  assert(units[1].identity == "api-blue-1" && !units[1].running);

  assert(runtime.IsHealthy("api-blue-0", 5000ms));
  assert(!runtime.IsHealthy("api-blue-1", 5000ms));
  assert(!runtime.IsHealthy("api-blue-2", 5000ms));
}

void TestImageLookup() {
  const auto             dir = testing::FreshDir("docker_runtime_images");
  deploy::DockerRuntime runtime(WriteFakeDocker(dir).string(), 5000ms);

  assert(runtime.ImageAvailable("registry/api:1.0", 5000ms));
  assert(runtime.ImageAvailable("registry/api:2.0", 5000ms));
  assert(!runtime.ImageAvailable("registry/api:9.9", 5000ms));

  const auto start = std::chrono::steady_clock::now();
  assert(!runtime.ImageAvailable("registry/slow:1", 200ms));
  assert(std::chrono::steady_clock::now() - start < 4s);
}

void TestStartAndRemove() {
  const auto             dir = testing::FreshDir("docker_runtime_start");
  deploy::DockerRuntime runtime(WriteFakeDocker(dir).string(), 5000ms);

  deploy::UnitSpec spec;
  spec.identity   = "api-green-0";
  spec.service    = "api";
  spec.generation = "green";
  spec.version    = "2.0";
  spec.image_ref  = "registry/api:2.0";
  spec.run_args   = {"--network", "app"};
  runtime.Start(spec);

  const auto calls = *util::ReadFile(dir / "calls");
  assert(calls.find("run -d --name api-green-0") != std::string::npos);
  assert(calls.find("--label rollout.generation=green") != std::string::npos);
  assert(calls.find("--label rollout.version=2.0 --network app registry/api:2.0") != std::string::npos);

  spec.image_ref = "registry/broken:2.0";
  std::string message;
  try {
    runtime.Start(spec);
  } catch (const util::DeploymentError& e) {
    message = e.what();
  }
  assert(message.find("pull access denied") != std::string::npos);

  runtime.Remove("api-green-0");
  // Removing a unit that is already gone is not an error.
  runtime.Remove("ghost");

  bool threw = false;
  try {
    runtime.Remove("stuck");
  } catch (const util::DeploymentError&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingBinaryIsADeploymentError() {
  deploy::DockerRuntime runtime("/nonexistent/docker", 1000ms);
  bool                  threw = false;
  try {
    runtime.List();
  } catch (const util::DeploymentError&) {
    threw = true;
  }
  assert(threw);
  assert(!runtime.IsHealthy("api-blue-0", 1000ms));
}

} // namespace

int main() {
  TestParseListLine();
  TestListAndHealth();
  TestImageLookup();
  TestStartAndRemove();
  TestMissingBinaryIsADeploymentError();

  std::cout << "docker_runtime_test: pass\n";
  return 0;
}
