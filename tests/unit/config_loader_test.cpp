#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "rollout_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)rollout::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
state:
  backend: sqlite
  dir: /srv/rollout
stores:
  - id: appdb
    kind: sqlite
    path: /srv/app/app.db
  - id: search
    kind: command
    export_command: "search-dump {path}"
    import_command: "search-load {path}"
signatures:
  public_key_path: /etc/rollout/cosign.pub
  keyless: false
  parallelism: 5
deployment:
  grace_period: "30s"
  services:
    - name: api
      image: registry.example.com/api
      replicas: 3
      health_command: "curl -fs http://{unit}:8080/healthz"
    - name: worker
      image: registry.example.com/worker
defaults:
  strategy: sequential-replace
  phase_timeout: "120s"
)");

  auto config = rollout::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.state().backend() == "sqlite");
  assert(config.state().sqlite_path() == "/srv/rollout/sessions.db");
  assert(config.backup().dir() == "/srv/rollout/backups");
  assert(config.stores_size() == 2);
  assert(config.stores(1).export_command() == "search-dump {path}");
  assert(!config.signatures().keyless());
  assert(config.signatures().parallelism() == 5);
  assert(config.deployment().grace_period().seconds() == 30);
  assert(config.deployment().services(0).replicas() == 3);
  assert(config.deployment().services(1).replicas() == 1);
  assert(config.defaults().strategy() == "sequential-replace");
  assert(config.defaults().phase_timeout().seconds() == 120);
}

void TestDefaultsForMinimalConfig() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(deployment:
  services:
    - name: api
      image: registry.example.com/api
)");

  auto config = rollout::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.state().backend() == "file");
  assert(config.state().retention() == 50);
  assert(config.state().deployment_target() == "default");
  assert(config.backup().max_backups() == 10);
  assert(config.signatures().keyless());
  assert(config.signatures().parallelism() == 3);
  assert(config.signatures().cosign_path() == "cosign");
  assert(config.deployment().grace_period().seconds() == 60);
  assert(config.deployment().unit_start_attempts() == 3);
  assert(config.deployment().routing_file() == "/var/lib/rollout/live-generation");
  assert(config.health().attempts() == 24);
  assert(config.health().deadline().seconds() == 120);
  assert(config.defaults().strategy() == "parallel-cutover");
  assert(config.defaults().phase_timeout().seconds() == 600);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(state:
  backend: sqlite
  sqlite_path: "C:\\rollout\\\"quoted\"\\sessions.db"
)");

  auto config = rollout::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.state().sqlite_path() == "C:\\rollout\\\"quoted\"\\sessions.db");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestInvalidSettingsAreRejected() {
  assert(Rejects("bad_backend", "state:\n  backend: postgres\n"));
  assert(Rejects("bad_strategy", "defaults:\n  strategy: canary\n"));
  assert(Rejects("duplicate_store", R"(stores:
  - id: appdb
    kind: sqlite
    path: /a.db
  - id: appdb
    kind: sqlite
    path: /b.db
)"));
  assert(Rejects("command_store_without_import", R"(stores:
  - id: search
    export_command: "dump {path}"
)"));
  assert(Rejects("service_without_image", R"(deployment:
  services:
    - name: api
)"));
  assert(Rejects("key_mode_without_key", "signatures:\n  keyless: false\n"));
}

void TestMigrationSettingsMatchStoreKind() {
  const auto yaml_path = WriteYaml("migrations", R"(stores:
  - id: appdb
    kind: sqlite
    path: /srv/shop/app.db
    migrations_dir: /srv/shop/migrations
  - id: search
    kind: command
    export_command: "dump {store} {path}"
    import_command: "load {path} {store}"
    migrate_command: "migrate {store} --to {version}"
)");
  const auto config    = rollout::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.stores_size() == 2);
  assert(config.stores(0).migrations_dir() == "/srv/shop/migrations");
  assert(config.stores(1).migrate_command() == "migrate {store} --to {version}");

  assert(Rejects("sqlite_with_migrate_command", R"(stores:
  - id: appdb
    kind: sqlite
    path: /a.db
    migrate_command: "migrate {store}"
)"));
  assert(Rejects("command_with_migrations_dir", R"(stores:
  - id: search
    export_command: "dump {path}"
    import_command: "load {path}"
    migrations_dir: /srv/migrations
)"));
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsForMinimalConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestInvalidSettingsAreRejected();
  TestMigrationSettingsMatchStoreKind();

  std::cout << "rollout_unit_config_loader: pass\n";
  return 0;
}
