#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace rollout::config {

using rollout::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("60s", "1.2.0")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static void SetDefaultDuration(google::protobuf::Duration* duration, int64_t seconds) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    duration->set_seconds(seconds);
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("127.0.0.1:50061");
  }

  auto* state = config.mutable_state();
  if (state->backend().empty()) state->set_backend("file");
  if (state->dir().empty()) state->set_dir("/var/lib/rollout");
  if (state->sqlite_path().empty()) state->set_sqlite_path(state->dir() + "/sessions.db");
  if (state->retention() == 0) state->set_retention(50);
  if (state->deployment_target().empty()) state->set_deployment_target("default");

  auto* backup = config.mutable_backup();
  if (backup->dir().empty()) backup->set_dir(state->dir() + "/backups");
  if (backup->max_backups() == 0) backup->set_max_backups(10);
  SetDefaultDuration(backup->mutable_timeout(), 300);

  auto* signatures = config.mutable_signatures();
  if (signatures->cosign_path().empty()) signatures->set_cosign_path("cosign");
  if (!signatures->has_keyless()) signatures->set_keyless(signatures->public_key_path().empty());
  if (signatures->identity_regexp().empty()) signatures->set_identity_regexp(".*");
  if (signatures->oidc_issuer_regexp().empty()) signatures->set_oidc_issuer_regexp(".*");
  if (signatures->parallelism() == 0) signatures->set_parallelism(3);
  SetDefaultDuration(signatures->mutable_timeout(), 60);

  auto* deployment = config.mutable_deployment();
  if (deployment->docker_path().empty()) deployment->set_docker_path("docker");
  if (deployment->routing_file().empty()) deployment->set_routing_file(state->dir() + "/live-generation");
  SetDefaultDuration(deployment->mutable_grace_period(), 60);
  if (deployment->unit_start_attempts() == 0) deployment->set_unit_start_attempts(3);
  SetDefaultDuration(deployment->mutable_unit_retry_backoff(), 5);
  for (auto& service : *deployment->mutable_services()) {
    if (service.replicas() == 0) service.set_replicas(1);
  }

  auto* health = config.mutable_health();
  if (health->attempts() == 0) health->set_attempts(24);
  SetDefaultDuration(health->mutable_interval(), 5);
  SetDefaultDuration(health->mutable_deadline(), 120);
  SetDefaultDuration(health->mutable_probe_timeout(), 10);

  auto* defaults = config.mutable_defaults();
  if (defaults->strategy().empty()) defaults->set_strategy("parallel-cutover");
  SetDefaultDuration(defaults->mutable_phase_timeout(), 600);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& backend = config.state().backend();
  if (backend != "file" && backend != "sqlite" && backend != "memory") {
    throw std::runtime_error("Invalid configuration: state.backend must be file, sqlite or memory, got '" + backend + "'");
  }

  const auto& strategy = config.defaults().strategy();
  if (strategy != "parallel-cutover" && strategy != "sequential-replace") {
    throw std::runtime_error("Invalid configuration: defaults.strategy must be parallel-cutover or sequential-replace");
  }

  std::set<std::string> store_ids;
  for (const auto& store : config.stores()) {
    if (store.id().empty()) {
      throw std::runtime_error("Invalid configuration: store without id");
    }
    if (!store_ids.insert(store.id()).second) {
      throw std::runtime_error("Invalid configuration: duplicate store id '" + store.id() + "'");
    }
    if (store.kind() == "sqlite") {
      if (store.path().empty()) {
        throw std::runtime_error("Invalid configuration: sqlite store '" + store.id() + "' needs a path");
      }
      if (!store.migrate_command().empty()) {
        throw std::runtime_error("Invalid configuration: sqlite store '" + store.id() + "' takes migrations_dir, not migrate_command");
      }
    } else if (store.kind() == "command" || store.kind().empty()) {
      if (store.export_command().empty() || store.import_command().empty()) {
        throw std::runtime_error("Invalid configuration: command store '" + store.id() + "' needs export_command and import_command");
      }
      if (!store.migrations_dir().empty()) {
        throw std::runtime_error("Invalid configuration: command store '" + store.id() + "' takes migrate_command, not migrations_dir");
      }
    } else {
      throw std::runtime_error("Invalid configuration: unknown store kind '" + store.kind() + "'");
    }
  }

  std::set<std::string> service_names;
  for (const auto& service : config.deployment().services()) {
    if (service.name().empty() || service.image().empty()) {
      throw std::runtime_error("Invalid configuration: every service needs a name and an image");
    }
    if (!service_names.insert(service.name()).second) {
      throw std::runtime_error("Invalid configuration: duplicate service '" + service.name() + "'");
    }
  }

  if (!config.signatures().keyless() && config.signatures().public_key_path().empty()) {
    throw std::runtime_error("Invalid configuration: signatures.public_key_path is required when keyless is false");
  }
}

} // namespace rollout::config
