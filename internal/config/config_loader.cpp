#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "internal/model/projection_mode.hpp"
#include "internal/util/errors.hpp"

namespace projsync::config {

using projsync::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
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
      throw util::InvalidArgument("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  // An empty document is an all-defaults config.
  if (yaml.IsNull()) {
    ConfigLoader::Validate(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

static void RequireNonNegative(const google::protobuf::Duration& duration, const char* name) {
  if (duration.seconds() < 0 || duration.nanos() < 0) {
    throw util::InvalidArgument(std::string("Invalid configuration: ") + name + " must not be negative");
  }
}

static bool IsLogLevel(const std::string& level) {
  for (const char* known : {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"}) {
    if (level == known) return true;
  }
  return false;
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
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& sync = config.sync();
  if (!sync.mode().empty() && !model::ParseProjectionMode(sync.mode())) {
    throw util::InvalidArgument("Invalid configuration: sync.mode must be inline, indexed-view or summary-table, got '" + sync.mode() + "'");
  }
  RequireNonNegative(sync.staleness_window(), "sync.staleness_window");
  RequireNonNegative(sync.upsert_deadline(), "sync.upsert_deadline");
  RequireNonNegative(sync.retry_backoff_initial(), "sync.retry_backoff_initial");
  RequireNonNegative(sync.retry_backoff_max(), "sync.retry_backoff_max");
  RequireNonNegative(config.monitor().sweep_interval(), "monitor.sweep_interval");
  RequireNonNegative(config.summary().tombstone_retention(), "summary.tombstone_retention");

  if (sync.has_retry_backoff_initial() && sync.has_retry_backoff_max()) {
    const auto& lo = sync.retry_backoff_initial();
    const auto& hi = sync.retry_backoff_max();
    if (hi.seconds() < lo.seconds() || (hi.seconds() == lo.seconds() && hi.nanos() < lo.nanos())) {
      throw util::InvalidArgument("Invalid configuration: sync.retry_backoff_max is below sync.retry_backoff_initial");
    }
  }

  const auto& derivation = config.derivation();
  if (derivation.divisor() != 0.0 && !(std::isfinite(derivation.divisor()) && derivation.divisor() > 0.0)) {
    throw util::InvalidArgument("Invalid configuration: derivation.divisor must be positive");
  }
  if (!derivation.input_column().empty() && derivation.input_column() == derivation.output_column()) {
    throw util::InvalidArgument("Invalid configuration: derivation.output_column must differ from derivation.input_column");
  }

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw util::InvalidArgument("Invalid configuration: database.sqlite.path is required");
  }
  RequireNonNegative(database.sqlite().busy_timeout(), "database.sqlite.busy_timeout");
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::InvalidArgument("Invalid configuration: database.postgres.connection_uri is required");
  }

  if (!config.logging().level().empty() && !IsLogLevel(config.logging().level())) {
    throw util::InvalidArgument("Invalid configuration: unknown logging.level '" + config.logging().level() + "'");
  }
  if (!config.logging().drift_level().empty() && !IsLogLevel(config.logging().drift_level())) {
    throw util::InvalidArgument("Invalid configuration: unknown logging.drift_level '" + config.logging().drift_level() + "'");
  }

  const double ratio = config.observability().sampling_ratio();
  if (ratio > 1.0) {
    throw util::InvalidArgument("Invalid configuration: observability.sampling_ratio must not exceed 1");
  }
}

} // namespace projsync::config
