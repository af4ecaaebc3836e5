#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

#include "internal/util/errors.hpp"

namespace ledger::config {

using ledger::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0001", "true")
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
      throw util::InvalidArgument("unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // empty document: all defaults
  if (yaml.IsNull()) return config;

  if (!yaml.IsMap()) {
    throw util::InvalidArgument("configuration root must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("failed to load YAML config " + path + ": " + e.what());
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument(std::string("failed to parse YAML config: ") + e.what());
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& db = config.database();
  if (db.has_sqlite() && db.sqlite().path().empty()) {
    throw util::InvalidArgument("database.sqlite.path must be set");
  }
  if (db.has_postgres() && db.postgres().connection_uri().empty()) {
    throw util::InvalidArgument("database.postgres.connection_uri must be set");
  }

  const auto& retry = config.journal().storage_retry();
  if (retry.max_backoff_ms() != 0 && retry.max_backoff_ms() < retry.initial_backoff_ms()) {
    throw util::InvalidArgument("journal.storage_retry.max_backoff_ms is below initial_backoff_ms");
  }

  const auto& redrive = config.dlq().auto_redrive();
  if (redrive.max_backoff_ms() != 0 && redrive.max_backoff_ms() < redrive.initial_backoff_ms()) {
    throw util::InvalidArgument("dlq.auto_redrive.max_backoff_ms is below initial_backoff_ms");
  }

  const double ratio = config.observability().trace_sample_ratio();
  if (ratio < 0.0 || ratio > 1.0) {
    throw util::InvalidArgument("observability.trace_sample_ratio must be within [0, 1]");
  }
}

} // namespace ledger::config
