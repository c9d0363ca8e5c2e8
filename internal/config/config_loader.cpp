#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace snapshot::config {

namespace {

constexpr std::uint32_t kDefaultMaxRestarts = 1'000'000;
constexpr std::uint32_t kDefaultMaxSeconds  = 5;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars carry the "!" tag and always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

snapshot::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  snapshot::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::InvalidConfig("configuration root must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidConfig("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidConfig("invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace

snapshot::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig("failed to load YAML config " + path + ": " + e.what());
  }

  auto config = ParseYamlNode(yaml);
  ApplyEnvironment(config);
  ApplyDefaults(config);
  return config;
}

snapshot::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig(std::string("failed to parse YAML config: ") + e.what());
  }

  auto config = ParseYamlNode(yaml);
  ApplyEnvironment(config);
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyEnvironment(snapshot::runtime::config::RuntimeConfig& config) {
  const char* start_workers = std::getenv("SNAPSHOT_START_CAMERA_WORKERS");
  if (!start_workers) {
    return;
  }

  const std::string value(start_workers);
  if (value == "1" || value == "true") {
    config.mutable_supervisor()->set_start_camera_workers(true);
  } else if (value == "0" || value == "false") {
    config.mutable_supervisor()->set_start_camera_workers(false);
  } else {
    throw util::InvalidConfig("SNAPSHOT_START_CAMERA_WORKERS must be one of 0, 1, true, false");
  }
}

void ConfigLoader::ApplyDefaults(snapshot::runtime::config::RuntimeConfig& config) {
  auto* supervisor = config.mutable_supervisor();
  if (supervisor->max_restarts() == 0) {
    supervisor->set_max_restarts(kDefaultMaxRestarts);
  }
  if (supervisor->max_seconds() == 0) {
    supervisor->set_max_seconds(kDefaultMaxSeconds);
  }

  if (config.event_handlers_size() == 0) {
    for (const char* name : {"broadcast", "persistence", "poll_control", "storage"}) {
      config.add_event_handlers(name);
    }
  }
}

} // namespace snapshot::config
