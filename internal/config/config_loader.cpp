#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/model/resource_type.hpp"

namespace outbox::config {

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
      throw std::runtime_error("Unsupported YAML node");
  }
}

static void Validate(const outbox::runtime::config::RuntimeConfig& config) {
  for (const auto& resource : config.resources()) {
    if (!outbox::model::ParseResourceType(resource)) {
      throw std::runtime_error("Invalid configuration: unknown resource '" + resource + "'");
    }
  }

  const auto& delivery = config.delivery();
  if (delivery.min_backoff_ms() != 0 && delivery.max_backoff_ms() != 0 && delivery.min_backoff_ms() > delivery.max_backoff_ms()) {
    throw std::runtime_error("Invalid configuration: delivery.min_backoff_ms exceeds delivery.max_backoff_ms");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

outbox::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  outbox::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return WithDefaults(std::move(config));
}

outbox::runtime::config::RuntimeConfig WithDefaults(outbox::runtime::config::RuntimeConfig config) {
  auto* storage = config.mutable_storage();
  if (storage->kind() == outbox::runtime::config::STORAGE_KIND_UNSPECIFIED) {
    storage->set_kind(outbox::runtime::config::STORAGE_KIND_DISK);
  }
  if (storage->root_path().empty()) {
    storage->set_root_path("/tmp/outbox");
  }
  if (!storage->has_fsync()) {
    storage->set_fsync(true);
  }

  if (config.queue().max_items() == 0) {
    config.mutable_queue()->set_max_items(64);
  }

  auto* delivery = config.mutable_delivery();
  if (delivery->workers() == 0) {
    delivery->set_workers(2);
  }
  if (delivery->tick_interval_ms() == 0) {
    delivery->set_tick_interval_ms(30000);
  }
  if (delivery->min_backoff_ms() == 0) {
    delivery->set_min_backoff_ms(1000);
  }
  if (delivery->max_backoff_ms() == 0) {
    delivery->set_max_backoff_ms(60000);
  }

  if (config.resources().empty()) {
    config.add_resources(std::string(outbox::model::ToString(outbox::v1::RESOURCE_TYPE_ERRORS)));
    config.add_resources(std::string(outbox::model::ToString(outbox::v1::RESOURCE_TYPE_SESSIONS)));
  }

  return config;
}

} // namespace outbox::config
