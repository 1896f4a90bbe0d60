#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sparkscope::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  // Quoted scalars stay strings even when they look numeric.
  if (node.Tag() != "!") {
    char*        endptr  = nullptr;
    const double numeric = strtod(scalar.c_str(), &endptr);
    if (!scalar.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(scalar);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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
      for (std::size_t i = 0; i < node.size(); ++i) {
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
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

sparkscope::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::BadFile& e) {
    throw util::SourceUnavailable("cannot open config file " + path + ": " + e.what());
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("failed to parse YAML config " + path + ": " + e.what());
  }

  sparkscope::runtime::config::RuntimeConfig config;

  // An empty file is a valid, default configuration.
  if (yaml.IsNull()) {
    ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::InvalidArgument("config root must be a mapping: " + path);
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

  ApplyDefaults(config);
  return config;
}

sparkscope::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  sparkscope::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(sparkscope::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }
  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level("info");
  }
  if (!config.ingest().has_diagnostic_sample_limit()) {
    config.mutable_ingest()->set_diagnostic_sample_limit(kDefaultDiagnosticSampleMax);
  }
}

} // namespace sparkscope::config
