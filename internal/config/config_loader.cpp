#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace mediacache::config {

using mediacache::runtime::config::RuntimeConfig;

namespace {

constexpr char kDefaultRegistryPath[] = "/tmp/music/metadata/file_registry.json";
constexpr char kDefaultSourceDir[]    = "/tmp/music/source";
constexpr char kDefaultGeneratedDir[] = "/tmp/music/temp";
constexpr char kDefaultMetadataDir[]  = "/tmp/music/metadata";
constexpr unsigned kDefaultMaxAgeDays = 7;

const char* const kDefaultExtensions[] = {
    // video
    ".mp4", ".avi", ".mkv", ".mov", ".webm", ".wmv", ".flv", ".m4v",
    // audio
    ".mp3", ".wav", ".flac", ".m4a", ".ogg", ".aac", ".wma",
    // image
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif", ".webp"};

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

void OverrideFromEnv(const char* name, std::string* target) {
  if (const char* value = std::getenv(name)) {
    if (*value != '\0') {
      *target = value;
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* registry = config->mutable_registry();
  if (registry->path().empty()) {
    registry->set_path(kDefaultRegistryPath);
  }

  auto* directories = config->mutable_directories();
  if (directories->source_dir().empty()) {
    directories->set_source_dir(kDefaultSourceDir);
  }
  if (directories->generated_dir().empty()) {
    directories->set_generated_dir(kDefaultGeneratedDir);
  }
  if (directories->metadata_dir().empty()) {
    directories->set_metadata_dir(kDefaultMetadataDir);
  }
  if (directories->allowed_extensions().empty()) {
    for (const char* extension : kDefaultExtensions) {
      directories->add_allowed_extensions(extension);
    }
  }

  if (!config->cache().has_write_provenance_sidecars()) {
    config->mutable_cache()->set_write_provenance_sidecars(true);
  }
  if (config->cache().max_age_days() == 0) {
    config->mutable_cache()->set_max_age_days(kDefaultMaxAgeDays);
  }
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig* config) {
  OverrideFromEnv("MEDIACACHE_REGISTRY_PATH", config->mutable_registry()->mutable_path());
  OverrideFromEnv("MEDIACACHE_SOURCE_DIR", config->mutable_directories()->mutable_source_dir());
  OverrideFromEnv("MEDIACACHE_GENERATED_DIR", config->mutable_directories()->mutable_generated_dir());
  OverrideFromEnv("MEDIACACHE_METADATA_DIR", config->mutable_directories()->mutable_metadata_dir());
}

RuntimeConfig ConfigLoader::LoadDefaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  ApplyEnvironment(&config);
  return config;
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

  RuntimeConfig config;
  if (yaml.IsNull()) {
    ApplyDefaults(&config);
    ApplyEnvironment(&config);
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
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  ApplyEnvironment(&config);
  return config;
}

} // namespace mediacache::config
