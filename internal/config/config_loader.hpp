#pragma once

#include <string>

#include "config/config.pb.h"

namespace mediacache::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields get the
  defaults below, then MEDIACACHE_* environment variables override:

    MEDIACACHE_REGISTRY_PATH   registry.path       /tmp/music/metadata/file_registry.json
    MEDIACACHE_SOURCE_DIR      directories.source_dir     /tmp/music/source
    MEDIACACHE_GENERATED_DIR   directories.generated_dir  /tmp/music/temp
    MEDIACACHE_METADATA_DIR    directories.metadata_dir   /tmp/music/metadata

  Logging level/pattern overrides are resolved at logger setup.
*/
class ConfigLoader {
 public:
  static mediacache::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Defaults plus environment overrides, no file.
  static mediacache::runtime::config::RuntimeConfig LoadDefaults();

  static void ApplyDefaults(mediacache::runtime::config::RuntimeConfig* config);
  static void ApplyEnvironment(mediacache::runtime::config::RuntimeConfig* config);
};

} // namespace mediacache::config
