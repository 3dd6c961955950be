#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/cache_manager.hpp"
#include "internal/recovery/resource_recovery.hpp"
#include "internal/registry/resource_registry.hpp"
#include "internal/service/resource_service.hpp"

namespace mediacache::factory {

/*
  RuntimeDependencies

  Owns the long-lived components of one process. The registry is loaded
  from disk before anything else sees it.
*/
struct RuntimeDependencies {
  std::shared_ptr<registry::ResourceRegistry> registry;
  std::shared_ptr<cache::CacheManager> cache_manager;
  std::shared_ptr<recovery::ResourceRecovery> recovery;
  std::shared_ptr<service::ResourceService> service;
};

/*
  BuildRuntime

  Composition root: the only place that maps config onto concrete components.
*/
RuntimeDependencies BuildRuntime(const mediacache::runtime::config::RuntimeConfig& config);

recovery::RecoveryDirectories DirectoriesFromConfig(const mediacache::runtime::config::RuntimeConfig& config);

} // namespace mediacache::factory
