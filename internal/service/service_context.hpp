#pragma once

#include <memory>

#include "internal/recovery/resource_recovery.hpp"

namespace mediacache::registry { class ResourceRegistry; }
namespace mediacache::cache { class CacheManager; }

namespace mediacache::service {

/*
  Dependency container for the resource service.
*/
struct ServiceContext {
  std::shared_ptr<mediacache::registry::ResourceRegistry> registry;
  std::shared_ptr<mediacache::cache::CacheManager> cache;
  std::shared_ptr<mediacache::recovery::ResourceRecovery> recovery;
  mediacache::recovery::RecoveryDirectories directories;
};

}
