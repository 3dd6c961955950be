#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace mediacache::factory {

recovery::RecoveryDirectories DirectoriesFromConfig(const mediacache::runtime::config::RuntimeConfig& config) {
  const auto& dirs = config.directories();

  recovery::RecoveryDirectories directories;
  directories.source_dir    = dirs.source_dir();
  directories.generated_dir = dirs.generated_dir();
  directories.metadata_dir  = dirs.metadata_dir();
  directories.allowed_extensions.assign(dirs.allowed_extensions().begin(), dirs.allowed_extensions().end());
  return directories;
}

RuntimeDependencies BuildRuntime(const mediacache::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Registry
  // ------------------------------------------------------------------
  deps.registry = std::make_shared<registry::ResourceRegistry>(config.registry().path(), config.registry().auto_save());
  deps.registry->Load();

  // ------------------------------------------------------------------
  // Cache and recovery
  // ------------------------------------------------------------------
  cache::CacheManagerOptions cache_options;
  cache_options.write_provenance_sidecars = config.cache().write_provenance_sidecars();

  deps.cache_manager = std::make_shared<cache::CacheManager>(*deps.registry, cache_options);
  deps.recovery      = std::make_shared<recovery::ResourceRecovery>(*deps.registry);

  // ------------------------------------------------------------------
  // Service
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry    = deps.registry;
  ctx.cache       = deps.cache_manager;
  ctx.recovery    = deps.recovery;
  ctx.directories = DirectoriesFromConfig(config);

  deps.service = std::make_shared<service::ResourceService>(std::move(ctx));

  MEDIACACHE_LOG_INFO("Runtime ready", {observability::StringField("registry", config.registry().path()),
                                        observability::StringField("generated_dir", config.directories().generated_dir())});
  return deps;
}

} // namespace mediacache::factory
