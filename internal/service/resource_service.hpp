#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/cache/cache_manager.hpp"
#include "internal/recovery/resource_recovery.hpp"
#include "service_context.hpp"
#include "transform_engine.hpp"

namespace mediacache::service {

struct CachedRequest {
  std::vector<std::string> input_ids;
  std::string              operation;
  model::ParameterSet      parameters;
  cache::ArtifactKind      kind = cache::ArtifactKind::kGenerated;

  // Appended to the ID to name a new output file, e.g. ".wav".
  std::string extension;
};

struct CachedRun {
  std::string id;
  std::string path;
  bool        computed = false;
  std::string log;
};

/*
  ResourceService

  Host-facing entry point. Callers plan with LookupOrPlan, run their
  transformation unlocked, then Commit or Abandon.
*/
class ResourceService {
 public:
  explicit ResourceService(ServiceContext ctx);

  cache::CacheOutcome LookupOrPlan(const std::vector<std::string>& input_ids, const std::string& operation,
                                   const model::ParameterSet& parameters,
                                   cache::ArtifactKind kind = cache::ArtifactKind::kGenerated);

  std::string Commit(const std::string& output_id, const std::filesystem::path& path);
  bool        Abandon(const std::string& output_id);

  // Throws util::NotFound.
  std::string Resolve(const std::string& id) const;

  // Like Resolve, but throws util::IntegrityViolation when the file is gone.
  std::string ResolveExisting(const std::string& id) const;

  // Marks everything derived from the source at `source_path` stale.
  // Throws util::NotFound when the source is not registered.
  cache::SourceDivergence InvalidateSinceChange(const std::filesystem::path& source_path);

  std::vector<cache::SourceDivergence> CheckSourceChanges();

  recovery::RebuildReport   Rebuild();
  recovery::IntegrityReport CheckIntegrity() const;

  std::vector<std::string> CleanupExpired(std::chrono::hours max_age);

  void Save();

  // Lookup, run the engine on a miss, commit. The plan is abandoned and the
  // partial output removed when the engine fails or throws.
  CachedRun RunCached(TransformEngine& engine, const CachedRequest& request);

  const recovery::RecoveryDirectories& Directories() const {
    return ctx_.directories;
  }

 private:
  std::filesystem::path OutputPathFor(const std::string& id, const CachedRequest& request) const;
  void                  Discard(const std::string& id, const std::filesystem::path& output_path);

  ServiceContext ctx_;
};

} // namespace mediacache::service
