#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "internal/model/file_record.hpp"

namespace mediacache::registry {
class ResourceRegistry;
}

namespace mediacache::recovery {

struct RecoveryDirectories {
  std::filesystem::path source_dir;
  std::filesystem::path generated_dir;
  std::filesystem::path metadata_dir;

  // Lowercase, with leading dot. Empty accepts every source file.
  std::vector<std::string> allowed_extensions;
};

struct OrphanedFile {
  std::string path;
  std::string reason;
};

struct RebuildReport {
  std::vector<std::string> registered_sources;
  std::vector<std::string> registered_generated;
  std::vector<std::string> registered_metadata;

  // Files that were already in the registry and left untouched.
  std::size_t already_registered = 0;

  // Files that match no naming convention or whose provenance could not be restored.
  std::vector<OrphanedFile> orphaned;

  std::size_t Registered() const {
    return registered_sources.size() + registered_generated.size() + registered_metadata.size();
  }
};

struct IntegrityReport {
  std::map<model::FileCategory, std::vector<std::string>> missing;

  const std::vector<std::string>& Missing(model::FileCategory category) const;
  std::size_t                     MissingCount() const;
  bool                            Clean() const {
    return MissingCount() == 0;
  }
};

/*
  ResourceRecovery

  Reconciles the registry with the filesystem. ScanAndRebuild is
  best-effort and idempotent: files already in the registry are counted,
  never re-registered. ValidateIntegrity only reports.
*/
class ResourceRecovery {
 public:
  explicit ResourceRecovery(registry::ResourceRegistry& registry);

  RebuildReport   ScanAndRebuild(const RecoveryDirectories& directories);
  IntegrityReport ValidateIntegrity() const;

  // Removes generated/metadata entries listed as missing. Sources are kept.
  std::vector<std::string> PruneMissing(const IntegrityReport& report);

  // Drops dependency edges that point at unregistered IDs.
  std::size_t RepairDependencies();

 private:
  registry::ResourceRegistry& registry_;
};

} // namespace mediacache::recovery
