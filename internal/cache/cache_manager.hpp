#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/parameter_set.hpp"
#include "internal/util/file_stat.hpp"

namespace mediacache::registry {
class ResourceRegistry;
}

namespace mediacache::cache {

enum class ArtifactKind {
  kGenerated,
  kMetadata,
};

enum class MissReason {
  kNone,
  kNotRegistered,
  kBackingFileMissing,
  kStale,
};

const char* MissReasonName(MissReason reason);

/*
  Result of a cache lookup. A miss is a planning signal, not an error: `id`
  is the identifier the caller must commit under once the transformation
  has produced its file.
*/
struct CacheOutcome {
  enum class Kind {
    kHit,
    kMiss,
  };

  Kind        kind = Kind::kMiss;
  std::string id;
  std::string path;
  MissReason  reason = MissReason::kNone;

  bool IsHit() const {
    return kind == Kind::kHit;
  }

  static CacheOutcome Hit(std::string id, std::string path);
  static CacheOutcome Miss(std::string id, MissReason reason);
};

struct PlannedOperation {
  std::string              id;
  std::vector<std::string> input_ids;
  std::string              operation;
  model::ParameterSet      parameters;
  ArtifactKind             kind = ArtifactKind::kGenerated;
  int64_t                  planned_at_ms = 0;
};

struct SourceDivergence {
  enum class Kind {
    kModified,
    kMissing,
  };

  std::string                   source_id;
  Kind                          kind = Kind::kModified;
  util::FileStat                recorded;
  std::optional<util::FileStat> current;

  // Downstream artifacts marked stale because of this divergence.
  std::set<std::string> invalidated;
};

struct CacheManagerOptions {
  bool write_provenance_sidecars = true;
};

/*
  CacheManager

  Memoization layer over the registry: plans misses, commits results and
  turns source changes into downstream staleness. Holds the registry by
  reference; the registry must outlive it.
*/
class CacheManager {
 public:
  explicit CacheManager(registry::ResourceRegistry& registry, CacheManagerOptions options = {});

  CacheOutcome GetOrPlan(const std::vector<std::string>& input_ids, const std::string& operation,
                         const model::ParameterSet& parameters, ArtifactKind kind = ArtifactKind::kGenerated);

  // Registers the file produced for a planned miss. Without a pending plan it
  // returns `output_id` when that ID is already registered at `path`, and
  // throws util::NotFound otherwise. Throws util::IntegrityViolation when the
  // file is missing or empty (the plan stays pending) and util::Conflict when
  // the ID is bound elsewhere (the plan is dropped).
  std::string Commit(const std::string& output_id, const std::filesystem::path& path);

  // Drops a pending plan; the registry is untouched.
  bool Abandon(const std::string& output_id);

  std::optional<PlannedOperation> PendingPlan(const std::string& output_id) const;
  std::size_t                     PendingCount() const;

  // Compares every source's on-disk size/mtime with the recorded one.
  std::vector<SourceDivergence> CheckSourceChanges();

  // Same check for a single source. `force` invalidates dependents even if
  // the signature looks unchanged.
  std::optional<SourceDivergence> CheckSource(const std::string& source_id, bool force = false);

  bool IsStale(const std::string& id) const;

  // Deletes generated artifacts older than `max_age` that nothing depends on.
  std::vector<std::string> CleanupExpired(std::chrono::hours max_age);

 private:
  void WriteSidecar(const PlannedOperation& plan, const std::filesystem::path& path) const;

  registry::ResourceRegistry& registry_;
  CacheManagerOptions         options_;

  mutable std::mutex                                plans_mutex_;
  std::unordered_map<std::string, PlannedOperation> pending_;
};

} // namespace mediacache::cache
