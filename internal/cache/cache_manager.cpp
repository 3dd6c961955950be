#include "internal/cache/cache_manager.hpp"

#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/registry/registry_codec.hpp"
#include "internal/registry/resource_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_stat.hpp"
#include "internal/util/time.hpp"

namespace mediacache::cache {

using observability::IntField;
using observability::PathField;
using observability::StringField;
using registry::CacheState;

namespace {

MissReason ToMissReason(CacheState state) {
  switch (state) {
    case CacheState::kBackingFileMissing:
      return MissReason::kBackingFileMissing;
    case CacheState::kStale:
      return MissReason::kStale;
    case CacheState::kNotRegistered:
    default:
      return MissReason::kNotRegistered;
  }
}

} // namespace

const char* MissReasonName(MissReason reason) {
  switch (reason) {
    case MissReason::kNone:
      return "none";
    case MissReason::kNotRegistered:
      return "not_registered";
    case MissReason::kBackingFileMissing:
      return "backing_file_missing";
    case MissReason::kStale:
      return "stale";
  }
  return "unknown";
}

CacheOutcome CacheOutcome::Hit(std::string id, std::string path) {
  CacheOutcome outcome;
  outcome.kind = Kind::kHit;
  outcome.id   = std::move(id);
  outcome.path = std::move(path);
  return outcome;
}

CacheOutcome CacheOutcome::Miss(std::string id, MissReason reason) {
  CacheOutcome outcome;
  outcome.kind   = Kind::kMiss;
  outcome.id     = std::move(id);
  outcome.reason = reason;
  return outcome;
}

CacheManager::CacheManager(registry::ResourceRegistry& registry, CacheManagerOptions options)
    : registry_(registry), options_(options) {
}

// ------------------------------------------------------------
// Lookup / plan
// ------------------------------------------------------------

CacheOutcome CacheManager::GetOrPlan(const std::vector<std::string>& input_ids, const std::string& operation,
                                     const model::ParameterSet& parameters, ArtifactKind kind) {
  const auto probe = registry_.Probe(input_ids, operation, parameters);
  if (probe.state == CacheState::kValid) {
    MEDIACACHE_LOG_DEBUG("Cache hit", {StringField("id", probe.id), PathField("path", probe.path)});
    return CacheOutcome::Hit(probe.id, probe.path);
  }

  PlannedOperation plan;
  plan.id            = probe.id;
  plan.input_ids     = input_ids;
  plan.operation     = model::TrimKey(operation);
  plan.parameters    = parameters;
  plan.kind          = kind;
  plan.planned_at_ms = util::ToUnixMillis(util::Now());

  {
    std::lock_guard<std::mutex> lock(plans_mutex_);
    pending_[plan.id] = std::move(plan);
  }

  return CacheOutcome::Miss(probe.id, ToMissReason(probe.state));
}

std::string CacheManager::Commit(const std::string& output_id, const std::filesystem::path& path) {
  PlannedOperation plan;
  bool             planned = false;
  {
    std::lock_guard<std::mutex> lock(plans_mutex_);
    auto                        it = pending_.find(output_id);
    if (it != pending_.end()) {
      plan    = it->second;
      planned = true;
    }
  }
  if (!planned) {
    // A repeated commit of an already registered artifact is a no-op.
    const auto existing = registry_.Find(output_id);
    if (existing && existing->IsDerived() && existing->path == util::NormalizePath(path).string()) {
      return output_id;
    }
    throw util::NotFound("no pending operation for " + output_id);
  }

  const auto stat = util::StatFile(path);
  if (!stat) {
    throw util::IntegrityViolation("transformation produced no file at " + path.string());
  }
  if (stat->size_bytes == 0) {
    throw util::IntegrityViolation("transformation produced an empty file at " + path.string());
  }

  std::string id;
  try {
    id = plan.kind == ArtifactKind::kMetadata ? registry_.RegisterMetadata(plan.input_ids, plan.operation, plan.parameters, path)
                                              : registry_.RegisterGenerated(plan.input_ids, plan.operation, plan.parameters, path);
  } catch (const util::Conflict&) {
    Abandon(output_id);
    throw;
  }
  if (id != output_id) {
    Abandon(output_id);
    throw util::Conflict("registered id " + id + " differs from planned id " + output_id);
  }

  {
    std::lock_guard<std::mutex> lock(plans_mutex_);
    pending_.erase(output_id);
  }

  if (options_.write_provenance_sidecars) {
    WriteSidecar(plan, path);
  }
  return id;
}

bool CacheManager::Abandon(const std::string& output_id) {
  std::lock_guard<std::mutex> lock(plans_mutex_);
  return pending_.erase(output_id) > 0;
}

std::optional<PlannedOperation> CacheManager::PendingPlan(const std::string& output_id) const {
  std::lock_guard<std::mutex> lock(plans_mutex_);
  auto                        it = pending_.find(output_id);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t CacheManager::PendingCount() const {
  std::lock_guard<std::mutex> lock(plans_mutex_);
  return pending_.size();
}

void CacheManager::WriteSidecar(const PlannedOperation& plan, const std::filesystem::path& path) const {
  registry::Provenance provenance;
  provenance.id         = plan.id;
  provenance.operation  = plan.operation;
  provenance.input_ids  = plan.input_ids;
  provenance.parameters = plan.parameters;
  try {
    registry::WriteProvenance(path, provenance);
  } catch (const std::runtime_error& e) {
    // Only a rebuild after registry loss needs the sidecar.
    MEDIACACHE_LOG_WARN("Provenance sidecar not written", {StringField("id", plan.id), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

std::optional<SourceDivergence> CacheManager::CheckSource(const std::string& source_id, bool force) {
  const auto record = registry_.Find(source_id);
  if (!record || record->IsDerived()) {
    throw util::NotFound("unknown source id: " + source_id);
  }

  SourceDivergence divergence;
  divergence.source_id = source_id;
  divergence.recorded  = util::FileStat{record->size_bytes, record->modified_at_ms};
  divergence.current   = util::StatFile(record->path);

  if (!divergence.current) {
    divergence.kind = SourceDivergence::Kind::kMissing;
    for (const auto& id : registry_.DependentsOf(source_id)) {
      const auto dependent = registry_.Find(id);
      if (dependent && !dependent->stale) {
        divergence.invalidated.insert(id);
      }
    }
    registry_.MarkStale(divergence.invalidated);
    MEDIACACHE_LOG_WARN("Source file missing; downstream artifacts marked stale",
                        {StringField("id", source_id), PathField("path", record->path),
                         IntField("invalidated", static_cast<int64_t>(divergence.invalidated.size()))});
    return divergence;
  }

  if (*divergence.current == divergence.recorded && !force) {
    return std::nullopt;
  }

  divergence.kind        = SourceDivergence::Kind::kModified;
  divergence.invalidated = registry_.UpdateSourceSignature(source_id, *divergence.current, force);
  MEDIACACHE_LOG_INFO("Source changed; downstream artifacts marked stale",
                      {StringField("id", source_id), IntField("invalidated", static_cast<int64_t>(divergence.invalidated.size()))});
  return divergence;
}

std::vector<SourceDivergence> CacheManager::CheckSourceChanges() {
  std::vector<SourceDivergence> divergences;
  for (const auto& source : registry_.ListSources()) {
    if (auto divergence = CheckSource(source.id)) {
      divergences.push_back(std::move(*divergence));
    }
  }
  return divergences;
}

bool CacheManager::IsStale(const std::string& id) const {
  return registry_.IsStale(id);
}

// ------------------------------------------------------------
// Cleanup
// ------------------------------------------------------------

std::vector<std::string> CacheManager::CleanupExpired(std::chrono::hours max_age) {
  const auto cutoff_ms = util::ToUnixMillis(util::Now() - max_age);

  std::vector<std::string> removed;
  for (const auto& record : registry_.ListGenerated()) {
    if (record.created_at_ms >= cutoff_ms || !registry_.DependentsOf(record.id).empty()) {
      continue;
    }

    std::error_code ec;
    std::filesystem::remove(record.path, ec);
    if (ec) {
      MEDIACACHE_LOG_WARN("Could not delete expired artifact", {StringField("id", record.id), StringField("error", ec.message())});
      continue;
    }
    std::filesystem::remove(registry::ProvenanceSidecarPath(record.path), ec);

    if (registry_.RemoveArtifact(record.id)) {
      removed.push_back(record.id);
    }
  }

  if (!removed.empty()) {
    MEDIACACHE_LOG_INFO("Cleaned up expired artifacts", {IntField("count", static_cast<int64_t>(removed.size()))});
  }
  return removed;
}

} // namespace mediacache::cache
