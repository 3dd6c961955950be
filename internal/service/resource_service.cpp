#include "resource_service.hpp"

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/identity/identifier_deriver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/resource_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_stat.hpp"

namespace mediacache::service {

using observability::IntField;
using observability::PathField;
using observability::StringField;

namespace {

template <typename Fn>
auto ObserveCall(std::string_view route, std::string_view id, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    MEDIACACHE_LOG_ERROR("Service call failed", {StringField("route", route), StringField("id", id), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

ResourceService::ResourceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.registry || !ctx_.cache || !ctx_.recovery) {
    throw std::invalid_argument("ResourceService: registry, cache and recovery are required");
  }
}

cache::CacheOutcome ResourceService::LookupOrPlan(const std::vector<std::string>& input_ids, const std::string& operation,
                                                  const model::ParameterSet& parameters, cache::ArtifactKind kind) {
  return ObserveCall("LookupOrPlan", operation, [&] { return ctx_.cache->GetOrPlan(input_ids, operation, parameters, kind); });
}

std::string ResourceService::Commit(const std::string& output_id, const std::filesystem::path& path) {
  return ObserveCall("Commit", output_id, [&] { return ctx_.cache->Commit(output_id, path); });
}

bool ResourceService::Abandon(const std::string& output_id) {
  return ctx_.cache->Abandon(output_id);
}

std::string ResourceService::Resolve(const std::string& id) const {
  return ctx_.registry->Resolve(id);
}

std::string ResourceService::ResolveExisting(const std::string& id) const {
  auto path = ctx_.registry->Resolve(id);
  if (!util::IsRegularFile(path)) {
    throw util::IntegrityViolation("file for " + id + " is missing: " + path);
  }
  return path;
}

cache::SourceDivergence ResourceService::InvalidateSinceChange(const std::filesystem::path& source_path) {
  const auto id = identity::SourceId(source_path.filename().string());
  return ObserveCall("InvalidateSinceChange", id, [&] {
    // Always reports for a forced check.
    auto divergence = ctx_.cache->CheckSource(id, true);
    if (!divergence) {
      throw std::logic_error("forced source check returned no result for " + id);
    }
    return std::move(*divergence);
  });
}

std::vector<cache::SourceDivergence> ResourceService::CheckSourceChanges() {
  return ctx_.cache->CheckSourceChanges();
}

recovery::RebuildReport ResourceService::Rebuild() {
  return ObserveCall("Rebuild", "", [&] { return ctx_.recovery->ScanAndRebuild(ctx_.directories); });
}

recovery::IntegrityReport ResourceService::CheckIntegrity() const {
  return ctx_.recovery->ValidateIntegrity();
}

std::vector<std::string> ResourceService::CleanupExpired(std::chrono::hours max_age) {
  return ctx_.cache->CleanupExpired(max_age);
}

void ResourceService::Save() {
  ObserveCall("Save", "", [&] { ctx_.registry->Save(); });
}

// ------------------------------------------------------------
// Lookup -> run -> commit
// ------------------------------------------------------------

std::filesystem::path ResourceService::OutputPathFor(const std::string& id, const CachedRequest& request) const {
  // A known entry keeps its path; recomputing elsewhere would conflict.
  if (auto record = ctx_.registry->Find(id)) {
    return record->path;
  }

  std::string extension = request.extension;
  if (extension.empty() && request.kind == cache::ArtifactKind::kMetadata) {
    extension = ".json";
  }
  const auto& dir = request.kind == cache::ArtifactKind::kMetadata ? ctx_.directories.metadata_dir : ctx_.directories.generated_dir;
  return dir / (id + extension);
}

void ResourceService::Discard(const std::string& id, const std::filesystem::path& output_path) {
  ctx_.cache->Abandon(id);

  std::error_code ec;
  std::filesystem::remove(output_path, ec);
  if (ec) {
    MEDIACACHE_LOG_WARN("Could not remove partial output", {StringField("id", id), PathField("path", output_path),
                                                            StringField("error", ec.message())});
  }
}

CachedRun ResourceService::RunCached(TransformEngine& engine, const CachedRequest& request) {
  const auto outcome = LookupOrPlan(request.input_ids, request.operation, request.parameters, request.kind);

  CachedRun run;
  run.id = outcome.id;
  if (outcome.IsHit()) {
    run.path = outcome.path;
    return run;
  }

  TransformInvocation invocation;
  invocation.operation  = request.operation;
  invocation.parameters = request.parameters;
  try {
    for (const auto& input : request.input_ids) {
      invocation.input_paths.emplace_back(ctx_.registry->Resolve(input));
    }
    invocation.output_path = OutputPathFor(outcome.id, request);
    std::filesystem::create_directories(invocation.output_path.parent_path());
  } catch (const std::exception&) {
    ctx_.cache->Abandon(outcome.id);
    throw;
  }

  MEDIACACHE_LOG_INFO("Running transformation", {StringField("id", outcome.id), StringField("operation", request.operation),
                                                 StringField("reason", cache::MissReasonName(outcome.reason))});

  const auto      started_at = std::chrono::steady_clock::now();
  TransformResult result;
  try {
    result = engine.Run(invocation);
  } catch (...) {
    Discard(outcome.id, invocation.output_path);
    throw;
  }

  if (!result.success) {
    Discard(outcome.id, invocation.output_path);
    throw std::runtime_error("transformation " + request.operation + " failed for " + outcome.id + ": " + result.log);
  }

  try {
    Commit(outcome.id, invocation.output_path);
  } catch (const util::IntegrityViolation&) {
    Discard(outcome.id, invocation.output_path);
    throw;
  } catch (const std::exception&) {
    // The output may belong to another entry; keep the file, drop the plan.
    ctx_.cache->Abandon(outcome.id);
    throw;
  }

  run.path     = ctx_.registry->Resolve(outcome.id);
  run.computed = true;
  run.log      = std::move(result.log);
  MEDIACACHE_LOG_INFO("Transformation committed",
                      {StringField("id", outcome.id),
                       IntField("elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count())});
  return run;
}

} // namespace mediacache::service
