#include "internal/service/resource_service.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/cache_manager.hpp"
#include "internal/recovery/resource_recovery.hpp"
#include "internal/registry/resource_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_stat.hpp"

namespace {

namespace fs = std::filesystem;

using mediacache::cache::ArtifactKind;
using mediacache::cache::CacheManager;
using mediacache::cache::MissReason;
using mediacache::cache::SourceDivergence;
using mediacache::model::ParameterSet;
using mediacache::recovery::ResourceRecovery;
using mediacache::registry::ResourceRegistry;
using mediacache::service::CachedRequest;
using mediacache::service::ResourceService;
using mediacache::service::ServiceContext;
using mediacache::service::TransformEngine;
using mediacache::service::TransformInvocation;
using mediacache::service::TransformResult;

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "mediacache_service_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

fs::path WriteFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  out.close();
  return mediacache::util::NormalizePath(path);
}

void AppendFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  out << content;
}

enum class EngineMode {
  kWrite,
  kWriteEmpty,
  kFail,
  kThrow,
};

class FakeEngine : public TransformEngine {
 public:
  explicit FakeEngine(EngineMode mode = EngineMode::kWrite) : mode_(mode) {
  }

  TransformResult Run(const TransformInvocation& invocation) override {
    ++runs;
    last = invocation;

    TransformResult result;
    switch (mode_) {
      case EngineMode::kThrow:
        WriteFile(invocation.output_path, "partial");
        throw std::runtime_error("engine crashed");
      case EngineMode::kFail:
        WriteFile(invocation.output_path, "partial");
        result.log = "codec error";
        return result;
      case EngineMode::kWriteEmpty:
        WriteFile(invocation.output_path, "");
        result.success = true;
        return result;
      case EngineMode::kWrite:
        WriteFile(invocation.output_path, invocation.operation + " of " + std::to_string(invocation.input_paths.size()));
        result.success = true;
        result.log     = "ok";
        return result;
    }
    return result;
  }

  int                 runs = 0;
  TransformInvocation last;

 private:
  EngineMode mode_;
};

struct Harness {
  explicit Harness(const fs::path& root) {
    ctx.registry                       = std::make_shared<ResourceRegistry>(root / "metadata" / "file_registry.json");
    ctx.cache                          = std::make_shared<CacheManager>(*ctx.registry);
    ctx.recovery                       = std::make_shared<ResourceRecovery>(*ctx.registry);
    ctx.directories.source_dir         = mediacache::util::NormalizePath(root / "source");
    ctx.directories.generated_dir      = mediacache::util::NormalizePath(root / "temp");
    ctx.directories.metadata_dir       = mediacache::util::NormalizePath(root / "metadata");
    ctx.directories.allowed_extensions = {".wav", ".mp4"};
    service                            = std::make_unique<ResourceService>(ctx);
  }

  ServiceContext                   ctx;
  std::unique_ptr<ResourceService> service;
};

CachedRequest TrimRequest(const std::string& source) {
  CachedRequest request;
  request.input_ids = {source};
  request.operation = "trim";
  request.parameters.Set("start", 0).Set("end", 30);
  request.extension = ".wav";
  return request;
}

void TestRunCachedComputesOnceThenHits() {
  const auto root = FreshDir("run_cached");
  Harness    h(root);
  const auto clip   = WriteFile(root / "source" / "clip.wav", "audio");
  const auto source = h.ctx.registry->RegisterSource(clip);

  FakeEngine engine;
  const auto first = h.service->RunCached(engine, TrimRequest(source));
  assert(first.computed);
  assert(engine.runs == 1);
  assert(first.log == "ok");
  assert(engine.last.input_paths.size() == 1);
  assert(engine.last.input_paths.front() == clip);
  assert(fs::path(first.path).parent_path() == h.ctx.directories.generated_dir);
  assert(fs::path(first.path).filename().string() == first.id + ".wav");

  const auto second = h.service->RunCached(engine, TrimRequest(source));
  assert(!second.computed);
  assert(second.id == first.id);
  assert(second.path == first.path);
  assert(engine.runs == 1);
}

void TestRunCachedRecomputesAfterSourceChange() {
  const auto root = FreshDir("recompute");
  Harness    h(root);
  const auto clip   = WriteFile(root / "source" / "clip.wav", "audio");
  const auto source = h.ctx.registry->RegisterSource(clip);

  FakeEngine engine;
  const auto first = h.service->RunCached(engine, TrimRequest(source));

  AppendFile(clip, "-remastered");
  const auto divergence = h.service->InvalidateSinceChange(clip);
  assert(divergence.kind == SourceDivergence::Kind::kModified);
  assert(divergence.invalidated.count(first.id) == 1);

  const auto miss = h.service->LookupOrPlan({source}, "trim", TrimRequest(source).parameters);
  assert(!miss.IsHit());
  assert(miss.reason == MissReason::kStale);
  assert(h.service->Abandon(miss.id));

  const auto again = h.service->RunCached(engine, TrimRequest(source));
  assert(again.computed);
  assert(again.id == first.id);
  assert(again.path == first.path);
  assert(engine.runs == 2);
  assert(!h.ctx.registry->IsStale(first.id));
}

void TestFailedRunsLeaveNoTrace() {
  const auto root   = FreshDir("failures");
  Harness    h(root);
  const auto source = h.ctx.registry->RegisterSource(WriteFile(root / "source" / "clip.wav", "audio"));

  for (auto mode : {EngineMode::kFail, EngineMode::kThrow, EngineMode::kWriteEmpty}) {
    FakeEngine engine(mode);
    bool       threw = false;
    try {
      (void)h.service->RunCached(engine, TrimRequest(source));
    } catch (const mediacache::util::IntegrityViolation&) {
      threw = mode == EngineMode::kWriteEmpty;
    } catch (const std::runtime_error&) {
      threw = mode != EngineMode::kWriteEmpty;
    }
    assert(threw && "Each failure mode must surface its own error.");
    assert(engine.runs == 1);
    assert(!fs::exists(engine.last.output_path));
    assert(h.ctx.cache->PendingCount() == 0);
    assert(h.ctx.registry->ListGenerated().empty());
  }
}

void TestMetadataRunsLandInMetadataDir() {
  const auto root   = FreshDir("metadata_run");
  Harness    h(root);
  const auto source = h.ctx.registry->RegisterSource(WriteFile(root / "source" / "clip.wav", "audio"));

  CachedRequest request;
  request.input_ids = {source};
  request.operation = "analyze";
  request.kind      = ArtifactKind::kMetadata;

  FakeEngine engine;
  const auto run = h.service->RunCached(engine, request);
  assert(fs::path(run.path).parent_path() == h.ctx.directories.metadata_dir);
  assert(fs::path(run.path).extension() == ".json");
  assert(h.ctx.registry->ListMetadata().size() == 1);
}

void TestResolveExistingAndInvalidateUnknownSource() {
  const auto root   = FreshDir("resolve");
  Harness    h(root);
  const auto clip   = WriteFile(root / "source" / "clip.wav", "audio");
  const auto source = h.ctx.registry->RegisterSource(clip);

  assert(h.service->ResolveExisting(source) == clip.string());

  fs::remove(clip);
  bool threw = false;
  try {
    (void)h.service->ResolveExisting(source);
  } catch (const mediacache::util::IntegrityViolation&) {
    threw = true;
  }
  assert(threw && "ResolveExisting must notice a deleted file.");
  assert(h.service->Resolve(source) == clip.string());

  threw = false;
  try {
    (void)h.service->InvalidateSinceChange(root / "source" / "never_registered.wav");
  } catch (const mediacache::util::NotFound&) {
    threw = true;
  }
  assert(threw && "Unknown sources cannot be invalidated.");

  const auto report = h.service->CheckIntegrity();
  assert(report.MissingCount() == 1);
}

void TestRebuildAndSaveRoundTrip() {
  const auto root = FreshDir("rebuild_save");
  {
    Harness    h(root);
    const auto source = h.ctx.registry->RegisterSource(WriteFile(root / "source" / "clip.wav", "audio"));
    FakeEngine engine;
    (void)h.service->RunCached(engine, TrimRequest(source));
  }

  // Nothing was saved: a fresh service rebuilds from the directories.
  Harness h(root);
  h.ctx.registry->Load();
  assert(h.ctx.registry->ListSources().empty());

  const auto report = h.service->Rebuild();
  assert(report.registered_sources.size() == 1);
  assert(report.registered_generated.size() == 1);
  h.service->Save();

  Harness reloaded(root);
  reloaded.ctx.registry->Load();
  assert(reloaded.ctx.registry->ListGenerated().size() == 1);
  assert(reloaded.service->CheckIntegrity().Clean());
}

} // namespace

int main() {
  TestRunCachedComputesOnceThenHits();
  TestRunCachedRecomputesAfterSourceChange();
  TestFailedRunsLeaveNoTrace();
  TestMetadataRunsLandInMetadataDir();
  TestResolveExistingAndInvalidateUnknownSource();
  TestRebuildAndSaveRoundTrip();

  std::cout << "mediacache_unit_resource_service: pass\n";
  return 0;
}
