#include "internal/recovery/resource_recovery.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/cache/cache_manager.hpp"
#include "internal/identity/identifier_deriver.hpp"
#include "internal/registry/resource_registry.hpp"
#include "internal/util/file_stat.hpp"

namespace {

namespace fs = std::filesystem;

using mediacache::cache::ArtifactKind;
using mediacache::cache::CacheManager;
using mediacache::model::FileCategory;
using mediacache::model::ParameterSet;
using mediacache::recovery::RecoveryDirectories;
using mediacache::recovery::ResourceRecovery;
using mediacache::registry::ResourceRegistry;

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "mediacache_recovery_tests" / test_name;
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

RecoveryDirectories Directories(const fs::path& root) {
  RecoveryDirectories dirs;
  dirs.source_dir         = mediacache::util::NormalizePath(root / "source");
  dirs.generated_dir      = mediacache::util::NormalizePath(root / "temp");
  dirs.metadata_dir       = mediacache::util::NormalizePath(root / "metadata");
  dirs.allowed_extensions = {".mp4", ".wav", ".flac"};
  fs::create_directories(dirs.source_dir);
  fs::create_directories(dirs.generated_dir);
  fs::create_directories(dirs.metadata_dir);
  return dirs;
}

ParameterSet TrimParams() {
  ParameterSet params;
  params.Set("start", 0).Set("end", 30);
  return params;
}

struct Workspace {
  RecoveryDirectories dirs;
  fs::path            document;
  std::string         source;
  std::string         trim;
  std::string         analysis;
};

// Populates the three directories through the normal commit path, plus a
// convention-named metadata file and two files that match nothing.
Workspace Populate(const fs::path& root) {
  Workspace ws;
  ws.dirs     = Directories(root);
  ws.document = ws.dirs.metadata_dir / "file_registry.json";

  ResourceRegistry registry(ws.document);
  CacheManager     cache(registry);

  ws.source = registry.RegisterSource(WriteFile(ws.dirs.source_dir / "clip.mp4", "video"));

  const auto trim = cache.GetOrPlan({ws.source}, "trim", TrimParams());
  ws.trim         = cache.Commit(trim.id, WriteFile(ws.dirs.generated_dir / (trim.id + ".mp4"), "trimmed"));

  const auto analysis = cache.GetOrPlan({ws.trim}, "analyze", {}, ArtifactKind::kMetadata);
  ws.analysis = cache.Commit(analysis.id, WriteFile(ws.dirs.metadata_dir / (analysis.id + ".json"), "{\"bpm\":120}"));
  registry.Save();

  WriteFile(ws.dirs.metadata_dir / "src_clip_mp4_waveform.json", "{\"peaks\":[]}");
  WriteFile(ws.dirs.source_dir / "notes.txt", "not media");
  WriteFile(ws.dirs.generated_dir / "random.bin", "junk");
  return ws;
}

void TestRebuildAfterTotalRegistryLoss() {
  const auto ws = Populate(FreshDir("total_loss"));
  fs::remove(ws.document);

  ResourceRegistry registry(ws.document);
  registry.Load();
  assert(registry.ListSources().empty());

  ResourceRecovery recovery(registry);
  const auto       report = recovery.ScanAndRebuild(ws.dirs);

  assert(report.registered_sources.size() == 1);
  assert(report.registered_generated.size() == 1);
  assert(report.registered_metadata.size() == 2);
  assert(report.orphaned.size() == 2);
  assert(report.already_registered == 0);

  assert(registry.Contains(ws.source));
  assert(registry.Contains(ws.trim));
  assert(registry.Contains(ws.analysis));
  assert((registry.DependenciesOf(ws.analysis) == std::vector<std::string>{ws.trim}));
  assert(registry.DependentsOf(ws.source).size() == 3);

  const auto waveform = mediacache::identity::DerivedId({ws.source}, "waveform", {});
  assert(registry.Contains(waveform));
  assert(registry.Find(waveform)->category == FileCategory::kMetadata);

  // Provenance restored: the same lookup hits again.
  assert(registry.CheckCache({ws.source}, "trim", TrimParams()).has_value());
}

void TestRebuildIsIdempotent() {
  const auto ws = Populate(FreshDir("idempotent"));

  ResourceRegistry registry(ws.document);
  registry.Load();

  ResourceRecovery recovery(registry);
  const auto       first = recovery.ScanAndRebuild(ws.dirs);
  assert(first.registered_sources.empty());
  assert(first.registered_generated.empty());
  assert(first.registered_metadata.size() == 1);
  assert(first.already_registered == 3);

  const auto operations = registry.Operations().size();
  const auto second     = recovery.ScanAndRebuild(ws.dirs);
  assert(second.Registered() == 0);
  assert(second.already_registered == 4);
  assert(second.orphaned.size() == first.orphaned.size());
  assert(registry.Operations().size() == operations);
}

void TestRebuildUsesOperationLogWithoutSidecar() {
  const auto dir  = FreshDir("operation_log");
  const auto dirs = Directories(dir);

  ResourceRegistry registry(dirs.metadata_dir / "file_registry.json");
  CacheManager     cache(registry, {/*write_provenance_sidecars=*/false});

  const auto source = registry.RegisterSource(WriteFile(dirs.source_dir / "clip.wav", "audio"));
  const auto trim   = cache.GetOrPlan({source}, "trim", TrimParams());
  (void)cache.Commit(trim.id, WriteFile(dirs.generated_dir / (trim.id + ".wav"), "trimmed"));

  // Entry gone, operation log kept.
  assert(registry.RemoveArtifact(trim.id));

  ResourceRecovery recovery(registry);
  const auto       report = recovery.ScanAndRebuild(dirs);
  assert(report.registered_generated.size() == 1);
  assert(report.registered_generated.front() == trim.id);
  assert(report.orphaned.empty());
}

void TestDerivedNameWithoutProvenanceIsOrphaned() {
  const auto dir  = FreshDir("no_provenance");
  const auto dirs = Directories(dir);
  WriteFile(dirs.generated_dir / "trim_0123456789abcdef.mp4", "bytes");
  WriteFile(dirs.metadata_dir / "src_unknown_wav_analysis.json", "{}");
  WriteFile(dirs.metadata_dir / "cover.png", "png");

  ResourceRegistry registry(dirs.metadata_dir / "file_registry.json");
  ResourceRecovery recovery(registry);
  const auto       report = recovery.ScanAndRebuild(dirs);

  assert(report.Registered() == 0);
  assert(report.orphaned.size() == 3);
  assert(registry.ListGenerated().empty());
  assert(registry.ListMetadata().empty());
}

void TestRebuildSkipsMissingDirectories() {
  const auto          dir = FreshDir("missing_dirs");
  RecoveryDirectories dirs;
  dirs.source_dir    = dir / "nope" / "source";
  dirs.generated_dir = dir / "nope" / "temp";

  ResourceRegistry registry(dir / "file_registry.json");
  ResourceRecovery recovery(registry);
  const auto       report = recovery.ScanAndRebuild(dirs);
  assert(report.Registered() == 0);
  assert(report.orphaned.empty());
}

void TestIntegrityReportAndPrune() {
  const auto ws = Populate(FreshDir("integrity"));

  ResourceRegistry registry(ws.document);
  registry.Load();
  ResourceRecovery recovery(registry);

  assert(recovery.ValidateIntegrity().Clean());

  fs::remove(registry.Resolve(ws.trim));
  fs::remove(registry.Resolve(ws.source));

  const auto report = recovery.ValidateIntegrity();
  assert(!report.Clean());
  assert(report.MissingCount() == 2);
  assert((report.Missing(FileCategory::kGenerated) == std::vector<std::string>{ws.trim}));
  assert((report.Missing(FileCategory::kSource) == std::vector<std::string>{ws.source}));
  assert(report.Missing(FileCategory::kMetadata).empty());

  // Reporting alone changes nothing.
  assert(registry.Contains(ws.trim));

  const auto pruned = recovery.PruneMissing(report);
  assert((pruned == std::vector<std::string>{ws.trim}));
  assert(!registry.Contains(ws.trim));
  assert(registry.Contains(ws.source));
}

void TestRepairDependenciesDropsDanglingEdges() {
  const auto dir  = FreshDir("repair");
  const auto clip = WriteFile(dir / "clip.wav", "audio");
  const auto trim = WriteFile(dir / "trim.wav", "trimmed");

  const auto document = WriteFile(dir / "file_registry.json", R"({"version": "2.0",
  "source_files": {
    "src_clip_wav": {"path": ")" + clip.string() + R"(", "size": 5, "created_at": 1, "modified_at": 1}
  },
  "generated_files": {
    "trim_0123456789abcdef": {"path": ")" + trim.string() + R"(", "size": 7, "created_at": 1, "modified_at": 1,
                              "operation": "trim", "input_ids": ["src_clip_wav"], "parameters": {}}
  },
  "operations": [],
  "dependencies": {"trim_0123456789abcdef": ["src_clip_wav", "src_ghost_wav"]}
})");

  ResourceRegistry registry(document);
  registry.Load();
  assert(registry.DependenciesOf("trim_0123456789abcdef").size() == 2);

  ResourceRecovery recovery(registry);
  assert(recovery.RepairDependencies() == 1);
  assert((registry.DependenciesOf("trim_0123456789abcdef") == std::vector<std::string>{"src_clip_wav"}));
  assert(recovery.RepairDependencies() == 0);
}

} // namespace

int main() {
  TestRebuildAfterTotalRegistryLoss();
  TestRebuildIsIdempotent();
  TestRebuildUsesOperationLogWithoutSidecar();
  TestDerivedNameWithoutProvenanceIsOrphaned();
  TestRebuildSkipsMissingDirectories();
  TestIntegrityReportAndPrune();
  TestRepairDependenciesDropsDanglingEdges();

  std::cout << "mediacache_unit_resource_recovery: pass\n";
  return 0;
}
