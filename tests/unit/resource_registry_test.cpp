#include "internal/registry/resource_registry.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/file_stat.hpp"

namespace {

namespace fs = std::filesystem;

using mediacache::model::ParameterSet;
using mediacache::registry::CacheState;
using mediacache::registry::ResourceRegistry;

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "mediacache_registry_tests" / test_name;
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

std::string ReadFile(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

ParameterSet TrimParams(int start, int end) {
  ParameterSet params;
  params.Set("start", start).Set("end", end);
  return params;
}

void TestRegisterSourceAndResolve() {
  const auto dir  = FreshDir("register_source");
  const auto clip = WriteFile(dir / "source" / "clip.mp4", "video-bytes");

  ResourceRegistry registry(dir / "registry.json");
  const auto       id = registry.RegisterSource(clip);
  assert(id == "src_clip_mp4");
  assert(registry.Resolve(id) == clip.string());
  assert(registry.IsDirty());

  const auto record = registry.Find(id);
  assert(record.has_value());
  assert(record->size_bytes == 11);
  assert(!record->IsDerived());

  // Same file again is a no-op.
  assert(registry.RegisterSource(clip) == id);
  assert(registry.ListSources().size() == 1);

  bool threw = false;
  try {
    (void)registry.Resolve("src_nope");
  } catch (const mediacache::util::NotFound&) {
    threw = true;
  }
  assert(threw && "Resolve must fail for unknown ids.");
}

void TestRegisterGeneratedValidatesBeforeMutating() {
  const auto dir     = FreshDir("validate");
  const auto clip    = WriteFile(dir / "clip.mp4", "video");
  const auto trimmed = WriteFile(dir / "trimmed.mp4", "trimmed");

  ResourceRegistry registry(dir / "registry.json");
  const auto       source = registry.RegisterSource(clip);

  bool threw = false;
  try {
    (void)registry.RegisterGenerated({"src_unknown"}, "trim", TrimParams(0, 30), trimmed);
  } catch (const mediacache::util::NotFound&) {
    threw = true;
  }
  assert(threw && "Unknown inputs must be rejected.");

  threw = false;
  try {
    (void)registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), dir / "does_not_exist.mp4");
  } catch (const mediacache::util::NotFound&) {
    threw = true;
  }
  assert(threw && "Missing artifact files must be rejected.");

  assert(registry.ListGenerated().empty());
  assert(registry.Operations().empty());
  assert(registry.DependentsOf(source).empty());
}

void TestConflictingPathIsRejected() {
  const auto dir    = FreshDir("conflict");
  const auto clip   = WriteFile(dir / "clip.mp4", "video");
  const auto first  = WriteFile(dir / "first.mp4", "trimmed");
  const auto second = WriteFile(dir / "second.mp4", "trimmed too");

  ResourceRegistry registry(dir / "registry.json");
  const auto       source = registry.RegisterSource(clip);
  const auto       id     = registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), first);

  // Identical registration is idempotent.
  assert(registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), first) == id);
  assert(registry.Operations().size() == 1);

  bool threw = false;
  try {
    (void)registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), second);
  } catch (const mediacache::util::Conflict&) {
    threw = true;
  }
  assert(threw && "A second path for the same id must be a conflict.");
  assert(registry.Resolve(id) == first.string());
}

void TestCheckCacheFollowsTheBackingFile() {
  const auto dir     = FreshDir("check_cache");
  const auto clip    = WriteFile(dir / "clip.mp4", "video");
  const auto trimmed = WriteFile(dir / "trimmed.mp4", "trimmed");

  ResourceRegistry registry(dir / "registry.json");
  const auto       source = registry.RegisterSource(clip);

  assert(!registry.CheckCache({source}, "trim", TrimParams(0, 30)).has_value());
  assert(registry.Probe({source}, "trim", TrimParams(0, 30)).state == CacheState::kNotRegistered);

  const auto id  = registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), trimmed);
  const auto hit = registry.CheckCache({source}, "trim", TrimParams(0, 30));
  assert(hit.has_value() && *hit == id);

  fs::remove(trimmed);
  assert(!registry.CheckCache({source}, "trim", TrimParams(0, 30)).has_value());
  assert(registry.Probe({source}, "trim", TrimParams(0, 30)).state == CacheState::kBackingFileMissing);
}

void TestDependentsAreTransitive() {
  const auto dir      = FreshDir("dependents");
  const auto clip     = WriteFile(dir / "clip.wav", "audio");
  const auto trimmed  = WriteFile(dir / "trimmed.wav", "trimmed");
  const auto analysis = WriteFile(dir / "analysis.json", "{\"bpm\":120}");

  ResourceRegistry registry(dir / "registry.json");
  const auto       source = registry.RegisterSource(clip);
  const auto       trim   = registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), trimmed);
  const auto       meta   = registry.RegisterMetadata({trim}, "analyze", {}, analysis);

  const auto dependents = registry.DependentsOf(source);
  assert(dependents.size() == 2);
  assert(dependents.count(trim) == 1);
  assert(dependents.count(meta) == 1);
  assert(registry.DependentsOf(meta).empty());
  assert((registry.DependenciesOf(meta) == std::vector<std::string>{trim}));
  assert(registry.ListMetadata().size() == 1);
}

void TestSourceChangeMarksDependentsStale() {
  const auto dir      = FreshDir("source_change");
  const auto clip     = WriteFile(dir / "clip.wav", "audio");
  const auto trimmed  = WriteFile(dir / "trimmed.wav", "trimmed");
  const auto analysis = WriteFile(dir / "analysis.json", "{}");

  ResourceRegistry registry(dir / "registry.json");
  const auto       source = registry.RegisterSource(clip);
  const auto       trim   = registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), trimmed);
  const auto       meta   = registry.RegisterMetadata({trim}, "analyze", {}, analysis);

  AppendFile(clip, "-edited");
  assert(registry.RegisterSource(clip) == source);

  assert(registry.IsStale(trim));
  assert(registry.IsStale(meta));
  assert(!registry.CheckCache({source}, "trim", TrimParams(0, 30)).has_value());
  assert(registry.Probe({source}, "trim", TrimParams(0, 30)).state == CacheState::kStale);

  // Recomputing the trim refreshes it; the analysis stays stale until redone.
  AppendFile(trimmed, "-v2");
  assert(registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), trimmed) == trim);
  assert(!registry.IsStale(trim));
  assert(registry.IsStale(meta));
  assert(registry.Operations().size() == 3);
}

void TestSourceRelocationAndConflict() {
  const auto dir   = FreshDir("relocation");
  const auto first = WriteFile(dir / "a" / "clip.mp4", "video");
  const auto other = WriteFile(dir / "b" / "clip.mp4", "video");

  ResourceRegistry registry(dir / "registry.json");
  const auto       id = registry.RegisterSource(first);

  bool threw = false;
  try {
    (void)registry.RegisterSource(other);
  } catch (const mediacache::util::Conflict&) {
    threw = true;
  }
  assert(threw && "A live source must not be rebound.");

  fs::remove(first);
  assert(registry.RegisterSource(other) == id);
  assert(registry.Resolve(id) == other.string());
}

void TestSaveLoadRoundTrip() {
  const auto dir      = FreshDir("round_trip");
  const auto document = dir / "metadata" / "file_registry.json";
  const auto clip     = WriteFile(dir / "clip.wav", "audio");
  const auto trimmed  = WriteFile(dir / "trimmed.wav", "trimmed");

  std::string source;
  std::string trim;
  {
    ResourceRegistry registry(document);
    source = registry.RegisterSource(clip);
    ParameterSet params = TrimParams(0, 30);
    params.Set("fade", 0.25).Set("label", "intro");
    trim = registry.RegisterGenerated({source}, "trim", params, trimmed);
    registry.MarkStale({trim});
    registry.Save();
    assert(!registry.IsDirty());
  }
  assert(fs::exists(document));

  ResourceRegistry loaded(document);
  loaded.Load();
  assert(loaded.LoadWarnings().empty());
  assert(!loaded.IsDirty());

  const auto record = loaded.Find(trim);
  assert(record.has_value());
  assert(record->path == trimmed.string());
  assert(record->operation == "trim");
  assert((record->input_ids == std::vector<std::string>{source}));
  assert(record->parameters.Canonical() == R"({"end":30,"fade":0.25,"label":"intro","start":0})");
  assert(record->stale);
  assert(loaded.Operations().size() == 1);
  assert(loaded.DependentsOf(source).count(trim) == 1);
  assert(loaded.Find(source)->size_bytes == 5);
}

void TestCorruptDocumentLoadsEmpty() {
  const auto dir      = FreshDir("corrupt");
  const auto document = WriteFile(dir / "file_registry.json", "{ this is not json");

  ResourceRegistry registry(document);
  registry.Load();

  assert(registry.ListSources().empty());
  assert(registry.ListGenerated().empty());
  assert(!registry.LoadWarnings().empty());
  assert(!fs::exists(document));
  assert(fs::exists(dir / "file_registry.json.corrupt"));
}

void TestMalformedEntryIsSkipped() {
  const auto dir      = FreshDir("malformed_entry");
  const auto clip     = WriteFile(dir / "clip.wav", "audio");
  const auto document = WriteFile(dir / "file_registry.json",
                                  R"({"version": "2.0",
  "source_files": {
    "src_clip_wav": {"path": ")" + clip.string() + R"(", "size": 5, "created_at": 1700000000000, "modified_at": 1700000000000},
    "src_broken_wav": {"size": 3}
  },
  "generated_files": {"trim_0000000000000000": 7}
})");

  ResourceRegistry registry(document);
  registry.Load();

  assert(registry.Contains("src_clip_wav"));
  assert(!registry.Contains("src_broken_wav"));
  assert(registry.ListGenerated().empty());
  assert(registry.LoadWarnings().size() == 2);
}

void TestUnknownFieldsArePreserved() {
  const auto dir      = FreshDir("unknown_fields");
  const auto clip     = WriteFile(dir / "clip.wav", "audio");
  const auto document = WriteFile(dir / "file_registry.json",
                                  R"({"version": "2.0",
  "owner": "studio-a",
  "source_files": {
    "src_clip_wav": {"path": ")" + clip.string() + R"(", "size": 5, "created_at": 1700000000000,
                     "modified_at": 1700000000000, "tags": ["drums"]}
  },
  "operations": [],
  "dependencies": {}
})");

  ResourceRegistry registry(document);
  registry.Load();
  assert(registry.Contains("src_clip_wav"));
  registry.Save();

  const auto saved = ReadFile(document);
  assert(saved.find("\"owner\"") != std::string::npos);
  assert(saved.find("studio-a") != std::string::npos);
  assert(saved.find("\"tags\"") != std::string::npos);
  assert(saved.find("drums") != std::string::npos);
}

void TestRemoveArtifactKeepsOperationLog() {
  const auto dir     = FreshDir("remove_artifact");
  const auto clip    = WriteFile(dir / "clip.wav", "audio");
  const auto trimmed = WriteFile(dir / "trimmed.wav", "trimmed");

  ResourceRegistry registry(dir / "registry.json");
  const auto       source = registry.RegisterSource(clip);
  const auto       trim   = registry.RegisterGenerated({source}, "trim", TrimParams(0, 30), trimmed);

  assert(registry.RemoveArtifact(trim));
  assert(!registry.RemoveArtifact(trim));
  assert(!registry.RemoveArtifact(source));
  assert(!registry.Contains(trim));
  assert(registry.DependentsOf(source).empty());
  assert(registry.Operations().size() == 1);
  assert(registry.LastOperationFor(trim).has_value());
}

void TestAutoSaveWritesAfterEachMutation() {
  const auto dir      = FreshDir("auto_save");
  const auto document = dir / "file_registry.json";
  const auto clip     = WriteFile(dir / "clip.wav", "audio");

  ResourceRegistry registry(document, /*auto_save=*/true);
  (void)registry.RegisterSource(clip);
  assert(fs::exists(document));
  assert(!registry.IsDirty());

  ResourceRegistry reader(document);
  reader.Load();
  assert(reader.Contains("src_clip_wav"));
}

} // namespace

int main() {
  TestRegisterSourceAndResolve();
  TestRegisterGeneratedValidatesBeforeMutating();
  TestConflictingPathIsRejected();
  TestCheckCacheFollowsTheBackingFile();
  TestDependentsAreTransitive();
  TestSourceChangeMarksDependentsStale();
  TestSourceRelocationAndConflict();
  TestSaveLoadRoundTrip();
  TestCorruptDocumentLoadsEmpty();
  TestMalformedEntryIsSkipped();
  TestUnknownFieldsArePreserved();
  TestRemoveArtifactKeepsOperationLog();
  TestAutoSaveWritesAfterEachMutation();

  std::cout << "mediacache_unit_resource_registry: pass\n";
  return 0;
}
