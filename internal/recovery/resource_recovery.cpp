#include "internal/recovery/resource_recovery.hpp"

#include <algorithm>
#include <cctype>
#include <list>
#include <optional>
#include <set>
#include <system_error>
#include <utility>

#include "internal/identity/identifier_deriver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/registry_codec.hpp"
#include "internal/registry/resource_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_stat.hpp"

namespace mediacache::recovery {

namespace fs = std::filesystem;

using model::FileCategory;
using observability::IntField;
using observability::PathField;
using observability::StringField;

namespace {

/*
  A generated/metadata file waiting for its inputs to be registered.

  `prefix_stem` is set for metadata named "<known id>_<kind>"; the input ID
  is resolved per pass because it may be registered earlier in the same scan.
*/
struct Candidate {
  fs::path                 path;
  FileCategory             category = FileCategory::kGenerated;
  std::vector<std::string> input_ids;
  std::string              operation;
  model::ParameterSet      parameters;
  std::string              prefix_stem;
};

std::vector<fs::path> RegularFiles(const fs::path& dir) {
  std::vector<fs::path> files;
  if (dir.empty()) {
    return files;
  }

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    MEDIACACHE_LOG_INFO("Recovery directory not present", {PathField("path", dir)});
    return files;
  }

  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      files.push_back(util::NormalizePath(it->path()));
    }
  }
  if (ec) {
    MEDIACACHE_LOG_WARN("Directory scan incomplete", {PathField("path", dir), StringField("error", ec.message())});
  }

  std::sort(files.begin(), files.end());
  return files;
}

// Derived IDs contain no dots, so everything before the first dot.
std::string Stem(const fs::path& path) {
  const auto name = path.filename().string();
  return name.substr(0, name.find('.'));
}

std::string LowerExtension(const fs::path& path) {
  auto extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

bool IsRegistryFile(const fs::path& path, const fs::path& document) {
  const auto name = path.filename().string();
  const auto doc  = document.filename().string();
  return path.parent_path() == document.parent_path() && name.compare(0, doc.size(), doc) == 0;
}

std::string JoinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ",";
    out += id;
  }
  return out;
}

} // namespace

const std::vector<std::string>& IntegrityReport::Missing(FileCategory category) const {
  static const std::vector<std::string> kNone;
  auto                                  it = missing.find(category);
  return it == missing.end() ? kNone : it->second;
}

std::size_t IntegrityReport::MissingCount() const {
  std::size_t count = 0;
  for (const auto& [category, ids] : missing) {
    count += ids.size();
  }
  return count;
}

ResourceRecovery::ResourceRecovery(registry::ResourceRegistry& registry) : registry_(registry) {
}

// ------------------------------------------------------------
// Rebuild
// ------------------------------------------------------------

RebuildReport ResourceRecovery::ScanAndRebuild(const RecoveryDirectories& directories) {
  RebuildReport report;

  const auto            document = util::NormalizePath(registry_.DocumentPath());
  std::set<std::string> seen;

  auto orphan = [&report](const fs::path& path, std::string reason) {
    MEDIACACHE_LOG_WARN("Orphaned file", {PathField("path", path), StringField("reason", reason)});
    report.orphaned.push_back({path.string(), std::move(reason)});
  };

  // Returns true when the file still needs handling.
  auto admit = [&](const fs::path& file) {
    if (!seen.insert(file.string()).second || IsRegistryFile(file, document) || registry::IsProvenanceSidecar(file)) {
      return false;
    }
    if (registry_.FindByPath(file)) {
      ++report.already_registered;
      return false;
    }
    return true;
  };

  // Sources: any file with an accepted extension.
  for (const auto& file : RegularFiles(directories.source_dir)) {
    if (!admit(file)) {
      continue;
    }

    const auto& allowed = directories.allowed_extensions;
    if (!allowed.empty() && std::find(allowed.begin(), allowed.end(), LowerExtension(file)) == allowed.end()) {
      orphan(file, "extension not accepted as source media");
      continue;
    }

    try {
      report.registered_sources.push_back(registry_.RegisterSource(file));
    } catch (const util::Conflict& e) {
      orphan(file, e.what());
    } catch (const util::NotFound& e) {
      orphan(file, e.what());
    }
  }

  std::list<Candidate> pending;

  auto consider = [&](const fs::path& file, FileCategory category) {
    const auto stem = Stem(file);

    if (identity::IsDerivedId(stem)) {
      std::optional<registry::Provenance> provenance;
      if (auto op = registry_.LastOperationFor(stem)) {
        provenance = registry::Provenance{op->output_id, op->operation, op->input_ids, op->parameters};
      } else {
        provenance = registry::ReadProvenance(file);
      }

      if (!provenance) {
        orphan(file, "no recorded provenance for derived id " + stem);
        return;
      }
      if (identity::DerivedId(provenance->input_ids, provenance->operation, provenance->parameters) != stem) {
        orphan(file, "provenance does not reproduce id " + stem);
        return;
      }

      Candidate candidate;
      candidate.path       = file;
      candidate.category   = category;
      candidate.input_ids  = std::move(provenance->input_ids);
      candidate.operation  = std::move(provenance->operation);
      candidate.parameters = std::move(provenance->parameters);
      pending.push_back(std::move(candidate));
      return;
    }

    if (category == FileCategory::kMetadata && stem.find('_') != std::string::npos) {
      Candidate candidate;
      candidate.path        = file;
      candidate.category    = category;
      candidate.prefix_stem = stem;
      pending.push_back(std::move(candidate));
      return;
    }

    orphan(file, "name matches no artifact naming convention");
  };

  for (const auto& file : RegularFiles(directories.generated_dir)) {
    if (admit(file)) {
      consider(file, FileCategory::kGenerated);
    }
  }

  for (const auto& file : RegularFiles(directories.metadata_dir)) {
    if (!admit(file)) {
      continue;
    }
    if (LowerExtension(file) != ".json") {
      orphan(file, "metadata file is not a JSON document");
      continue;
    }
    consider(file, FileCategory::kMetadata);
  }

  // "<known id>_<kind>": the longest registered prefix wins.
  auto resolve_prefix = [this](Candidate& candidate) {
    if (candidate.prefix_stem.empty()) {
      return true;
    }
    const auto& stem = candidate.prefix_stem;
    for (auto pos = stem.rfind('_'); pos != std::string::npos && pos > 0; pos = stem.rfind('_', pos - 1)) {
      const auto prefix = stem.substr(0, pos);
      const auto kind   = stem.substr(pos + 1);
      if (!kind.empty() && registry_.Contains(prefix)) {
        candidate.input_ids = {prefix};
        candidate.operation = kind;
        return true;
      }
    }
    return false;
  };

  // Chains resolve in any directory order: keep passing until nothing moves.
  bool progress = true;
  while (progress && !pending.empty()) {
    progress = false;
    for (auto it = pending.begin(); it != pending.end();) {
      if (!resolve_prefix(*it)) {
        ++it;
        continue;
      }
      const bool inputs_known =
          std::all_of(it->input_ids.begin(), it->input_ids.end(), [this](const std::string& id) { return registry_.Contains(id); });
      if (!inputs_known) {
        ++it;
        continue;
      }

      try {
        if (it->category == FileCategory::kGenerated) {
          report.registered_generated.push_back(registry_.RegisterGenerated(it->input_ids, it->operation, it->parameters, it->path));
        } else {
          report.registered_metadata.push_back(registry_.RegisterMetadata(it->input_ids, it->operation, it->parameters, it->path));
        }
      } catch (const util::Conflict& e) {
        orphan(it->path, e.what());
      } catch (const util::NotFound& e) {
        orphan(it->path, e.what());
      }
      it       = pending.erase(it);
      progress = true;
    }
  }

  for (const auto& candidate : pending) {
    if (!candidate.prefix_stem.empty() && candidate.input_ids.empty()) {
      orphan(candidate.path, "no registered id prefix in " + candidate.prefix_stem);
    } else {
      orphan(candidate.path, "inputs not registered: " + JoinIds(candidate.input_ids));
    }
  }

  MEDIACACHE_LOG_INFO("Registry rebuild complete", {IntField("registered", static_cast<int64_t>(report.Registered())),
                                                    IntField("already_registered", static_cast<int64_t>(report.already_registered)),
                                                    IntField("orphaned", static_cast<int64_t>(report.orphaned.size()))});
  return report;
}

// ------------------------------------------------------------
// Integrity
// ------------------------------------------------------------

IntegrityReport ResourceRecovery::ValidateIntegrity() const {
  IntegrityReport report;
  for (auto category : {FileCategory::kSource, FileCategory::kGenerated, FileCategory::kMetadata}) {
    auto& missing = report.missing[category];
    for (const auto& record : registry_.List(category)) {
      if (!util::IsRegularFile(record.path)) {
        missing.push_back(record.id);
      }
    }
  }

  if (!report.Clean()) {
    MEDIACACHE_LOG_WARN("Integrity violations found",
                        {IntField("source", static_cast<int64_t>(report.Missing(FileCategory::kSource).size())),
                         IntField("generated", static_cast<int64_t>(report.Missing(FileCategory::kGenerated).size())),
                         IntField("metadata", static_cast<int64_t>(report.Missing(FileCategory::kMetadata).size()))});
  }
  return report;
}

std::vector<std::string> ResourceRecovery::PruneMissing(const IntegrityReport& report) {
  std::vector<std::string> pruned;
  for (auto category : {FileCategory::kGenerated, FileCategory::kMetadata}) {
    for (const auto& id : report.Missing(category)) {
      // Re-check: the file may have come back since the report was taken.
      auto record = registry_.Find(id);
      if (!record || util::IsRegularFile(record->path)) {
        continue;
      }
      if (registry_.RemoveArtifact(id)) {
        pruned.push_back(id);
      }
    }
  }
  return pruned;
}

std::size_t ResourceRecovery::RepairDependencies() {
  const auto removed = registry_.RemoveDanglingEdges();
  if (removed) {
    MEDIACACHE_LOG_INFO("Removed dangling dependency edges", {IntField("count", static_cast<int64_t>(removed))});
  }
  return removed;
}

} // namespace mediacache::recovery
