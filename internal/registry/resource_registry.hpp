#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/lineage/dependency_graph.hpp"
#include "internal/model/file_record.hpp"
#include "internal/model/operation_record.hpp"
#include "internal/model/parameter_set.hpp"
#include "internal/util/file_stat.hpp"

namespace mediacache::registry {

struct RegistryDocument;

enum class CacheState {
  kValid,
  kNotRegistered,
  kBackingFileMissing,
  kStale,
};

const char* CacheStateName(CacheState state);

struct CacheProbe {
  std::string id;
  CacheState  state = CacheState::kNotRegistered;
  std::string path;
};

/*
  ResourceRegistry

  Persistent index of source, generated and metadata files, the append-only
  operation log and the dependency edges between artifacts.

  Consistency model:
  - One in-process owner. Every public call takes the internal lock, so a
    Register* call either lands completely (entry, operation record, edges)
    or not at all.
  - Nothing is locked while the caller runs the actual transformation; only
    the final Register* call needs exclusivity.
  - The document is rewritten on Save() (temp file + rename), or after each
    mutation when auto_save is on. Multiple processes sharing one document
    must serialize load-mutate-save themselves.
*/
class ResourceRegistry {
 public:
  explicit ResourceRegistry(std::filesystem::path document_path, bool auto_save = false);

  ResourceRegistry(const ResourceRegistry&)            = delete;
  ResourceRegistry& operator=(const ResourceRegistry&) = delete;

  // ------------------------------------------------------------
  // Registration
  // ------------------------------------------------------------

  // Records or refreshes a source file. Throws util::NotFound when the file
  // does not exist and util::Conflict when another live file owns the ID.
  std::string RegisterSource(const std::filesystem::path& path);

  // Records an artifact produced by `operation` over `input_ids`. Idempotent
  // for an identical artifact; throws util::Conflict when the ID is already
  // bound to a different path, util::NotFound for unknown inputs or a missing file.
  std::string RegisterGenerated(const std::vector<std::string>& input_ids, const std::string& operation,
                                const model::ParameterSet& parameters, const std::filesystem::path& path);

  std::string RegisterMetadata(const std::vector<std::string>& input_ids, const std::string& operation,
                               const model::ParameterSet& parameters, const std::filesystem::path& path);

  // ------------------------------------------------------------
  // Lookup
  // ------------------------------------------------------------

  // Throws util::NotFound.
  std::string Resolve(const std::string& id) const;

  std::optional<model::FileRecord> Find(const std::string& id) const;
  std::optional<model::FileRecord> FindByPath(const std::filesystem::path& path) const;
  bool                             Contains(const std::string& id) const;

  // The expected ID when it is registered, fresh and still on disk.
  std::optional<std::string> CheckCache(const std::vector<std::string>& input_ids, const std::string& operation,
                                        const model::ParameterSet& parameters) const;

  CacheProbe Probe(const std::vector<std::string>& input_ids, const std::string& operation,
                   const model::ParameterSet& parameters) const;

  // Every artifact that used `id`, directly or transitively.
  std::set<std::string>    DependentsOf(const std::string& id) const;
  std::vector<std::string> DependenciesOf(const std::string& id) const;

  std::vector<model::FileRecord>      List(model::FileCategory category) const;
  std::vector<model::FileRecord>      ListSources() const;
  std::vector<model::FileRecord>      ListGenerated() const;
  std::vector<model::FileRecord>      ListMetadata() const;
  std::vector<model::OperationRecord> Operations() const;

  // Most recent operation that produced `output_id`.
  std::optional<model::OperationRecord> LastOperationFor(const std::string& output_id) const;

  // ------------------------------------------------------------
  // Staleness and cleanup
  // ------------------------------------------------------------

  // Marks derived entries stale; source IDs and unknown IDs are ignored.
  void MarkStale(const std::set<std::string>& ids);
  bool IsStale(const std::string& id) const;

  // Stores a new on-disk signature for a source and marks every dependent
  // stale when it differs. Returns the IDs that were marked.
  std::set<std::string> UpdateSourceSignature(const std::string& source_id, const util::FileStat& stat, bool force = false);

  // Explicit removal of a generated/metadata entry and its edges.
  bool RemoveArtifact(const std::string& id);

  // Drops edges whose input is no longer registered. Returns the number removed.
  std::size_t RemoveDanglingEdges();

  // ------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------

  // Throws std::runtime_error on I/O failure.
  void Save();

  // Never throws on bad content: an unreadable document leaves an empty
  // registry and a recorded warning.
  void Load();

  bool                         IsDirty() const;
  std::vector<std::string>     LoadWarnings() const;
  const std::filesystem::path& DocumentPath() const {
    return document_path_;
  }

 private:
  std::string RegisterDerived(model::FileCategory category, const std::vector<std::string>& input_ids,
                              const std::string& operation, const model::ParameterSet& parameters,
                              const std::filesystem::path& path);

  const model::FileRecord* FindLocked(const std::string& id) const;
  model::FileRecord*       FindMutableLocked(const std::string& id);
  bool                     IsStaleLocked(const std::string& id) const;
  std::set<std::string>    MarkDependentsStaleLocked(const std::string& id);
  std::map<std::string, model::FileRecord>& MapFor(model::FileCategory category);

  void ApplyDocumentLocked(RegistryDocument document);
  void ClearLocked();
  void SaveLocked();
  void MutatedLocked();

  mutable std::shared_mutex mutex_;

  std::filesystem::path document_path_;
  bool                  auto_save_ = false;
  bool                  dirty_     = false;

  std::map<std::string, model::FileRecord> sources_;
  std::map<std::string, model::FileRecord> generated_;
  std::map<std::string, model::FileRecord> metadata_;
  std::vector<model::OperationRecord>      operations_;
  lineage::DependencyGraph                 graph_;

  google::protobuf::Struct document_unknown_fields_;
  std::vector<std::string> load_warnings_;
};

} // namespace mediacache::registry
