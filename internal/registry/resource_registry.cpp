#include "internal/registry/resource_registry.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/identity/identifier_deriver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/registry_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mediacache::registry {

using model::FileCategory;
using model::FileRecord;
using model::OperationRecord;
using observability::BoolField;
using observability::IntField;
using observability::PathField;
using observability::StringField;

namespace {

std::string JoinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ",";
    out += id;
  }
  return out;
}

std::string ReadDocument(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::CorruptState("cannot open registry document " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw util::CorruptState("failed reading registry document " + path.string());
  }
  return buffer.str();
}

// Keeps an unreadable document around for inspection instead of letting the
// next Save() overwrite it.
void SetAsideCorruptDocument(const std::filesystem::path& path) {
  std::error_code ec;
  auto            aside = path;
  aside += ".corrupt";
  std::filesystem::rename(path, aside, ec);
  if (ec) {
    MEDIACACHE_LOG_WARN("Could not move corrupt registry aside", {PathField("path", path), StringField("error", ec.message())});
  }
}

} // namespace

const char* CacheStateName(CacheState state) {
  switch (state) {
    case CacheState::kValid:
      return "valid";
    case CacheState::kNotRegistered:
      return "not_registered";
    case CacheState::kBackingFileMissing:
      return "backing_file_missing";
    case CacheState::kStale:
      return "stale";
  }
  return "unknown";
}

ResourceRegistry::ResourceRegistry(std::filesystem::path document_path, bool auto_save)
    : document_path_(std::move(document_path)), auto_save_(auto_save) {
}

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------

std::string ResourceRegistry::RegisterSource(const std::filesystem::path& path) {
  const auto normalized = util::NormalizePath(path);
  const auto stat       = util::StatFile(normalized);
  if (!stat) {
    throw util::NotFound("source file does not exist: " + normalized.string());
  }

  const auto id = identity::SourceId(normalized.filename().string());

  std::unique_lock lock(mutex_);

  auto it = sources_.find(id);
  if (it == sources_.end()) {
    FileRecord record;
    record.category       = FileCategory::kSource;
    record.id             = id;
    record.path           = normalized.string();
    record.size_bytes     = stat->size_bytes;
    record.created_at_ms  = util::ToUnixMillis(util::Now());
    record.modified_at_ms = stat->mtime_ms;
    sources_.emplace(id, std::move(record));

    MEDIACACHE_LOG_INFO("Registered source", {StringField("id", id), PathField("path", normalized)});
    MutatedLocked();
    return id;
  }

  auto& record  = it->second;
  bool  changed = false;
  if (record.path != normalized.string()) {
    if (util::StatFile(record.path)) {
      throw util::Conflict("source id " + id + " already bound to " + record.path + ", refusing " + normalized.string());
    }
    MEDIACACHE_LOG_WARN("Source relocated", {StringField("id", id), StringField("from", record.path), StringField("to", normalized.string())});
    record.path = normalized.string();
    changed     = true;
  }

  const util::FileStat recorded{record.size_bytes, record.modified_at_ms};
  if (recorded != *stat) {
    record.size_bytes     = stat->size_bytes;
    record.modified_at_ms = stat->mtime_ms;

    const auto invalidated = MarkDependentsStaleLocked(id);
    MEDIACACHE_LOG_INFO("Source changed on re-registration",
                        {StringField("id", id), IntField("invalidated", static_cast<int64_t>(invalidated.size()))});
    changed = true;
  }

  if (changed) {
    MutatedLocked();
  }
  return id;
}

std::string ResourceRegistry::RegisterGenerated(const std::vector<std::string>& input_ids, const std::string& operation,
                                                const model::ParameterSet& parameters, const std::filesystem::path& path) {
  return RegisterDerived(FileCategory::kGenerated, input_ids, operation, parameters, path);
}

std::string ResourceRegistry::RegisterMetadata(const std::vector<std::string>& input_ids, const std::string& operation,
                                               const model::ParameterSet& parameters, const std::filesystem::path& path) {
  return RegisterDerived(FileCategory::kMetadata, input_ids, operation, parameters, path);
}

std::string ResourceRegistry::RegisterDerived(FileCategory category, const std::vector<std::string>& input_ids,
                                              const std::string& operation, const model::ParameterSet& parameters,
                                              const std::filesystem::path& path) {
  const auto normalized = util::NormalizePath(path);
  const auto stat       = util::StatFile(normalized);
  if (!stat) {
    throw util::NotFound("artifact file does not exist: " + normalized.string());
  }

  const auto op = model::TrimKey(operation);
  const auto id = identity::DerivedId(input_ids, op, parameters);

  std::unique_lock lock(mutex_);

  // Validate everything before touching state.
  bool inputs_stale = false;
  for (const auto& input : input_ids) {
    if (input == id) {
      throw util::Conflict("artifact " + id + " lists itself as an input");
    }
    if (!FindLocked(input)) {
      throw util::NotFound("input " + input + " is not registered (needed by " + id + ")");
    }
    inputs_stale = inputs_stale || IsStaleLocked(input);
  }

  auto&       target = MapFor(category);
  const auto* other  = category == FileCategory::kGenerated ? &metadata_ : &generated_;
  if (other->count(id) || sources_.count(id)) {
    throw util::Conflict("id " + id + " is already registered in another category");
  }

  OperationRecord op_record;
  op_record.output_id    = id;
  op_record.operation    = op;
  op_record.input_ids    = input_ids;
  op_record.parameters   = parameters;
  op_record.timestamp_ms = util::ToUnixMillis(util::Now());

  auto existing = target.find(id);
  if (existing != target.end()) {
    auto& record = existing->second;
    if (record.path != normalized.string()) {
      MEDIACACHE_LOG_ERROR("Identifier conflict",
                           {StringField("id", id), StringField("registered", record.path), StringField("claimed", normalized.string())});
      throw util::Conflict("id " + id + " is bound to " + record.path + ", refusing " + normalized.string());
    }
    const bool rewritten = record.size_bytes != stat->size_bytes || record.modified_at_ms != stat->mtime_ms;
    if (!record.stale && !rewritten) {
      return id;
    }

    // Recomputed after invalidation or loss of the file: refresh in place.
    operations_.push_back(op_record);
    record.stale          = inputs_stale;
    record.size_bytes     = stat->size_bytes;
    record.modified_at_ms = stat->mtime_ms;
    record.created_at_ms  = op_record.timestamp_ms;
    MEDIACACHE_LOG_INFO("Refreshed stale artifact", {StringField("id", id), BoolField("still_stale", inputs_stale)});
    MutatedLocked();
    return id;
  }

  FileRecord record;
  record.category       = category;
  record.id             = id;
  record.path           = normalized.string();
  record.size_bytes     = stat->size_bytes;
  record.created_at_ms  = op_record.timestamp_ms;
  record.modified_at_ms = stat->mtime_ms;
  record.operation      = op;
  record.input_ids      = input_ids;
  record.parameters     = parameters;
  record.stale          = inputs_stale;

  auto inserted = target.emplace(id, std::move(record)).first;
  try {
    operations_.push_back(op_record);
  } catch (...) {
    target.erase(inserted);
    throw;
  }
  try {
    graph_.Add(id, input_ids);
  } catch (...) {
    graph_.Remove(id);
    operations_.pop_back();
    target.erase(inserted);
    throw;
  }

  MEDIACACHE_LOG_INFO("Registered artifact", {StringField("id", id), StringField("category", model::CategoryName(category)),
                                               StringField("operation", op), StringField("inputs", JoinIds(input_ids))});
  MutatedLocked();
  return id;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

const FileRecord* ResourceRegistry::FindLocked(const std::string& id) const {
  for (const auto* map : {&sources_, &generated_, &metadata_}) {
    auto it = map->find(id);
    if (it != map->end()) {
      return &it->second;
    }
  }
  return nullptr;
}

FileRecord* ResourceRegistry::FindMutableLocked(const std::string& id) {
  return const_cast<FileRecord*>(FindLocked(id));
}

std::map<std::string, FileRecord>& ResourceRegistry::MapFor(FileCategory category) {
  switch (category) {
    case FileCategory::kSource:
      return sources_;
    case FileCategory::kGenerated:
      return generated_;
    case FileCategory::kMetadata:
    default:
      return metadata_;
  }
}

std::string ResourceRegistry::Resolve(const std::string& id) const {
  std::shared_lock lock(mutex_);
  const auto*      record = FindLocked(id);
  if (!record) {
    throw util::NotFound("unknown id: " + id);
  }
  return record->path;
}

std::optional<FileRecord> ResourceRegistry::Find(const std::string& id) const {
  std::shared_lock lock(mutex_);
  const auto*      record = FindLocked(id);
  if (!record) {
    return std::nullopt;
  }
  return *record;
}

std::optional<FileRecord> ResourceRegistry::FindByPath(const std::filesystem::path& path) const {
  const auto       wanted = util::NormalizePath(path).string();
  std::shared_lock lock(mutex_);
  for (const auto* map : {&sources_, &generated_, &metadata_}) {
    for (const auto& [id, record] : *map) {
      if (record.path == wanted) {
        return record;
      }
    }
  }
  return std::nullopt;
}

bool ResourceRegistry::Contains(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return FindLocked(id) != nullptr;
}

CacheProbe ResourceRegistry::Probe(const std::vector<std::string>& input_ids, const std::string& operation,
                                   const model::ParameterSet& parameters) const {
  CacheProbe probe;
  probe.id = identity::DerivedId(input_ids, model::TrimKey(operation), parameters);

  std::shared_lock lock(mutex_);

  const FileRecord* record = nullptr;
  if (auto it = generated_.find(probe.id); it != generated_.end()) {
    record = &it->second;
  } else if (auto meta = metadata_.find(probe.id); meta != metadata_.end()) {
    record = &meta->second;
  }

  if (!record) {
    probe.state = CacheState::kNotRegistered;
    return probe;
  }

  probe.path = record->path;
  if (IsStaleLocked(probe.id)) {
    probe.state = CacheState::kStale;
  } else if (!util::IsRegularFile(record->path)) {
    probe.state = CacheState::kBackingFileMissing;
  } else {
    probe.state = CacheState::kValid;
  }
  return probe;
}

std::optional<std::string> ResourceRegistry::CheckCache(const std::vector<std::string>& input_ids, const std::string& operation,
                                                        const model::ParameterSet& parameters) const {
  auto probe = Probe(input_ids, operation, parameters);
  if (probe.state != CacheState::kValid) {
    return std::nullopt;
  }
  return probe.id;
}

std::set<std::string> ResourceRegistry::DependentsOf(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.Dependents(id);
}

std::vector<std::string> ResourceRegistry::DependenciesOf(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.InputsOf(id);
}

std::vector<FileRecord> ResourceRegistry::List(FileCategory category) const {
  std::shared_lock lock(mutex_);
  const auto&      map = category == FileCategory::kSource ? sources_ : category == FileCategory::kGenerated ? generated_ : metadata_;

  std::vector<FileRecord> records;
  records.reserve(map.size());
  for (const auto& [id, record] : map) {
    records.push_back(record);
  }
  return records;
}

std::vector<FileRecord> ResourceRegistry::ListSources() const {
  return List(FileCategory::kSource);
}

std::vector<FileRecord> ResourceRegistry::ListGenerated() const {
  return List(FileCategory::kGenerated);
}

std::vector<FileRecord> ResourceRegistry::ListMetadata() const {
  return List(FileCategory::kMetadata);
}

std::vector<OperationRecord> ResourceRegistry::Operations() const {
  std::shared_lock lock(mutex_);
  return operations_;
}

std::optional<OperationRecord> ResourceRegistry::LastOperationFor(const std::string& output_id) const {
  std::shared_lock lock(mutex_);
  for (auto it = operations_.rbegin(); it != operations_.rend(); ++it) {
    if (it->output_id == output_id) {
      return *it;
    }
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// Staleness and cleanup
// ------------------------------------------------------------

bool ResourceRegistry::IsStaleLocked(const std::string& id) const {
  const auto* record = FindLocked(id);
  if (!record || !record->IsDerived()) {
    return false;
  }
  if (record->stale) {
    return true;
  }
  // A chain is only as fresh as its oldest link.
  for (const auto& ancestor : graph_.Ancestors(id)) {
    const auto* upstream = FindLocked(ancestor);
    if (upstream && upstream->IsDerived() && upstream->stale) {
      return true;
    }
  }
  return false;
}

bool ResourceRegistry::IsStale(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return IsStaleLocked(id);
}

std::set<std::string> ResourceRegistry::MarkDependentsStaleLocked(const std::string& id) {
  std::set<std::string> marked;
  for (const auto& dependent : graph_.Dependents(id)) {
    auto* record = FindMutableLocked(dependent);
    if (!record || !record->IsDerived()) {
      continue;
    }
    if (!record->stale) {
      record->stale = true;
      dirty_        = true;
    }
    marked.insert(dependent);
  }
  return marked;
}

void ResourceRegistry::MarkStale(const std::set<std::string>& ids) {
  std::unique_lock lock(mutex_);
  bool             changed = false;
  for (const auto& id : ids) {
    auto* record = FindMutableLocked(id);
    if (!record || !record->IsDerived() || record->stale) {
      continue;
    }
    record->stale = true;
    changed       = true;
  }
  if (changed) {
    MutatedLocked();
  }
}

std::set<std::string> ResourceRegistry::UpdateSourceSignature(const std::string& source_id, const util::FileStat& stat, bool force) {
  std::unique_lock lock(mutex_);

  auto it = sources_.find(source_id);
  if (it == sources_.end()) {
    throw util::NotFound("unknown source id: " + source_id);
  }

  auto&                record = it->second;
  const util::FileStat recorded{record.size_bytes, record.modified_at_ms};
  if (recorded == stat && !force) {
    return {};
  }

  record.size_bytes     = stat.size_bytes;
  record.modified_at_ms = stat.mtime_ms;

  auto marked = MarkDependentsStaleLocked(source_id);
  MutatedLocked();
  return marked;
}

bool ResourceRegistry::RemoveArtifact(const std::string& id) {
  std::unique_lock lock(mutex_);

  auto erased = generated_.erase(id) + metadata_.erase(id);
  if (!erased) {
    return false;
  }
  graph_.Remove(id);
  MEDIACACHE_LOG_INFO("Removed artifact from registry", {StringField("id", id)});
  MutatedLocked();
  return true;
}

std::size_t ResourceRegistry::RemoveDanglingEdges() {
  std::unique_lock lock(mutex_);

  std::vector<std::pair<std::string, std::string>> dangling;
  for (const auto& [derived, inputs] : graph_.Edges()) {
    for (const auto& input : inputs) {
      if (!FindLocked(input) || !FindLocked(derived)) {
        dangling.emplace_back(derived, input);
      }
    }
  }

  for (const auto& [derived, input] : dangling) {
    graph_.RemoveEdge(derived, input);
  }
  if (!dangling.empty()) {
    MutatedLocked();
  }
  return dangling.size();
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------

void ResourceRegistry::MutatedLocked() {
  dirty_ = true;
  if (!auto_save_) {
    return;
  }
  try {
    SaveLocked();
  } catch (const std::exception& e) {
    // The in-memory state stays authoritative; the next Save() retries.
    MEDIACACHE_LOG_ERROR("Registry auto-save failed", {PathField("path", document_path_), StringField("error", e.what())});
  }
}

bool ResourceRegistry::IsDirty() const {
  std::shared_lock lock(mutex_);
  return dirty_;
}

std::vector<std::string> ResourceRegistry::LoadWarnings() const {
  std::shared_lock lock(mutex_);
  return load_warnings_;
}

void ResourceRegistry::Save() {
  std::unique_lock lock(mutex_);
  SaveLocked();
}

void ResourceRegistry::SaveLocked() {
  RegistryDocument document;
  document.sources        = sources_;
  document.generated      = generated_;
  document.metadata       = metadata_;
  document.operations     = operations_;
  document.unknown_fields = document_unknown_fields_;
  for (const auto& [derived, inputs] : graph_.Edges()) {
    if (!inputs.empty()) {
      document.dependencies.emplace(derived, inputs);
    }
  }

  const auto json = EncodeDocument(document, util::Now());

  if (document_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(document_path_.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create registry directory: " + ec.message());
    }
  }

  auto temp_path = document_path_;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot write registry document " + temp_path.string());
    }
    out << json;
    out.flush();
    if (!out) {
      throw std::runtime_error("failed writing registry document " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, document_path_, ec);
  if (ec) {
    throw std::runtime_error("cannot replace registry document " + document_path_.string() + ": " + ec.message());
  }
  dirty_ = false;
}

void ResourceRegistry::ClearLocked() {
  sources_.clear();
  generated_.clear();
  metadata_.clear();
  operations_.clear();
  graph_.Clear();
  document_unknown_fields_.Clear();
  load_warnings_.clear();
}

void ResourceRegistry::Load() {
  std::unique_lock lock(mutex_);
  ClearLocked();
  dirty_ = false;

  std::error_code ec;
  if (!std::filesystem::exists(document_path_, ec)) {
    MEDIACACHE_LOG_INFO("No registry document yet; starting empty", {PathField("path", document_path_)});
    return;
  }

  try {
    ApplyDocumentLocked(DecodeDocument(ReadDocument(document_path_)));
  } catch (const util::CorruptState& e) {
    ClearLocked();
    load_warnings_.push_back(e.what());
    MEDIACACHE_LOG_ERROR("Registry document is corrupt; starting from an empty registry (rebuild to recover)",
                         {PathField("path", document_path_), StringField("error", e.what())});
    SetAsideCorruptDocument(document_path_);
    return;
  }

  for (const auto& warning : load_warnings_) {
    MEDIACACHE_LOG_WARN("Registry entry skipped on load", {StringField("reason", warning)});
  }
  MEDIACACHE_LOG_INFO("Registry loaded", {PathField("path", document_path_), IntField("sources", static_cast<int64_t>(sources_.size())),
                                          IntField("generated", static_cast<int64_t>(generated_.size())),
                                          IntField("metadata", static_cast<int64_t>(metadata_.size()))});
}

void ResourceRegistry::ApplyDocumentLocked(RegistryDocument document) {
  sources_                 = std::move(document.sources);
  generated_               = std::move(document.generated);
  metadata_                = std::move(document.metadata);
  operations_              = std::move(document.operations);
  document_unknown_fields_ = std::move(document.unknown_fields);
  load_warnings_           = std::move(document.warnings);

  // An ID may live in one map only; keep the first claim.
  for (auto it = metadata_.begin(); it != metadata_.end();) {
    if (generated_.count(it->first) || sources_.count(it->first)) {
      load_warnings_.push_back("metadata entry '" + it->first + "' duplicates another category; skipped");
      it = metadata_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = generated_.begin(); it != generated_.end();) {
    if (sources_.count(it->first)) {
      load_warnings_.push_back("generated entry '" + it->first + "' duplicates a source; skipped");
      it = generated_.erase(it);
    } else {
      ++it;
    }
  }

  // Fill provenance that older documents only kept in the operation log.
  for (auto* map : {&generated_, &metadata_}) {
    for (auto& [id, record] : *map) {
      if (!record.operation.empty()) {
        continue;
      }
      for (auto op = operations_.rbegin(); op != operations_.rend(); ++op) {
        if (op->output_id == id) {
          record.operation  = op->operation;
          record.input_ids  = op->input_ids;
          record.parameters = op->parameters;
          break;
        }
      }
    }
  }

  for (const auto& [derived, inputs] : document.dependencies) {
    graph_.Add(derived, inputs);
  }
  for (const auto* map : {&generated_, &metadata_}) {
    for (const auto& [id, record] : *map) {
      graph_.Add(id, record.input_ids);
    }
  }
}

} // namespace mediacache::registry
