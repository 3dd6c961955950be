#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/file_record.hpp"
#include "internal/model/operation_record.hpp"
#include "internal/util/time.hpp"

namespace mediacache::registry {

inline constexpr char kDocumentVersion[] = "2.0";

/*
  In-memory image of the persisted registry document.

  {
    "version": "2.0",
    "last_updated": "<RFC 3339>",
    "source_files":    { "<id>": {path, size, created_at, modified_at} },
    "generated_files": { "<id>": {path, operation, input_ids, parameters, size, created_at, stale} },
    "metadata_files":  { ... same as generated ... },
    "operations":      [ {output_id, operation, input_ids, parameters, timestamp} ],
    "dependencies":    { "<derived id>": ["<input id>", ...] }
  }

  Times are Unix milliseconds. Fields this version does not know are kept in
  unknown_fields (document, entry and operation level) and written back.
*/
struct RegistryDocument {
  std::map<std::string, model::FileRecord>        sources;
  std::map<std::string, model::FileRecord>        generated;
  std::map<std::string, model::FileRecord>        metadata;
  std::vector<model::OperationRecord>             operations;
  std::map<std::string, std::vector<std::string>> dependencies;

  google::protobuf::Struct unknown_fields;

  // Entries that were skipped while decoding, one line each.
  std::vector<std::string> warnings;
};

// Throws util::CorruptState when `json` is not a JSON object.
RegistryDocument DecodeDocument(const std::string& json);

std::string EncodeDocument(const RegistryDocument& document, util::TimePoint now);

/*
  Provenance sidecar written next to a committed artifact so a rebuild can
  restore (operation, inputs, parameters) after the registry itself is lost.
*/
struct Provenance {
  std::string              id;
  std::string              operation;
  std::vector<std::string> input_ids;
  model::ParameterSet      parameters;
};

std::filesystem::path ProvenanceSidecarPath(const std::filesystem::path& artifact);
bool                  IsProvenanceSidecar(const std::filesystem::path& path);

std::string EncodeProvenance(const Provenance& provenance);

// nullopt when the sidecar is missing or malformed.
std::optional<Provenance> ReadProvenance(const std::filesystem::path& artifact);

void WriteProvenance(const std::filesystem::path& artifact, const Provenance& provenance);

} // namespace mediacache::registry
