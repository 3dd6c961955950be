#include "internal/registry/registry_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace mediacache::registry {

using google::protobuf::Struct;
using google::protobuf::Value;
using model::FileCategory;
using model::FileRecord;
using model::OperationRecord;

namespace {

constexpr char kProvenanceSuffix[] = ".provenance.json";

// ------------------------------------------------------------
// Struct accessors
// ------------------------------------------------------------

const Value* Field(const Struct& fields, const std::string& key) {
  auto it = fields.fields().find(key);
  return it == fields.fields().end() ? nullptr : &it->second;
}

std::optional<std::string> GetString(const Struct& fields, const std::string& key) {
  const auto* value = Field(fields, key);
  if (!value || value->kind_case() != Value::kStringValue) {
    return std::nullopt;
  }
  return value->string_value();
}

std::optional<int64_t> GetInt(const Struct& fields, const std::string& key) {
  const auto* value = Field(fields, key);
  if (!value || value->kind_case() != Value::kNumberValue || !std::isfinite(value->number_value())) {
    return std::nullopt;
  }
  return static_cast<int64_t>(std::llround(value->number_value()));
}

// Legacy documents stored float seconds under a different key.
std::optional<int64_t> GetMillis(const Struct& fields, const std::string& key, const std::string& legacy_seconds_key) {
  if (auto ms = GetInt(fields, key)) {
    return ms;
  }
  const auto* value = Field(fields, legacy_seconds_key);
  if (!value || value->kind_case() != Value::kNumberValue || !std::isfinite(value->number_value())) {
    return std::nullopt;
  }
  return static_cast<int64_t>(std::llround(value->number_value() * 1000.0));
}

std::optional<std::vector<std::string>> StringList(const Value& value) {
  if (value.kind_case() != Value::kListValue) {
    return std::nullopt;
  }
  std::vector<std::string> result;
  for (const auto& item : value.list_value().values()) {
    if (item.kind_case() != Value::kStringValue) {
      return std::nullopt;
    }
    result.push_back(item.string_value());
  }
  return result;
}

std::optional<std::vector<std::string>> GetStringList(const Struct& fields, const std::string& key) {
  const auto* value = Field(fields, key);
  if (!value) {
    return std::nullopt;
  }
  return StringList(*value);
}

std::optional<model::ParameterSet> GetParameters(const Struct& fields, const std::string& key) {
  const auto* value = Field(fields, key);
  if (!value || value->kind_case() != Value::kStructValue) {
    return std::nullopt;
  }
  return model::ParameterSet::FromStruct(value->struct_value());
}

Struct UnknownFields(const Struct& fields, const std::vector<std::string>& known) {
  Struct unknown;
  for (const auto& [key, value] : fields.fields()) {
    if (std::find(known.begin(), known.end(), key) == known.end()) {
      (*unknown.mutable_fields())[key] = value;
    }
  }
  return unknown;
}

// ------------------------------------------------------------
// Value builders
// ------------------------------------------------------------

Value StringValue(const std::string& text) {
  Value value;
  value.set_string_value(text);
  return value;
}

Value NumberValue(double number) {
  Value value;
  value.set_number_value(number);
  return value;
}

Value BoolValue(bool flag) {
  Value value;
  value.set_bool_value(flag);
  return value;
}

Value StringListValue(const std::vector<std::string>& items) {
  Value value;
  auto* list = value.mutable_list_value();
  for (const auto& item : items) {
    list->add_values()->set_string_value(item);
  }
  return value;
}

Value ParametersValue(const model::ParameterSet& parameters) {
  Value value;
  *value.mutable_struct_value() = parameters.ToStruct();
  return value;
}

// ------------------------------------------------------------
// File entries
// ------------------------------------------------------------

const std::vector<std::string> kDocumentFields  = {"version",         "last_updated",   "source_files", "generated_files",
                                                  "metadata_files",  "operations",     "dependencies"};
const std::vector<std::string> kSourceFields    = {"path", "size", "created_at", "modified_at"};
const std::vector<std::string> kDerivedFields   = {"path",      "size",      "created_at", "modified_at",
                                                  "operation", "input_ids", "parameters", "stale"};
const std::vector<std::string> kOperationFields = {"output_id", "operation", "input_ids", "parameters", "timestamp"};

std::optional<FileRecord> DecodeFileRecord(FileCategory category, const std::string& id, const Value& value,
                                           std::vector<std::string>* warnings) {
  const std::string where = std::string(model::CategoryName(category)) + " entry '" + id + "'";
  if (value.kind_case() != Value::kStructValue) {
    warnings->push_back(where + " is not an object; skipped");
    return std::nullopt;
  }
  const auto& fields = value.struct_value();

  FileRecord record;
  record.category = category;
  record.id       = id;

  auto path = GetString(fields, "path");
  if (!path || path->empty()) {
    warnings->push_back(where + " has no path; skipped");
    return std::nullopt;
  }
  record.path           = *path;
  record.size_bytes     = static_cast<uint64_t>(std::max<int64_t>(0, GetInt(fields, "size").value_or(0)));
  record.created_at_ms  = GetMillis(fields, "created_at", "created").value_or(0);
  record.modified_at_ms = GetMillis(fields, "modified_at", "modified").value_or(0);

  if (category == FileCategory::kSource) {
    record.unknown_fields = UnknownFields(fields, kSourceFields);
    return record;
  }

  // Provenance may be absent in older documents; the registry fills it from the operation log.
  record.operation  = GetString(fields, "operation").value_or("");
  record.input_ids  = GetStringList(fields, "input_ids").value_or(std::vector<std::string>{});
  record.parameters = GetParameters(fields, "parameters").value_or(model::ParameterSet{});
  if (const auto* stale = Field(fields, "stale"); stale && stale->kind_case() == Value::kBoolValue) {
    record.stale = stale->bool_value();
  }
  record.unknown_fields = UnknownFields(fields, kDerivedFields);
  return record;
}

Value EncodeFileRecord(const FileRecord& record) {
  Value value;
  auto* fields = value.mutable_struct_value();
  *fields      = record.unknown_fields;

  auto& out          = *fields->mutable_fields();
  out["path"]        = StringValue(record.path);
  out["size"]        = NumberValue(static_cast<double>(record.size_bytes));
  out["created_at"]  = NumberValue(static_cast<double>(record.created_at_ms));
  out["modified_at"] = NumberValue(static_cast<double>(record.modified_at_ms));

  if (record.IsDerived()) {
    out["operation"]  = StringValue(record.operation);
    out["input_ids"]  = StringListValue(record.input_ids);
    out["parameters"] = ParametersValue(record.parameters);
    out["stale"]      = BoolValue(record.stale);
  }
  return value;
}

void DecodeFileSection(const Struct& root, const std::string& key, FileCategory category,
                       std::map<std::string, FileRecord>* out, std::vector<std::string>* warnings) {
  const auto* section = Field(root, key);
  if (!section) {
    return;
  }
  if (section->kind_case() != Value::kStructValue) {
    warnings->push_back("section '" + key + "' is not an object; ignored");
    return;
  }
  for (const auto& [id, value] : section->struct_value().fields()) {
    if (auto record = DecodeFileRecord(category, id, value, warnings)) {
      out->emplace(id, std::move(*record));
    }
  }
}

Value EncodeFileSection(const std::map<std::string, FileRecord>& records) {
  Value value;
  auto& fields = *value.mutable_struct_value()->mutable_fields();
  for (const auto& [id, record] : records) {
    fields[id] = EncodeFileRecord(record);
  }
  return value;
}

// ------------------------------------------------------------
// Operation log
// ------------------------------------------------------------

std::optional<OperationRecord> DecodeOperation(const Value& value, std::vector<std::string>* warnings) {
  if (value.kind_case() != Value::kStructValue) {
    warnings->push_back("operation record is not an object; skipped");
    return std::nullopt;
  }
  const auto& fields = value.struct_value();

  // Older documents used output_file/input_files and float-second timestamps.
  const bool legacy = Field(fields, "output_id") == nullptr;

  OperationRecord record;
  auto output    = GetString(fields, legacy ? "output_file" : "output_id");
  auto operation = GetString(fields, "operation");
  if (!output || !operation) {
    warnings->push_back("operation record without output_id/operation; skipped");
    return std::nullopt;
  }

  record.output_id = *output;
  record.operation = *operation;
  record.input_ids  = GetStringList(fields, legacy ? "input_files" : "input_ids").value_or(std::vector<std::string>{});
  record.parameters = GetParameters(fields, "parameters").value_or(model::ParameterSet{});
  if (legacy) {
    record.timestamp_ms = GetMillis(fields, "timestamp_ms", "timestamp").value_or(0);
  } else {
    record.timestamp_ms = GetInt(fields, "timestamp").value_or(0);
  }
  record.unknown_fields = UnknownFields(fields, kOperationFields);
  return record;
}

Value EncodeOperation(const OperationRecord& record) {
  Value value;
  auto* fields = value.mutable_struct_value();
  *fields      = record.unknown_fields;

  auto& out         = *fields->mutable_fields();
  out["output_id"]  = StringValue(record.output_id);
  out["operation"]  = StringValue(record.operation);
  out["input_ids"]  = StringListValue(record.input_ids);
  out["parameters"] = ParametersValue(record.parameters);
  out["timestamp"]  = NumberValue(static_cast<double>(record.timestamp_ms));
  return value;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string ToJson(const Struct& root) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize registry JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace

// ------------------------------------------------------------
// Document
// ------------------------------------------------------------

RegistryDocument DecodeDocument(const std::string& json) {
  Struct root;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &root);
  if (!status.ok()) {
    throw util::CorruptState("registry document is not a JSON object: " + std::string(status.message()));
  }

  RegistryDocument document;
  DecodeFileSection(root, "source_files", FileCategory::kSource, &document.sources, &document.warnings);
  DecodeFileSection(root, "generated_files", FileCategory::kGenerated, &document.generated, &document.warnings);
  DecodeFileSection(root, "metadata_files", FileCategory::kMetadata, &document.metadata, &document.warnings);

  if (const auto* operations = Field(root, "operations")) {
    if (operations->kind_case() == Value::kListValue) {
      for (const auto& item : operations->list_value().values()) {
        if (auto record = DecodeOperation(item, &document.warnings)) {
          document.operations.push_back(std::move(*record));
        }
      }
    } else if (operations->kind_case() == Value::kStructValue) {
      // keyed by operation id in older documents
      for (const auto& [op_id, item] : operations->struct_value().fields()) {
        if (auto record = DecodeOperation(item, &document.warnings)) {
          document.operations.push_back(std::move(*record));
        }
      }
      std::stable_sort(document.operations.begin(), document.operations.end(),
                       [](const OperationRecord& a, const OperationRecord& b) { return a.timestamp_ms < b.timestamp_ms; });
    } else {
      document.warnings.push_back("section 'operations' is neither a list nor an object; ignored");
    }
  }

  if (const auto* dependencies = Field(root, "dependencies")) {
    if (dependencies->kind_case() == Value::kStructValue) {
      for (const auto& [id, inputs] : dependencies->struct_value().fields()) {
        auto list = StringList(inputs);
        if (!list) {
          document.warnings.push_back("dependencies of '" + id + "' are not a list of IDs; skipped");
          continue;
        }
        document.dependencies.emplace(id, std::move(*list));
      }
    } else {
      document.warnings.push_back("section 'dependencies' is not an object; ignored");
    }
  }

  document.unknown_fields = UnknownFields(root, kDocumentFields);
  return document;
}

std::string EncodeDocument(const RegistryDocument& document, util::TimePoint now) {
  Struct root = document.unknown_fields;
  auto&  out  = *root.mutable_fields();

  out["version"]         = StringValue(kDocumentVersion);
  out["last_updated"]    = StringValue(util::ToRfc3339(now));
  out["source_files"]    = EncodeFileSection(document.sources);
  out["generated_files"] = EncodeFileSection(document.generated);
  out["metadata_files"]  = EncodeFileSection(document.metadata);

  Value operations;
  auto* list = operations.mutable_list_value();
  for (const auto& record : document.operations) {
    *list->add_values() = EncodeOperation(record);
  }
  out["operations"] = std::move(operations);

  Value dependencies;
  auto& edges = *dependencies.mutable_struct_value()->mutable_fields();
  for (const auto& [id, inputs] : document.dependencies) {
    edges[id] = StringListValue(inputs);
  }
  out["dependencies"] = std::move(dependencies);

  return ToJson(root);
}

// ------------------------------------------------------------
// Provenance sidecars
// ------------------------------------------------------------

std::filesystem::path ProvenanceSidecarPath(const std::filesystem::path& artifact) {
  return std::filesystem::path(artifact.string() + kProvenanceSuffix);
}

bool IsProvenanceSidecar(const std::filesystem::path& path) {
  const auto        name   = path.filename().string();
  const std::string suffix = kProvenanceSuffix;
  return name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string EncodeProvenance(const Provenance& provenance) {
  Struct root;
  auto&  out        = *root.mutable_fields();
  out["id"]         = StringValue(provenance.id);
  out["operation"]  = StringValue(provenance.operation);
  out["input_ids"]  = StringListValue(provenance.input_ids);
  out["parameters"] = ParametersValue(provenance.parameters);
  return ToJson(root);
}

std::optional<Provenance> ReadProvenance(const std::filesystem::path& artifact) {
  const auto sidecar = ProvenanceSidecarPath(artifact);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sidecar, ec)) {
    return std::nullopt;
  }

  std::string json;
  try {
    json = ReadFile(sidecar);
  } catch (const std::runtime_error&) {
    return std::nullopt;
  }

  Struct root;
  if (!google::protobuf::util::JsonStringToMessage(json, &root).ok()) {
    return std::nullopt;
  }

  auto id        = GetString(root, "id");
  auto operation = GetString(root, "operation");
  auto inputs    = GetStringList(root, "input_ids");
  if (!id || !operation || !inputs) {
    return std::nullopt;
  }

  Provenance provenance;
  provenance.id         = *id;
  provenance.operation  = *operation;
  provenance.input_ids  = std::move(*inputs);
  provenance.parameters = GetParameters(root, "parameters").value_or(model::ParameterSet{});
  return provenance;
}

void WriteProvenance(const std::filesystem::path& artifact, const Provenance& provenance) {
  const auto    sidecar = ProvenanceSidecarPath(artifact);
  std::ofstream out(sidecar, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot write provenance sidecar " + sidecar.string());
  }
  out << EncodeProvenance(provenance);
  if (!out) {
    throw std::runtime_error("failed writing provenance sidecar " + sidecar.string());
  }
}

} // namespace mediacache::registry
