#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/parameter_set.hpp"

namespace mediacache::model {

enum class FileCategory {
  kSource,
  kGenerated,
  kMetadata,
};

const char* CategoryName(FileCategory category);

/*
  One tracked file.

  Sources only carry path/size/times; generated and metadata entries also
  carry their provenance (operation, ordered inputs, parameters). Every
  lookup and listing API hands out this type.
*/
struct FileRecord {
  FileCategory category = FileCategory::kSource;

  std::string id;
  std::string path;

  uint64_t size_bytes = 0;

  // epoch ms
  int64_t created_at_ms  = 0;
  int64_t modified_at_ms = 0;

  std::string              operation;
  std::vector<std::string> input_ids;
  ParameterSet             parameters;

  // A source this entry was derived from changed since it was produced.
  bool stale = false;

  // Fields found in the persisted document that this version does not know.
  google::protobuf::Struct unknown_fields;

  bool IsDerived() const {
    return category != FileCategory::kSource;
  }
};

} // namespace mediacache::model
