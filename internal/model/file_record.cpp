#include "file_record.hpp"

namespace mediacache::model {

const char* CategoryName(FileCategory category) {
  switch (category) {
    case FileCategory::kSource:
      return "source";
    case FileCategory::kGenerated:
      return "generated";
    case FileCategory::kMetadata:
      return "metadata";
  }
  return "unknown";
}

} // namespace mediacache::model
