#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace mediacache::util {

/*
  On-disk signature of a file. Staleness detection compares these, never
  file contents.
*/
struct FileStat {
  uint64_t size_bytes = 0;
  int64_t  mtime_ms   = 0;

  bool operator==(const FileStat& other) const {
    return size_bytes == other.size_bytes && mtime_ms == other.mtime_ms;
  }
  bool operator!=(const FileStat& other) const {
    return !(*this == other);
  }
};

// nullopt when the path does not name an existing regular file.
std::optional<FileStat> StatFile(const std::filesystem::path& path);

bool IsRegularFile(const std::filesystem::path& path);

// Absolute, lexically normalized form used as the registry's path key.
std::filesystem::path NormalizePath(const std::filesystem::path& path);

} // namespace mediacache::util
