#include "file_stat.hpp"

#include <sys/stat.h>

#include <system_error>

namespace mediacache::util {

std::optional<FileStat> StatFile(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return std::nullopt;
  }

  FileStat result;
  result.size_bytes = static_cast<uint64_t>(st.st_size);
  result.mtime_ms   = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + static_cast<int64_t>(st.st_mtim.tv_nsec) / 1000000;
  return result;
}

bool IsRegularFile(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

std::filesystem::path NormalizePath(const std::filesystem::path& path) {
  if (path.empty()) {
    return path;
  }
  std::error_code ec;
  auto            absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return absolute.lexically_normal();
}

} // namespace mediacache::util
