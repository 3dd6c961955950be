#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace mediacache::runtime::config {
class RuntimeConfig;
}

namespace mediacache::observability {

// Lines are "<message> key=value key=value". Registry code uses the keys
// `id`, `path`, `operation` and `reason` consistently so a run can be
// followed per artifact with grep.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Media file names often contain spaces; those values are quoted.
LogField PathField(std::string_view key, const std::filesystem::path& value);

// The `mediacache` logger writes to stderr so CLI output on stdout stays
// parseable. MEDIACACHE_LOG_LEVEL and MEDIACACHE_LOG_PATTERN override the
// `logging` config section. Warnings and above are flushed immediately.
void InitializeLogging(const mediacache::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// Cache hits and per-file scan decisions; silent at the default level.
inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace mediacache::observability

#define MEDIACACHE_LOG_DEBUG(message, ...) ::mediacache::observability::LogDebug((message), ##__VA_ARGS__)
#define MEDIACACHE_LOG_INFO(message, ...) ::mediacache::observability::LogInfo((message), ##__VA_ARGS__)
#define MEDIACACHE_LOG_WARN(message, ...) ::mediacache::observability::LogWarn((message), ##__VA_ARGS__)
#define MEDIACACHE_LOG_ERROR(message, ...) ::mediacache::observability::LogError((message), ##__VA_ARGS__)
