#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace blobkeep::runtime::config {
class RuntimeConfig;
}

namespace blobkeep::observability {

/*
  Structured logging on top of spdlog.

  Every message may carry key=value fields. Nothing needs to be
  initialized: before InitializeLogging runs, messages go to spdlog's
  default logger at info level.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the "blobkeep" stderr logger. Level and pattern come from
// BLOBKEEP_LOG_LEVEL / BLOBKEEP_LOG_PATTERN, then from `config`.
// Throws std::invalid_argument on an unknown level name.
void InitializeLogging(const blobkeep::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

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

} // namespace blobkeep::observability

#define BLOBKEEP_LOG_DEBUG(message, ...) ::blobkeep::observability::LogDebug((message), ##__VA_ARGS__)
#define BLOBKEEP_LOG_INFO(message, ...) ::blobkeep::observability::LogInfo((message), ##__VA_ARGS__)
#define BLOBKEEP_LOG_WARN(message, ...) ::blobkeep::observability::LogWarn((message), ##__VA_ARGS__)
#define BLOBKEEP_LOG_ERROR(message, ...) ::blobkeep::observability::LogError((message), ##__VA_ARGS__)
