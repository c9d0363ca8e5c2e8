#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace snapshot::runtime::config {
class RuntimeConfig;
}

namespace snapshot::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Shorthand for the field every worker log line carries.
inline LogField CameraField(std::string_view camera_exid) {
  return StringField("camera", camera_exid);
}

void InitializeLogging(const snapshot::runtime::config::RuntimeConfig& config);

// Installs an already built logger as the default (tests capture output this way).
void InstallLogger(std::shared_ptr<spdlog::logger> logger);
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

} // namespace snapshot::observability

#define SNAPSHOT_LOG_DEBUG(message, ...) ::snapshot::observability::LogDebug((message), ##__VA_ARGS__)
#define SNAPSHOT_LOG_INFO(message, ...) ::snapshot::observability::LogInfo((message), ##__VA_ARGS__)
#define SNAPSHOT_LOG_WARN(message, ...) ::snapshot::observability::LogWarn((message), ##__VA_ARGS__)
#define SNAPSHOT_LOG_ERROR(message, ...) ::snapshot::observability::LogError((message), ##__VA_ARGS__)
