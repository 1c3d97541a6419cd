#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace upload::runtime::config {
class RuntimeConfig;
}

namespace upload::observability {

/*
  Structured logging over spdlog.

  Every line is "<message> key=value key=value ...", optionally followed by
  the active trace and span ids. Lines go to stderr; stdout carries the
  progress table.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// "134217728(128.0 MiB)"
LogField BytesField(std::string_view key, std::uint64_t bytes);

void InitializeLogging(const upload::runtime::config::RuntimeConfig& config);
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

} // namespace upload::observability

#define UPLOAD_LOG_DEBUG(message, ...) ::upload::observability::LogDebug((message), ##__VA_ARGS__)
#define UPLOAD_LOG_INFO(message, ...) ::upload::observability::LogInfo((message), ##__VA_ARGS__)
#define UPLOAD_LOG_WARN(message, ...) ::upload::observability::LogWarn((message), ##__VA_ARGS__)
#define UPLOAD_LOG_ERROR(message, ...) ::upload::observability::LogError((message), ##__VA_ARGS__)
