#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace foreman::runtime::config {
class RuntimeConfig;
}

namespace foreman::observability {

/*
  Structured logging on top of spdlog.

  Messages are plain text followed by key=value fields; values containing
  whitespace or quotes are quoted so worker output can be logged safely.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const foreman::runtime::config::RuntimeConfig& config);
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

} // namespace foreman::observability

#define FOREMAN_LOG_DEBUG(message, ...) ::foreman::observability::LogDebug((message), ##__VA_ARGS__)
#define FOREMAN_LOG_INFO(message, ...) ::foreman::observability::LogInfo((message), ##__VA_ARGS__)
#define FOREMAN_LOG_WARN(message, ...) ::foreman::observability::LogWarn((message), ##__VA_ARGS__)
#define FOREMAN_LOG_ERROR(message, ...) ::foreman::observability::LogError((message), ##__VA_ARGS__)
