#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace relay::runtime::config {
class RuntimeConfig;
}

namespace relay::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

// Throws util::ConfigurationError on an unknown level or an unwritable log file.
void InitializeLogging(const relay::runtime::config::RuntimeConfig& config);
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

} // namespace relay::observability

#define RELAY_LOG_DEBUG(message, ...) ::relay::observability::LogDebug((message), ##__VA_ARGS__)
#define RELAY_LOG_INFO(message, ...) ::relay::observability::LogInfo((message), ##__VA_ARGS__)
#define RELAY_LOG_WARN(message, ...) ::relay::observability::LogWarn((message), ##__VA_ARGS__)
#define RELAY_LOG_ERROR(message, ...) ::relay::observability::LogError((message), ##__VA_ARGS__)
