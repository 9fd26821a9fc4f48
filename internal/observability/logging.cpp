#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace relay::observability {
namespace {

constexpr const char* kLoggerName = "backlog-relay";

std::string ResolveLevel(const relay::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("RELAY_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const relay::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("RELAY_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

// spdlog maps unknown names to "off", which would silently drop every line.
spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw util::ConfigurationError("unknown log level: " + name);
  }
  return level;
}

std::vector<spdlog::sink_ptr> BuildSinks(const relay::runtime::config::RuntimeConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto& file = config.logging().file();
  if (!file.empty()) {
    const auto parent = std::filesystem::path(file).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw util::ConfigurationError("cannot create log directory " + parent.string() + ": " + ec.message());
      }
    }
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, /*truncate=*/false));
    } catch (const spdlog::spdlog_ex& e) {
      throw util::ConfigurationError("cannot open log file " + file + ": " + e.what());
    }
  }
  return sinks;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const relay::runtime::config::RuntimeConfig& config) {
  const auto level = ParseLevel(ResolveLevel(config));
  auto       sinks = BuildSinks(config);

  // set_default_logger replaces any logger left by an earlier call.
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  // Background threads may still log after ShutdownLogging().
  if (spdlog::default_logger_raw() == nullptr) {
    return;
  }

  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace relay::observability
