#include "internal/config/settings.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace relay::config {

namespace {

int RequirePositive(int value, const char* field) {
  if (value <= 0) {
    throw util::ConfigurationError(std::string(field) + " must be positive, got " + std::to_string(value));
  }
  return value;
}

int RequireNonNegative(int value, const char* field) {
  if (value < 0) {
    throw util::ConfigurationError(std::string(field) + " must not be negative, got " + std::to_string(value));
  }
  return value;
}

} // namespace

Settings ResolveSettings(const relay::runtime::config::RuntimeConfig& config) {
  Settings settings;

  if (config.database().has_sqlite()) {
    settings.sqlite_path = config.database().sqlite().path();
    if (settings.sqlite_path.empty()) {
      throw util::ConfigurationError("database.sqlite.path must not be empty");
    }
  }

  const auto& queue = config.queue();
  if (queue.has_batch_size()) {
    settings.queue.batch_size = static_cast<std::size_t>(RequirePositive(queue.batch_size(), "queue.batch_size"));
  }
  if (queue.has_inter_message_delay_ms()) {
    settings.queue.inter_message_delay =
        std::chrono::milliseconds(RequireNonNegative(queue.inter_message_delay_ms(), "queue.inter_message_delay_ms"));
  }
  if (queue.has_handler_timeout_seconds()) {
    settings.queue.handler_timeout =
        std::chrono::seconds(RequirePositive(queue.handler_timeout_seconds(), "queue.handler_timeout_seconds"));
  }

  const auto& reconnection = config.reconnection();
  if (reconnection.has_connectivity_check_interval_minutes()) {
    settings.connectivity_check_interval = std::chrono::minutes(
        RequirePositive(reconnection.connectivity_check_interval_minutes(), "reconnection.connectivity_check_interval_minutes"));
  }

  const auto& retention = config.retention();
  if (retention.has_retention_window_days()) {
    settings.retention.window =
        std::chrono::hours(24) * RequirePositive(retention.retention_window_days(), "retention.retention_window_days");
  }
  if (retention.has_sweep_interval_hours()) {
    settings.retention.sweep_interval =
        std::chrono::hours(RequirePositive(retention.sweep_interval_hours(), "retention.sweep_interval_hours"));
  }

  return settings;
}

} // namespace relay::config
