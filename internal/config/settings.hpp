#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"
#include "internal/queue/queue_processor.hpp"
#include "internal/retention/retention_sweeper.hpp"

namespace relay::config {

/*
  Tunables resolved from RuntimeConfig with defaults filled in.

  Unset optional fields take the defaults below; explicitly set values
  are validated and rejected with util::ConfigurationError.
*/
struct Settings {
  // Empty means the in-memory backend.
  std::string sqlite_path;

  queue::QueueOptions         queue;
  std::chrono::milliseconds   connectivity_check_interval{std::chrono::minutes(5)};
  retention::RetentionOptions retention;
};

Settings ResolveSettings(const relay::runtime::config::RuntimeConfig& config);

} // namespace relay::config
