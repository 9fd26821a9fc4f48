#include "internal/runtime/periodic_task.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relay::runtime {

using relay::observability::DurationField;
using relay::observability::StringField;

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {
  if (interval_.count() <= 0) {
    throw util::ConfigurationError("periodic task " + name_ + " needs a positive interval");
  }
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&PeriodicTask::Loop, this);
  RELAY_LOG_INFO("periodic task started", {StringField("task", name_), DurationField("interval", interval_)});
}

void PeriodicTask::Stop() {
  stop_.Stop();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

void PeriodicTask::Loop() {
  while (!stop_.WaitFor(interval_)) {
    try {
      fn_();
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("periodic task failed", {StringField("task", name_), StringField("error", e.what())});
    }
    runs_++;
  }
}

} // namespace relay::runtime
