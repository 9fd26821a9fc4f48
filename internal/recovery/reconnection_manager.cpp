#include "internal/recovery/reconnection_manager.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/source/connectivity_probe.hpp"
#include "internal/util/errors.hpp"

namespace relay::recovery {

using relay::model::ConnectionState;
using relay::observability::IntField;
using relay::observability::StringField;

ReconnectionManager::ReconnectionManager(std::shared_ptr<relay::queue::QueueProcessor>     processor,
                                         std::shared_ptr<relay::source::ConnectivityProbe> probe)
    : processor_(std::move(processor)), probe_(std::move(probe)) {
  if (!processor_ || !probe_) {
    throw util::ConfigurationError("reconnection manager requires a queue processor and a connectivity probe");
  }
}

ConnectionState ReconnectionManager::State() const {
  std::lock_guard lock(state_mutex_);
  return state_;
}

uint64_t ReconnectionManager::Recoveries() const {
  std::lock_guard lock(state_mutex_);
  return recoveries_;
}

std::optional<relay::queue::BacklogResult> ReconnectionManager::LastRecovery() const {
  std::lock_guard lock(state_mutex_);
  return last_recovery_;
}

void ReconnectionManager::TransitionTo(ConnectionState next) {
  std::lock_guard lock(state_mutex_);
  if (state_ == next) return;
  if (!relay::model::CanTransition(state_, next)) {
    throw std::logic_error(std::string("invalid connection transition ") + relay::model::ToString(state_) + " -> " +
                           relay::model::ToString(next));
  }
  RELAY_LOG_INFO("connection state changed", {StringField("from", relay::model::ToString(state_)), StringField("to", relay::model::ToString(next))});
  state_ = next;
}

bool ReconnectionManager::RunProbe() {
  try {
    if (probe_->Probe()) {
      return true;
    }
    RELAY_LOG_WARN("connectivity probe failed");
  } catch (const util::ConnectivityError& e) {
    RELAY_LOG_WARN("connectivity probe failed", {StringField("error", e.what())});
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("connectivity probe raised an unexpected error", {StringField("error", e.what())});
  }
  return false;
}

std::optional<relay::queue::BacklogResult> ReconnectionManager::InitialCheck(const relay::dispatch::HandlerRegistry& handlers) {
  std::lock_guard check_lock(check_mutex_);

  if (!RunProbe()) {
    RELAY_LOG_WARN("source unreachable at startup; backlog waits for recovery");
    TransitionTo(ConnectionState::kDisconnected);
    return std::nullopt;
  }

  try {
    auto result = processor_->ProcessBacklog(handlers);
    if (result.source_error) {
      TransitionTo(ConnectionState::kDisconnected);
    }
    return result;
  } catch (const util::StorageError& e) {
    RELAY_LOG_ERROR("startup backlog drain failed; will retry on next check", {StringField("error", e.what())});
    TransitionTo(ConnectionState::kDisconnected);
  }
  return std::nullopt;
}

bool ReconnectionManager::CheckConnectionAndRecover(const relay::dispatch::HandlerRegistry& handlers) {
  std::lock_guard check_lock(check_mutex_);

  if (!RunProbe()) {
    TransitionTo(ConnectionState::kDisconnected);
    return false;
  }

  if (State() == ConnectionState::kConnected) {
    RELAY_LOG_DEBUG("connectivity probe ok");
    return true;
  }

  TransitionTo(ConnectionState::kRecovering);
  RELAY_LOG_INFO("reconnected; replaying backlog");

  try {
    auto result = processor_->ProcessBacklog(handlers);
    {
      std::lock_guard lock(state_mutex_);
      if (!result.source_error) recoveries_++;
      last_recovery_ = result;
    }
    RELAY_LOG_INFO("backlog replay finished", {IntField("processed", static_cast<int64_t>(result.processed)),
                                               IntField("failed", static_cast<int64_t>(result.failed))});
    if (result.source_error) {
      RELAY_LOG_WARN("backlog replay could not reach the source; will retry on next check");
      TransitionTo(ConnectionState::kDisconnected);
    } else {
      TransitionTo(ConnectionState::kConnected);
    }
  } catch (const util::StorageError& e) {
    RELAY_LOG_ERROR("backlog replay aborted by storage error; will retry on next check", {StringField("error", e.what())});
    TransitionTo(ConnectionState::kDisconnected);
  }

  // The probe succeeded either way.
  return true;
}

} // namespace relay::recovery
