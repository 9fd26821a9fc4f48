#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/dispatch/handler.hpp"
#include "internal/model/connection_state.hpp"
#include "internal/queue/queue_processor.hpp"

namespace relay::source {
class ConnectivityProbe;
}

namespace relay::recovery {

/*
  Connectivity state machine that replays the backlog on recovery.

  Each check runs the probe once. A failed probe (false or any exception)
  moves to kDisconnected. The first successful probe after that moves
  through kRecovering, runs exactly one backlog drain, and lands back in
  kConnected whatever the drain's failure count. If the drain throws
  (storage failure) or cannot fetch from the source, the manager falls
  back to kDisconnected so the next successful probe retries it.

  InitialCheck() decides the starting state: kConnected with a startup
  drain when the first probe succeeds, kDisconnected otherwise.

  Checks are serialized; nothing here is fatal to the caller.
*/
class ReconnectionManager {
 public:
  ReconnectionManager(std::shared_ptr<relay::queue::QueueProcessor> processor, std::shared_ptr<relay::source::ConnectivityProbe> probe);

  // Returns the startup drain, or nullopt when none ran to completion.
  std::optional<relay::queue::BacklogResult> InitialCheck(const relay::dispatch::HandlerRegistry& handlers);

  // Returns whether the source is reachable after this check.
  bool CheckConnectionAndRecover(const relay::dispatch::HandlerRegistry& handlers);

  relay::model::ConnectionState State() const;

  uint64_t Recoveries() const;

  // Outcome of the most recent recovery drain, if it returned.
  std::optional<relay::queue::BacklogResult> LastRecovery() const;

 private:
  bool RunProbe();
  void TransitionTo(relay::model::ConnectionState next);

  std::shared_ptr<relay::queue::QueueProcessor>     processor_;
  std::shared_ptr<relay::source::ConnectivityProbe> probe_;

  // serializes whole checks
  std::mutex check_mutex_;

  mutable std::mutex                         state_mutex_;
  relay::model::ConnectionState              state_      = relay::model::ConnectionState::kConnected;
  uint64_t                                   recoveries_ = 0;
  std::optional<relay::queue::BacklogResult> last_recovery_;
};

} // namespace relay::recovery
