#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/dispatch/handler.hpp"
#include "internal/dispatch/handler_invoker.hpp"
#include "internal/runtime/stop_signal.hpp"

namespace relay::offset {
class OffsetStore;
}
namespace relay::source {
class MessageSource;
}

namespace relay::queue {

struct QueueOptions {
  std::size_t               batch_size = 100;
  std::chrono::milliseconds inter_message_delay{100};
  std::chrono::milliseconds handler_timeout{std::chrono::seconds(30)};
};

struct BacklogResult {
  uint64_t processed = 0;  // handled, or no handler for the kind
  uint64_t failed    = 0;  // permanent failures (recorded, never retried)
  uint64_t skipped   = 0;  // already settled (at or below cursor, or in ledger)

  uint64_t pages             = 0;
  uint64_t pauses            = 0;
  uint64_t inter_page_pauses = 0;

  // id of the update whose transient failure ended the call
  std::optional<int64_t> stalled_at;
  bool                   cancelled    = false;
  bool                   source_error = false;

  // cursor when the call returned
  int64_t cursor = 0;
};

/*
  Drains pending updates strictly in ascending id order.

  The cursor advances one settled update at a time (ledger entry and
  cursor in one transaction), so it never passes an update whose fate is
  unknown. A transient failure stops the call at that update; the next
  call resumes exactly there.

  Drains are single-flight: a concurrent caller blocks until the running
  drain returns. RequestStop() ends the running drain after the update in
  progress and turns later calls into no-ops.

  Updates are handed to handlers one at a time. A handler call that timed
  out keeps the next dispatch from starting until it returns.

  util::StorageError from the store propagates; commits made before it
  stay in place.
*/
class QueueProcessor {
 public:
  QueueProcessor(std::shared_ptr<relay::offset::OffsetStore> store, std::shared_ptr<relay::source::MessageSource> source,
                 QueueOptions options = {});

  BacklogResult ProcessBacklog(const relay::dispatch::HandlerRegistry& handlers);

  void RequestStop();

  // Waits up to limit for a timed-out handler call to return.
  bool WaitForHandlers(std::chrono::milliseconds limit);

  const QueueOptions& options() const {
    return options_;
  }

 private:
  enum class Disposition { kSettled, kStalled };

  Disposition Dispatch(const relay::model::Update& update, const relay::dispatch::HandlerRegistry& handlers, BacklogResult& result);

  std::shared_ptr<relay::offset::OffsetStore>   store_;
  std::shared_ptr<relay::source::MessageSource> source_;
  QueueOptions                                  options_;
  relay::dispatch::HandlerInvoker               invoker_;

  std::mutex            drain_mutex_;
  runtime::StopSignal   stop_;
};

} // namespace relay::queue
