#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <thread>

#include "internal/dispatch/handler.hpp"

namespace relay::dispatch {

/*
  Runs one handler call under a hard time box.

  The call runs on its own thread; if it has not answered within timeout
  the outcome is kTransientFailure and the call is left to finish on its
  own (its late result is dropped). At most one call is in flight: while a
  timed-out call is still running, Invoke() reports kTransientFailure
  without starting the handler. A zero timeout runs the handler inline.

  The destructor joins a call that is still running.

  Handler exceptions are mapped to outcomes here, so callers only see
  HandlerOutcome. Exceptions not derived from std::exception propagate.
*/
class HandlerInvoker {
 public:
  explicit HandlerInvoker(std::chrono::milliseconds timeout);
  ~HandlerInvoker();

  HandlerInvoker(const HandlerInvoker&)            = delete;
  HandlerInvoker& operator=(const HandlerInvoker&) = delete;

  HandlerOutcome Invoke(const Handler& handler, const relay::model::Update& update);

  // True while a timed-out call is still running.
  bool Busy();

  // Waits up to limit for a timed-out call to return. True when none is left.
  bool WaitIdle(std::chrono::milliseconds limit);

  std::chrono::milliseconds timeout() const {
    return timeout_;
  }

 private:
  // Joins the abandoned call if it has returned. Caller holds mutex_.
  bool ReapLocked();

  std::chrono::milliseconds timeout_;

  std::mutex                         mutex_;
  std::thread                        abandoned_;
  std::shared_future<HandlerOutcome> abandoned_result_;
  int64_t                            abandoned_id_ = 0;
};

} // namespace relay::dispatch
