#include "internal/dispatch/handler_invoker.hpp"

#include <exception>
#include <future>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relay::dispatch {

using relay::observability::DurationField;
using relay::observability::IntField;
using relay::observability::StringField;

const char* ToString(HandlerOutcome outcome) {
  switch (outcome) {
    case HandlerOutcome::kSuccess:
      return "success";
    case HandlerOutcome::kPermanentFailure:
      return "permanent_failure";
    case HandlerOutcome::kTransientFailure:
      return "transient_failure";
  }
  return "unknown";
}

namespace {

HandlerOutcome RunMapped(const Handler& handler, const relay::model::Update& update) {
  try {
    return handler(update);
  } catch (const util::TransientDeliveryError& e) {
    RELAY_LOG_WARN("handler reported transient failure", {IntField("update_id", update.id), StringField("error", e.what())});
    return HandlerOutcome::kTransientFailure;
  } catch (const util::PermanentDeliveryError& e) {
    RELAY_LOG_WARN("handler reported permanent failure", {IntField("update_id", update.id), StringField("error", e.what())});
    return HandlerOutcome::kPermanentFailure;
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("handler threw", {IntField("update_id", update.id), StringField("error", e.what())});
    return HandlerOutcome::kPermanentFailure;
  }
}

} // namespace

HandlerInvoker::HandlerInvoker(std::chrono::milliseconds timeout) : timeout_(timeout) {
}

HandlerInvoker::~HandlerInvoker() {
  std::lock_guard lock(mutex_);
  if (abandoned_.joinable()) {
    RELAY_LOG_WARN("waiting for timed-out handler call to return", {IntField("update_id", abandoned_id_)});
    abandoned_.join();
  }
}

bool HandlerInvoker::ReapLocked() {
  if (!abandoned_.joinable()) {
    return true;
  }
  if (abandoned_result_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
    return false;
  }
  abandoned_.join();
  abandoned_result_ = {};
  RELAY_LOG_INFO("timed-out handler call returned; result dropped", {IntField("update_id", abandoned_id_)});
  return true;
}

bool HandlerInvoker::Busy() {
  std::lock_guard lock(mutex_);
  return !ReapLocked();
}

bool HandlerInvoker::WaitIdle(std::chrono::milliseconds limit) {
  std::shared_future<HandlerOutcome> pending;
  {
    std::lock_guard lock(mutex_);
    if (ReapLocked()) return true;
    pending = abandoned_result_;
  }

  if (pending.wait_for(limit) != std::future_status::ready) {
    return false;
  }
  std::lock_guard lock(mutex_);
  return ReapLocked();
}

HandlerOutcome HandlerInvoker::Invoke(const Handler& handler, const relay::model::Update& update) {
  {
    std::lock_guard lock(mutex_);
    if (!ReapLocked()) {
      RELAY_LOG_WARN("previous handler call still running; not dispatching",
                     {IntField("update_id", update.id), IntField("running_update_id", abandoned_id_)});
      return HandlerOutcome::kTransientFailure;
    }
  }

  if (timeout_.count() <= 0) {
    return RunMapped(handler, update);
  }

  // The worker owns copies of everything it touches: it may outlive this call.
  std::packaged_task<HandlerOutcome()> task([handler, update] { return RunMapped(handler, update); });
  auto                                 result = task.get_future().share();
  std::thread                          worker(std::move(task));

  if (result.wait_for(timeout_) == std::future_status::ready) {
    worker.join();
    return result.get();
  }

  RELAY_LOG_WARN("handler timed out", {IntField("update_id", update.id), StringField("kind", update.kind),
                                       DurationField("timeout", timeout_)});
  std::lock_guard lock(mutex_);
  abandoned_        = std::move(worker);
  abandoned_result_ = std::move(result);
  abandoned_id_     = update.id;
  return HandlerOutcome::kTransientFailure;
}

} // namespace relay::dispatch
