#include "internal/dispatch/handler_invoker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using relay::dispatch::HandlerInvoker;
using relay::dispatch::HandlerOutcome;
using relay::model::Update;

Update MakeUpdate(int64_t id) {
  return Update{.id = id, .chat_id = 1, .message_id = id, .kind = "message", .payload = "text"};
}

void TestReturnedOutcomesPassThrough() {
  HandlerInvoker invoker(std::chrono::milliseconds(500));

  assert(invoker.Invoke([](const Update&) { return HandlerOutcome::kSuccess; }, MakeUpdate(1)) == HandlerOutcome::kSuccess);
  assert(invoker.Invoke([](const Update&) { return HandlerOutcome::kPermanentFailure; }, MakeUpdate(2)) ==
         HandlerOutcome::kPermanentFailure);
  assert(invoker.Invoke([](const Update&) { return HandlerOutcome::kTransientFailure; }, MakeUpdate(3)) ==
         HandlerOutcome::kTransientFailure);
}

void TestExceptionsAreMapped() {
  for (auto timeout : {std::chrono::milliseconds(0), std::chrono::milliseconds(500)}) {
    HandlerInvoker invoker(timeout);

    auto transient = invoker.Invoke(
        [](const Update&) -> HandlerOutcome { throw relay::util::TransientDeliveryError("rate limited"); }, MakeUpdate(1));
    assert(transient == HandlerOutcome::kTransientFailure);

    auto permanent = invoker.Invoke(
        [](const Update&) -> HandlerOutcome { throw relay::util::PermanentDeliveryError("chat not found"); }, MakeUpdate(2));
    assert(permanent == HandlerOutcome::kPermanentFailure);

    auto generic = invoker.Invoke([](const Update&) -> HandlerOutcome { throw std::runtime_error("bug"); }, MakeUpdate(3));
    assert(generic == HandlerOutcome::kPermanentFailure);
  }
}

void TestSlowHandlerTimesOutAsTransient() {
  HandlerInvoker invoker(std::chrono::milliseconds(50));

  auto finished = std::make_shared<std::atomic<bool>>(false);
  auto started  = std::chrono::steady_clock::now();

  auto outcome = invoker.Invoke(
      [finished](const Update&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        finished->store(true);
        return HandlerOutcome::kSuccess;
      },
      MakeUpdate(9));

  assert(outcome == HandlerOutcome::kTransientFailure);
  assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(250));
  assert(!finished->load());

  // The abandoned call still completes on its own thread.
  assert(invoker.WaitIdle(std::chrono::seconds(2)));
  assert(finished->load());
  assert(!invoker.Busy());
}

void TestTimedOutCallBlocksNextInvoke() {
  HandlerInvoker invoker(std::chrono::milliseconds(50));

  auto release = std::make_shared<std::atomic<bool>>(false);
  auto slow    = invoker.Invoke(
      [release](const Update&) {
        while (!release->load()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return HandlerOutcome::kSuccess;
      },
      MakeUpdate(1));
  assert(slow == HandlerOutcome::kTransientFailure);
  assert(invoker.Busy());

  bool ran  = false;
  auto next = invoker.Invoke(
      [&ran](const Update&) {
        ran = true;
        return HandlerOutcome::kSuccess;
      },
      MakeUpdate(2));
  assert(next == HandlerOutcome::kTransientFailure);
  assert(!ran);
  assert(!invoker.WaitIdle(std::chrono::milliseconds(20)));

  release->store(true);
  assert(invoker.WaitIdle(std::chrono::seconds(2)));
  assert(!invoker.Busy());

  next = invoker.Invoke(
      [&ran](const Update&) {
        ran = true;
        return HandlerOutcome::kSuccess;
      },
      MakeUpdate(2));
  assert(next == HandlerOutcome::kSuccess);
  assert(ran);
}

void TestDestructorJoinsRunningCall() {
  auto finished = std::make_shared<std::atomic<bool>>(false);
  {
    HandlerInvoker invoker(std::chrono::milliseconds(20));
    auto           outcome = invoker.Invoke(
        [finished](const Update&) {
          std::this_thread::sleep_for(std::chrono::milliseconds(150));
          finished->store(true);
          return HandlerOutcome::kSuccess;
        },
        MakeUpdate(5));
    assert(outcome == HandlerOutcome::kTransientFailure);
  }
  assert(finished->load());
}

void TestInlineInvocationHasNoTimeBox() {
  HandlerInvoker invoker(std::chrono::milliseconds(0));

  auto outcome = invoker.Invoke(
      [](const Update&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return HandlerOutcome::kSuccess;
      },
      MakeUpdate(4));
  assert(outcome == HandlerOutcome::kSuccess);
}

} // namespace

int main() {
  TestReturnedOutcomesPassThrough();
  TestExceptionsAreMapped();
  TestSlowHandlerTimesOutAsTransient();
  TestTimedOutCallBlocksNextInvoke();
  TestDestructorJoinsRunningCall();
  TestInlineInvocationHasNoTimeBox();

  std::cout << "relay_unit_handler_invoker: pass\n";
  return 0;
}
