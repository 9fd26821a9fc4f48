#include "internal/runtime/periodic_task.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using relay::runtime::PeriodicTask;

void TestRunsRepeatedly() {
  std::atomic<int> calls{0};
  PeriodicTask     task("tick", std::chrono::milliseconds(10), [&calls] { calls++; });

  task.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  task.Stop();

  const int seen = calls.load();
  assert(seen >= 3);
  assert(task.Runs() == static_cast<uint64_t>(seen));

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(calls.load() == seen);
}

void TestFirstRunWaitsOneInterval() {
  std::atomic<int> calls{0};
  PeriodicTask     task("slow", std::chrono::hours(1), [&calls] { calls++; });

  task.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  auto started = std::chrono::steady_clock::now();
  task.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));
  assert(calls.load() == 0);
}

void TestExceptionsDoNotStopSchedule() {
  std::atomic<int> calls{0};
  PeriodicTask     task("flaky", std::chrono::milliseconds(10), [&calls] {
    calls++;
    throw std::runtime_error("boom");
  });

  task.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  task.Stop();

  assert(calls.load() >= 2);
}

void TestNonPositiveIntervalIsRejected() {
  bool threw = false;
  try {
    PeriodicTask task("bad", std::chrono::milliseconds(0), [] {});
  } catch (const relay::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestDestructorStops() {
  std::atomic<int> calls{0};
  {
    PeriodicTask task("scoped", std::chrono::milliseconds(5), [&calls] { calls++; });
    task.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
  }
  const int seen = calls.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  assert(calls.load() == seen);
}

} // namespace

int main() {
  TestRunsRepeatedly();
  TestFirstRunWaitsOneInterval();
  TestExceptionsDoNotStopSchedule();
  TestNonPositiveIntervalIsRejected();
  TestDestructorStops();

  std::cout << "relay_unit_periodic_task: pass\n";
  return 0;
}
