#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "internal/runtime/stop_signal.hpp"

namespace relay::runtime {

/*
  Runs a callback on its own thread once per interval.

  The first run happens one interval after Start(). Exceptions thrown by
  the callback are logged; the schedule continues. Stop() interrupts the
  wait immediately and joins (a callback already running finishes first).
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  uint64_t Runs() const {
    return runs_.load();
  }

 private:
  void Loop();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     fn_;

  StopSignal            stop_;
  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> runs_{0};
};

} // namespace relay::runtime
