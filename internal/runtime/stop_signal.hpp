#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace relay::runtime {

/*
  Latching shutdown flag with interruptible sleeps.

  Once Stop() is called every pending and future WaitFor returns at once.
*/
class StopSignal {
 public:
  void Stop() {
    {
      std::lock_guard lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  bool Stopped() const {
    std::lock_guard lock(mutex_);
    return stopped_;
  }

  // Sleeps up to `duration`. Returns true if stopped (before or during the wait).
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> duration) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, duration, [&] { return stopped_; });
  }

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stopped_ = false;
};

} // namespace relay::runtime
