#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace relay::offset {
class OffsetStore;
}

namespace relay::retention {

struct RetentionOptions {
  std::chrono::milliseconds window{std::chrono::hours(24 * 7)};
  std::chrono::milliseconds sweep_interval{std::chrono::hours(24)};
};

/*
  Bounds ledger growth by pruning entries older than the retention window.

  Independent of the cursor and of any running drain. A failed sweep is
  logged and simply retried on the next tick.
*/
class RetentionSweeper {
 public:
  RetentionSweeper(std::shared_ptr<relay::offset::OffsetStore> store, RetentionOptions options = {});

  // Deleted entry count, or nullopt when the prune failed.
  std::optional<uint64_t> SweepOnce();

  const RetentionOptions& options() const {
    return options_;
  }

 private:
  std::shared_ptr<relay::offset::OffsetStore> store_;
  RetentionOptions                            options_;
};

} // namespace relay::retention
