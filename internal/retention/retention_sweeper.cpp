#include "internal/retention/retention_sweeper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/offset/offset_store.hpp"
#include "internal/util/errors.hpp"

namespace relay::retention {

using relay::observability::StringField;

RetentionSweeper::RetentionSweeper(std::shared_ptr<relay::offset::OffsetStore> store, RetentionOptions options)
    : store_(std::move(store)), options_(options) {
  if (!store_) {
    throw util::ConfigurationError("retention sweeper requires an offset store");
  }
  if (options_.window.count() <= 0 || options_.sweep_interval.count() <= 0) {
    throw util::ConfigurationError("retention window and sweep interval must be positive");
  }
}

std::optional<uint64_t> RetentionSweeper::SweepOnce() {
  try {
    return store_->Prune(options_.window);
  } catch (const util::StorageError& e) {
    RELAY_LOG_ERROR("ledger prune failed; retrying next sweep", {StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace relay::retention
