#pragma once

#include <cstdint>

namespace relay::db::model {

// Singleton row (id = 1). last_update_id never decreases.
struct CursorRecord {
  int64_t  last_update_id         = 0;
  uint64_t last_processed_time_ms = 0;
  uint64_t created_at_ms          = 0;
};

} // namespace relay::db::model
