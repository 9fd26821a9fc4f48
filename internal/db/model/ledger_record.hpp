#pragma once

#include <cstdint>
#include <string>

namespace relay::db::model {

/*
  One durably settled update.

  message_id / chat_id of 0 are stored as NULL (updates without an
  attached message, e.g. inline queries).
*/
struct LedgerRecord {
  int64_t     update_id         = 0;
  int64_t     message_id        = 0;
  int64_t     chat_id           = 0;
  uint64_t    processed_time_ms = 0;
  std::string message_type;
};

} // namespace relay::db::model
