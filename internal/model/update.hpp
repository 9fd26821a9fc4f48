#pragma once

#include <cstdint>
#include <string>

namespace relay::model {

// Well-known update kinds delivered by the bot API.
inline constexpr const char* kKindMessage       = "message";
inline constexpr const char* kKindCallbackQuery = "callback_query";
inline constexpr const char* kKindInlineQuery   = "inline_query";

/*
  One source-delivered event.

  id is strictly increasing across the source. message_id / chat_id are 0
  when the update has no attached message.
*/
struct Update {
  int64_t     id         = 0;
  int64_t     chat_id    = 0;
  int64_t     message_id = 0;
  std::string kind;
  std::string payload;
};

} // namespace relay::model
