#include "time.hpp"

namespace relay::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t CutoffMillis(TimePoint now, std::chrono::milliseconds age) {
  const uint64_t now_ms = ToUnixMillis(now);
  if (age.count() <= 0) {
    return now_ms;
  }
  const auto age_ms = static_cast<uint64_t>(age.count());
  return age_ms >= now_ms ? 0 : now_ms - age_ms;
}

} // namespace relay::util
