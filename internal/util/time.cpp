#include "time.hpp"

namespace fieldsync::util {

TimePoint Now() {
  return SystemClock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t ClampForward(std::atomic<uint64_t>& last_ms, uint64_t raw_ms) {
  uint64_t seen = last_ms.load();
  while (raw_ms > seen) {
    if (last_ms.compare_exchange_weak(seen, raw_ms)) return raw_ms;
  }
  return seen;
}

uint64_t WallClock::NowMs() const {
  return ClampForward(last_ms_, ToUnixMillis(Now()));
}

} // namespace fieldsync::util
