#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace fieldsync::util {

/*
  Time utilities: single place to control clock source.

  Managers take a Clock so tests can pin timestamps.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

class Clock {
 public:
  virtual ~Clock() = default;

  virtual uint64_t NowMs() const = 0;
};

// Raises last_ms to raw_ms when raw_ms is newer and returns the result, so
// callers never observe time going backwards.
uint64_t ClampForward(std::atomic<uint64_t>& last_ms, uint64_t raw_ms);

// System time in unix millis, clamped so a backwards clock step repeats the
// last reading instead of returning an earlier one.
class WallClock final : public Clock {
 public:
  uint64_t NowMs() const override;

 private:
  mutable std::atomic<uint64_t> last_ms_{0};
};

// Test clock; only moves when told to.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t start_ms = 0) : now_ms_(start_ms) {
  }

  uint64_t NowMs() const override {
    return now_ms_.load();
  }

  void Set(uint64_t now_ms) {
    now_ms_.store(now_ms);
  }

  void Advance(uint64_t delta_ms) {
    now_ms_.fetch_add(delta_ms);
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

} // namespace fieldsync::util
