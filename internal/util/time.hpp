#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace ledger::util {

/*
  Time utilities: single place to control clock source.

  The ledger only ever compares time points taken from the same clock, so a
  monotonic clock is used everywhere. Tests inject ManualClock.
*/

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;
using Millis      = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class MonotonicClock final : public Clock {
 public:
  TimePoint Now() const override;
};

/*
  Clock that only moves when told to.
*/
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(1));

  TimePoint Now() const override;

  void Advance(Millis delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

uint64_t ToMillis(TimePoint::duration d);

double ElapsedMillis(TimePoint start, TimePoint end);

} // namespace ledger::util
