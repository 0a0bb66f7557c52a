#include "time.hpp"

namespace ledger::util {

TimePoint MonotonicClock::Now() const {
  return SteadyClock::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::Advance(Millis delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

uint64_t ToMillis(TimePoint::duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

double ElapsedMillis(TimePoint start, TimePoint end) {
  return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace ledger::util
