#include "a11yscan/core/clock.h"

namespace a11yscan::core {

Timestamp SystemClock::now() {
  return Clock::now();
}

Timestamp FixedClock::now() {
  return fixed_time_;
}

Timestamp SteppingClock::now() {
  std::lock_guard<std::mutex> lock(mutex_);
  const Timestamp current = next_;
  next_ += step_;
  return current;
}

}  // namespace a11yscan::core
