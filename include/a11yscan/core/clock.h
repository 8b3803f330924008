#pragma once

#include "a11yscan/core/time.h"

#include <chrono>
#include <mutex>

namespace a11yscan::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current instant (UTC).
  virtual Timestamp now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// Fixed clock: returns a constant instant for deterministic tests.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Timestamp fixed_time) : fixed_time_(fixed_time) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  Timestamp now() override;

 private:
  Timestamp fixed_time_;
};

// Stepping clock: starts at a fixed instant and advances by a fixed step on every
// call to now(). Gives deterministic, non-zero durations in tests. Thread-safe.
class SteppingClock final : public IClock {
 public:
  SteppingClock(Timestamp start, std::chrono::milliseconds step) : next_(start), step_(step) {}
  ~SteppingClock() override = default;

  // Not copyable or movable (contains mutex)
  SteppingClock(const SteppingClock&) = delete;
  SteppingClock& operator=(const SteppingClock&) = delete;
  SteppingClock(SteppingClock&&) = delete;
  SteppingClock& operator=(SteppingClock&&) = delete;

  Timestamp now() override;

 private:
  std::mutex mutex_;
  Timestamp next_;
  std::chrono::milliseconds step_;
};

}  // namespace a11yscan::core
