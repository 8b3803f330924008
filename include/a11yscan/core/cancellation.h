#pragma once

#include <atomic>

namespace a11yscan::core {

// CancellationToken is a one-way flag shared between a caller and a long-running
// operation. Once cancelled it stays cancelled. Thread-safe.
class CancellationToken {
 public:
  CancellationToken() = default;

  // Non-copyable, non-movable (contains atomic flag; callers share it by reference)
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;
  CancellationToken(CancellationToken&&) = delete;
  CancellationToken& operator=(CancellationToken&&) = delete;
  ~CancellationToken() = default;

  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

  [[nodiscard]] bool is_cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace a11yscan::core
