#pragma once

#include <atomic>
#include <chrono>

namespace sb {

// Simple cancellation handle
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Routes SIGINT to `cancel` until the guard goes out of scope; the previous
// handler is restored afterwards. Only one guard may be active at a time.
class InterruptGuard {
public:
  explicit InterruptGuard(Cancellation& cancel);
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard&) = delete;
  InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
  struct Impl;
  Impl* impl_;
};

// Sleeps for `total`, waking up every `tick` to observe `cancel`.
// Returns false when the wait ended because of cancellation.
bool wait_unless_cancelled(std::chrono::milliseconds total,
                           const Cancellation& cancel,
                           std::chrono::milliseconds tick = std::chrono::milliseconds(100));

} // namespace sb
