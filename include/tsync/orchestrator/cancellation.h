#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>

namespace tsync::orchestrator {

// Shared cancellation flag. Copies observe the same state. The stored value is
// the signal number that requested cancellation (or -1 for a programmatic
// request), 0 while not cancelled.
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<std::atomic<int>>(0)) {}

  void Cancel(int reason = -1) noexcept {
    int expected = 0;
    state_->compare_exchange_strong(expected, reason == 0 ? -1 : reason, std::memory_order_acq_rel);
  }

  [[nodiscard]] bool IsCancelled() const noexcept {
    return state_->load(std::memory_order_acquire) != 0;
  }

  // Signal number that cancelled the token, or 0.
  [[nodiscard]] int signal() const noexcept {
    const int value = state_->load(std::memory_order_acquire);
    return value > 0 ? value : 0;
  }

  // Sleeps up to |duration| in short slices; returns false when cancelled first.
  bool SleepFor(std::chrono::milliseconds duration) const;

 private:
  friend class SignalCancellationScope;

  std::shared_ptr<std::atomic<int>> state_;
};

// Routes SIGINT and SIGTERM into |token| for the lifetime of the scope and
// restores the previous dispositions afterwards. Only one scope may be active.
class SignalCancellationScope {
 public:
  explicit SignalCancellationScope(CancellationToken token);
  ~SignalCancellationScope();

  SignalCancellationScope(const SignalCancellationScope&) = delete;
  SignalCancellationScope& operator=(const SignalCancellationScope&) = delete;

 private:
  CancellationToken token_;
  std::atomic<int>* previous_target_{nullptr};
  struct sigaction old_int_ {};
  struct sigaction old_term_ {};
};

}  // namespace tsync::orchestrator
