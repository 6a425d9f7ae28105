#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>
#include <utility>

namespace tsync::orchestrator {

// Fixed-interval retry. No backoff, no jitter.
struct RetryPolicy {
  std::uint32_t max_attempts{1};
  std::chrono::milliseconds interval{0};
};

// Blocks for the given duration. Returns false when the wait was cut short
// and the retry loop should stop.
using Sleeper = std::function<bool(std::chrono::milliseconds)>;

inline Sleeper ThreadSleeper() {
  return [](std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
    return true;
  };
}

struct RetryResult {
  bool succeeded{false};
  bool stopped{false};  // sleeper or attempt asked to stop early
  std::uint32_t attempts{0};
};

// Calls |attempt(n)| (n is 1-based) until it returns true or the policy is
// exhausted. |on_failure(n)| runs after every failed attempt, before the wait.
// The sleeper is not invoked after the final attempt.
template <class AttemptFn, class FailureFn>
RetryResult RetryWithFixedInterval(const RetryPolicy& policy, AttemptFn&& attempt,
                                   FailureFn&& on_failure, const Sleeper& sleeper) {
  RetryResult result;
  const std::uint32_t limit = policy.max_attempts == 0 ? 1 : policy.max_attempts;
  for (std::uint32_t n = 1; n <= limit; ++n) {
    result.attempts = n;
    if (std::invoke(attempt, n)) {
      result.succeeded = true;
      return result;
    }
    std::invoke(on_failure, n);
    if (n == limit) {
      break;
    }
    if (policy.interval.count() > 0 && sleeper && !sleeper(policy.interval)) {
      result.stopped = true;
      return result;
    }
  }
  return result;
}

}  // namespace tsync::orchestrator
