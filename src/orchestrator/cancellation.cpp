#include "tsync/orchestrator/cancellation.h"

#include <algorithm>
#include <thread>

namespace tsync::orchestrator {
namespace {

std::atomic<std::atomic<int>*> g_signal_target{nullptr};

static_assert(std::atomic<int>::is_always_lock_free, "signal flag must be lock free");

void CancellationSignalHandler(int sig) {
  auto* target = g_signal_target.load(std::memory_order_acquire);
  if (!target) {
    return;
  }
  int expected = 0;
  target->compare_exchange_strong(expected, sig, std::memory_order_acq_rel);
}

constexpr std::chrono::milliseconds kSleepSlice{100};

}  // namespace

bool CancellationToken::SleepFor(std::chrono::milliseconds duration) const {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (!IsCancelled()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, kSleepSlice));
  }
  return false;
}

SignalCancellationScope::SignalCancellationScope(CancellationToken token)
    : token_(std::move(token)) {
  previous_target_ = g_signal_target.exchange(token_.state_.get(), std::memory_order_acq_rel);
  struct sigaction sa {};
  sa.sa_handler = CancellationSignalHandler;
  sigemptyset(&sa.sa_mask);
  // No SA_RESTART: blocking waits return EINTR and re-check the token.
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, &old_int_);
  sigaction(SIGTERM, &sa, &old_term_);
}

SignalCancellationScope::~SignalCancellationScope() {
  sigaction(SIGINT, &old_int_, nullptr);
  sigaction(SIGTERM, &old_term_, nullptr);
  g_signal_target.store(previous_target_, std::memory_order_release);
}

}  // namespace tsync::orchestrator
