#include "tsync/orchestrator/session_lock.h"

#include <atomic>
#include <thread>
#include <utility>
#include <vector>

#include "tsync/error.h"
#include "test_support.h"

namespace {

using namespace std::chrono_literals;
using tsync::orchestrator::FileLockResource;
using tsync::orchestrator::LockResource;
using tsync::orchestrator::ScopedSessionLock;
using tsync_test::Expect;
using tsync_test::TempDir;

class CountingLock final : public LockResource {
 public:
  bool TryLockFor(std::chrono::milliseconds, const std::function<bool()>&) override {
    ++locks;
    return true;
  }
  void Unlock() noexcept override { ++unlocks; }
  bool IsHeld() override { return locks > unlocks; }
  std::string Describe() const override { return "counting"; }

  int locks{0};
  int unlocks{0};
};

void TestSecondHolderTimesOut() {
  TempDir dir("tsync_lock_");
  const auto path = dir.path() / "locks" / "sync.lock";
  FileLockResource first(path, 10ms);
  FileLockResource second(path, 10ms);

  Expect(!second.IsHeld(), "nothing holds the lock before acquisition");
  auto held = ScopedSessionLock::Acquire(first, 0ms);
  Expect(held.locked(), "first holder acquires immediately");
  Expect(std::filesystem::exists(path), "lock file created with parents");
  Expect(second.IsHeld(), "observer sees the lock as held");

  const auto started = std::chrono::steady_clock::now();
  try {
    (void)ScopedSessionLock::Acquire(second, 150ms);
    Expect(false, "second holder must time out");
  } catch (const tsync::Error& err) {
    Expect(err.domain == tsync::ErrorDomain::Lock, "lock domain");
    Expect(err.code == tsync::errors::lock::kTimeout, "timeout code");
    Expect(!err.context.empty() && err.context.front() == path.string(), "context names the file");
  }
  Expect(std::chrono::steady_clock::now() - started >= 150ms, "waited the full timeout");

  held.Release();
  Expect(!second.IsHeld(), "released lock is free");
  auto taken_over = ScopedSessionLock::Acquire(second, 0ms);
  Expect(taken_over.locked(), "second holder acquires after release");
}

void TestMissingLockFileIsNotHeld() {
  TempDir dir("tsync_lock_");
  FileLockResource observer(dir.path() / "never-created.lock");
  Expect(!observer.IsHeld(), "missing file is not held");
  Expect(!std::filesystem::exists(dir.path() / "never-created.lock"), "IsHeld does not create");
}

void TestMoveReleasesOnce() {
  CountingLock lock;
  {
    auto a = ScopedSessionLock::Acquire(lock, 0ms);
    ScopedSessionLock b(std::move(a));
    Expect(!a.locked(), "moved-from guard is empty");
    Expect(b.locked(), "moved-to guard owns the lock");
    ScopedSessionLock c;
    c = std::move(b);
    c.Release();
    c.Release();
  }
  Expect(lock.locks == 1, "locked once");
  Expect(lock.unlocks == 1, "unlocked exactly once");
}

void TestAbortWhileWaiting() {
  TempDir dir("tsync_lock_");
  const auto path = dir.path() / "sync.lock";
  FileLockResource holder(path, 10ms);
  FileLockResource waiter(path, 10ms);
  auto held = ScopedSessionLock::Acquire(holder, 0ms);

  std::atomic<bool> abort{false};
  std::thread trigger([&] {
    std::this_thread::sleep_for(50ms);
    abort = true;
  });
  const auto started = std::chrono::steady_clock::now();
  try {
    (void)ScopedSessionLock::Acquire(waiter, 10s, [&] { return abort.load(); });
    Expect(false, "abort must interrupt the wait");
  } catch (const tsync::Error& err) {
    Expect(err.domain == tsync::ErrorDomain::Interrupted, "interrupted domain");
  }
  trigger.join();
  Expect(std::chrono::steady_clock::now() - started < 5s, "abort cut the wait short");
}

void TestHoldersNeverOverlap() {
  TempDir dir("tsync_lock_");
  const auto path = dir.path() / "sync.lock";
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};
  std::atomic<int> completed{0};

  std::vector<std::thread> workers;
  for (int i = 0; i < 4; ++i) {
    workers.emplace_back([&] {
      FileLockResource resource(path, 5ms);
      for (int round = 0; round < 5; ++round) {
        auto guard = ScopedSessionLock::Acquire(resource, 10s);
        const int now = ++inside;
        int seen = max_inside.load();
        while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(2ms);
        --inside;
        guard.Release();
        ++completed;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  Expect(max_inside.load() == 1, "at most one holder at a time");
  Expect(completed.load() == 20, "every round completed");
}

void TestZeroTimeoutSurvivesStatusCheck() {
  TempDir dir("tsync_lock_");
  const auto path = dir.path() / "sync.lock";
  FileLockResource runner(path, 10ms);
  FileLockResource checker(path, 10ms);

  // A status check holding the lock for a moment at the instant of acquisition.
  for (int round = 0; round < 3; ++round) {
    auto brief = ScopedSessionLock::Acquire(checker, 0ms);
    std::thread release([&] {
      std::this_thread::sleep_for(5ms);
      brief.Release();
    });
    auto guard = ScopedSessionLock::Acquire(runner, 0ms);
    release.join();
    Expect(guard.locked(), "zero timeout rides out a momentary holder");
  }

  std::atomic<bool> stop{false};
  std::thread monitor([&] {
    FileLockResource observer(path, 10ms);
    while (!stop.load()) {
      (void)observer.IsHeld();
      std::this_thread::sleep_for(1ms);
    }
  });
  int acquired = 0;
  for (int i = 0; i < 200; ++i) {
    try {
      auto guard = ScopedSessionLock::Acquire(runner, 0ms);
      acquired += guard.locked() ? 1 : 0;
    } catch (const tsync::Error&) {
      break;
    }
  }
  stop = true;
  monitor.join();
  Expect(acquired == 200, "status polling never fails a zero-timeout run");

  auto held = ScopedSessionLock::Acquire(checker, 0ms);
  const auto started = std::chrono::steady_clock::now();
  try {
    (void)ScopedSessionLock::Acquire(runner, 0ms);
    Expect(false, "a real holder still times out");
  } catch (const tsync::Error& err) {
    Expect(err.domain == tsync::ErrorDomain::Lock, "lock domain");
  }
  Expect(std::chrono::steady_clock::now() - started < 1s, "zero timeout stays short");
}

}  // namespace

int main() {
  TestSecondHolderTimesOut();
  TestMissingLockFileIsNotHeld();
  TestMoveReleasesOnce();
  TestAbortWhileWaiting();
  TestHoldersNeverOverlap();
  TestZeroTimeoutSurvivesStatusCheck();
  std::cout << "session lock tests ok\n";
  return 0;
}
