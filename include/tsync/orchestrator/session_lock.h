#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace tsync::orchestrator {

// Exclusive cross-process lock primitive. Production code uses an advisory
// file lock; tests substitute their own.
class LockResource {
 public:
  virtual ~LockResource() = default;

  // Waits up to |timeout| for the exclusive lock. Returns false on timeout or
  // when |should_abort| returns true. A zero |timeout| still tries twice, a
  // short pause apart, so a concurrent IsHeld() check cannot fail it. Throws Error{Lock, kOpenFailed} when the
  // underlying resource cannot be opened.
  virtual bool TryLockFor(std::chrono::milliseconds timeout,
                          const std::function<bool()>& should_abort) = 0;
  virtual void Unlock() noexcept = 0;

  // True when this resource or any other holder currently owns the lock.
  // Never acquires it for longer than the check itself.
  [[nodiscard]] virtual bool IsHeld() = 0;

  [[nodiscard]] virtual std::string Describe() const = 0;
};

// flock(2) on a lock file. The kernel drops the lock when the holder exits.
class FileLockResource final : public LockResource {
 public:
  explicit FileLockResource(std::filesystem::path path,
                            std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
  ~FileLockResource() override;

  FileLockResource(const FileLockResource&) = delete;
  FileLockResource& operator=(const FileLockResource&) = delete;

  bool TryLockFor(std::chrono::milliseconds timeout,
                  const std::function<bool()>& should_abort) override;
  void Unlock() noexcept override;
  bool IsHeld() override;
  std::string Describe() const override;

 private:
  std::filesystem::path path_;
  std::chrono::milliseconds poll_interval_;
  int fd_{-1};
};

// Move-only ownership of an acquired LockResource; released exactly once, on
// Release() or destruction, whichever comes first.
class ScopedSessionLock {
 public:
  ScopedSessionLock() = default;
  ScopedSessionLock(const ScopedSessionLock&) = delete;
  ScopedSessionLock& operator=(const ScopedSessionLock&) = delete;
  ScopedSessionLock(ScopedSessionLock&& other) noexcept;
  ScopedSessionLock& operator=(ScopedSessionLock&& other) noexcept;
  ~ScopedSessionLock();

  // Throws Error{Lock, kTimeout} when the lock is not obtained within
  // |timeout|, or Error{Interrupted} when |should_abort| fires while waiting.
  [[nodiscard]] static ScopedSessionLock Acquire(LockResource& resource,
                                                 std::chrono::milliseconds timeout,
                                                 const std::function<bool()>& should_abort = {});

  [[nodiscard]] bool locked() const noexcept { return resource_ != nullptr; }
  explicit operator bool() const noexcept { return locked(); }

  void Release() noexcept;

 private:
  explicit ScopedSessionLock(LockResource* resource) noexcept : resource_(resource) {}

  LockResource* resource_{nullptr};
};

}  // namespace tsync::orchestrator
