#include "tsync/orchestrator/session_lock.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "tsync/common.h"
#include "tsync/error.h"
#include "tsync/errors.h"

namespace tsync::orchestrator {
namespace {

// Returns 0 on success, EWOULDBLOCK when another holder owns it, errno otherwise.
int TryFlock(int fd) noexcept {
  while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN ? EWOULDBLOCK : errno;
  }
  return 0;
}

// IsHeld() on another descriptor holds the lock for the length of one flock
// call. Acquisition retries once after this pause before reporting a timeout.
constexpr std::chrono::milliseconds kStatusCheckGrace{20};

}  // namespace

FileLockResource::FileLockResource(std::filesystem::path path,
                                   std::chrono::milliseconds poll_interval)
    : path_(std::move(path)), poll_interval_(poll_interval) {}

FileLockResource::~FileLockResource() { Unlock(); }

bool FileLockResource::TryLockFor(std::chrono::milliseconds timeout,
                                  const std::function<bool()>& should_abort) {
  if (fd_ >= 0) {
    return true;
  }
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  const int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    const int saved = errno;
    throw Error{ErrorDomain::Lock, errors::lock::kOpenFailed,
                std::string(errors::msg::kLockOpenFailed) + ": " + PathToUtf8String(path_) + ": " +
                    std::strerror(saved),
                saved};
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool grace_used = false;
  while (true) {
    const int rc = TryFlock(fd);
    if (rc == 0) {
      fd_ = fd;
      return true;
    }
    if (rc != EWOULDBLOCK) {
      ::close(fd);
      throw Error{ErrorDomain::Lock, errors::lock::kOpenFailed,
                  std::string(errors::msg::kLockOpenFailed) + ": " + PathToUtf8String(path_) +
                      ": " + std::strerror(rc),
                  rc};
    }
    if (should_abort && should_abort()) {
      ::close(fd);
      return false;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      if (grace_used) {
        ::close(fd);
        return false;
      }
      grace_used = true;
      std::this_thread::sleep_for(kStatusCheckGrace);
      continue;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, poll_interval_));
  }
}

void FileLockResource::Unlock() noexcept {
  if (fd_ < 0) {
    return;
  }
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

bool FileLockResource::IsHeld() {
  if (fd_ >= 0) {
    return true;
  }
  const int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  const int rc = TryFlock(fd);
  if (rc == 0) {
    ::flock(fd, LOCK_UN);
  }
  ::close(fd);
  return rc == EWOULDBLOCK;
}

std::string FileLockResource::Describe() const { return PathToUtf8String(path_); }

ScopedSessionLock::ScopedSessionLock(ScopedSessionLock&& other) noexcept
    : resource_(std::exchange(other.resource_, nullptr)) {}

ScopedSessionLock& ScopedSessionLock::operator=(ScopedSessionLock&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  Release();
  resource_ = std::exchange(other.resource_, nullptr);
  return *this;
}

ScopedSessionLock::~ScopedSessionLock() { Release(); }

ScopedSessionLock ScopedSessionLock::Acquire(LockResource& resource,
                                             std::chrono::milliseconds timeout,
                                             const std::function<bool()>& should_abort) {
  if (resource.TryLockFor(timeout, should_abort)) {
    return ScopedSessionLock(&resource);
  }
  if (should_abort && should_abort()) {
    throw Error{ErrorDomain::Interrupted, errors::interrupted::kSignalled,
                std::string(errors::msg::kInterrupted) + " while waiting for lock"};
  }
  throw Error{ErrorDomain::Lock, errors::lock::kTimeout, std::string(errors::msg::kLockTimeout),
              std::nullopt, Retryability::kTransient, {resource.Describe()}};
}

void ScopedSessionLock::Release() noexcept {
  if (!resource_) {
    return;
  }
  resource_->Unlock();
  resource_ = nullptr;
}

}  // namespace tsync::orchestrator
