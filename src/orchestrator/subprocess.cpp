#include "tsync/orchestrator/subprocess.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "tsync/common.h"
#include "tsync/error.h"
#include "tsync/errors.h"

namespace tsync::orchestrator {
namespace {

constexpr std::size_t kMaxLineBytes = 16 * 1024;
constexpr int kPollSliceMs = 100;

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      Reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  ~UniqueFd() { Reset(); }

  int get() const noexcept { return fd_; }
  void Reset() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{-1};
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

Pipe MakePipe() {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    const int saved = errno;
    throw Error{ErrorDomain::Transfer, errors::transfer::kPipeFailed,
                std::string(errors::msg::kSpawnFailed) + ": pipe: " + std::strerror(saved), saved};
  }
  return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

std::vector<char*> MakeArgv(const std::vector<std::string>& argv) {
  std::vector<char*> raw;
  raw.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    raw.push_back(const_cast<char*>(arg.c_str()));
  }
  raw.push_back(nullptr);
  return raw;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void ExecChild(char* const* argv, int output_fd, int error_report_fd) {
  int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }
  ::dup2(output_fd, STDOUT_FILENO);
  ::dup2(output_fd, STDERR_FILENO);
  sigset_t empty;
  sigemptyset(&empty);
  ::sigprocmask(SIG_SETMASK, &empty, nullptr);
  ::signal(SIGINT, SIG_DFL);
  ::signal(SIGTERM, SIG_DFL);
  ::signal(SIGPIPE, SIG_DFL);
  ::execvp(argv[0], argv);
  const int saved = errno;
  ssize_t ignored = ::write(error_report_fd, &saved, sizeof(saved));
  (void)ignored;
  ::_exit(127);
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return 255;
}

class LineSplitter {
 public:
  explicit LineSplitter(const std::function<void(std::string_view)>& sink) : sink_(sink) {}

  void Feed(const char* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
      const char ch = data[i];
      if (ch == '\n' || ch == '\r') {
        Emit();
        continue;
      }
      pending_.push_back(ch);
      if (pending_.size() >= kMaxLineBytes) {
        Emit();
      }
    }
  }

  void Flush() { Emit(); }

 private:
  void Emit() {
    if (pending_.empty()) {
      return;
    }
    if (sink_) {
      sink_(pending_);
    }
    pending_.clear();
  }

  const std::function<void(std::string_view)>& sink_;
  std::string pending_;
};

// Returns false at EOF.
bool DrainAvailable(int fd, LineSplitter& splitter) {
  char buffer[4096];
  while (true) {
    const ssize_t rc = ::read(fd, buffer, sizeof(buffer));
    if (rc > 0) {
      splitter.Feed(buffer, static_cast<std::size_t>(rc));
      continue;
    }
    if (rc == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

// Waits for |pid| without blocking the caller beyond one poll slice.
std::optional<int> TryReap(pid_t pid) {
  while (true) {
    int status = 0;
    const pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      return DecodeStatus(status);
    }
    if (rc == 0) {
      return std::nullopt;
    }
    if (errno == EINTR) {
      continue;
    }
    return 255;
  }
}

int TerminateAndReap(pid_t pid, std::chrono::milliseconds grace) {
  ::kill(-pid, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (auto code = TryReap(pid)) {
      ::kill(-pid, SIGKILL);
      return *code;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  ::kill(-pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return 128 + SIGKILL;
    }
  }
  return DecodeStatus(status);
}

// Reads the exec error pipe. Returns the child's errno when exec failed.
std::optional<int> ReadExecError(int fd) {
  int child_errno = 0;
  while (true) {
    const ssize_t rc = ::read(fd, &child_errno, sizeof(child_errno));
    if (rc == static_cast<ssize_t>(sizeof(child_errno))) {
      return child_errno;
    }
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    return std::nullopt;
  }
}

[[noreturn]] void ThrowSpawnFailure(const std::string& program, int native) {
  throw Error{ErrorDomain::Transfer, errors::transfer::kSpawnFailed,
              std::string(errors::msg::kSpawnFailed) + ": " + program + ": " +
                  std::strerror(native),
              native};
}

}  // namespace

SubprocessResult RunSubprocess(const SubprocessOptions& options) {
  if (options.argv.empty()) {
    throw Error{ErrorDomain::Transfer, errors::transfer::kSpawnFailed,
                std::string(errors::msg::kSpawnFailed) + ": empty command"};
  }
  Pipe output = MakePipe();
  Pipe exec_error = MakePipe();
  auto argv = MakeArgv(options.argv);

  const pid_t pid = ::fork();
  if (pid < 0) {
    ThrowSpawnFailure(options.argv.front(), errno);
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    ExecChild(argv.data(), output.write.get(), exec_error.write.get());
  }
  // Set in the parent as well so a kill(-pid) cannot race the child's setpgid.
  ::setpgid(pid, pid);
  output.write.Reset();
  exec_error.write.Reset();

  if (auto child_errno = ReadExecError(exec_error.read.get())) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    ThrowSpawnFailure(options.argv.front(), *child_errno);
  }

  const int flags = ::fcntl(output.read.get(), F_GETFL);
  ::fcntl(output.read.get(), F_SETFL, flags | O_NONBLOCK);

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (options.timeout) {
    deadline = std::chrono::steady_clock::now() + *options.timeout;
  }

  SubprocessResult result;
  LineSplitter splitter(options.on_line);
  bool stream_open = true;
  while (true) {
    if (stream_open) {
      struct pollfd pfd {
        output.read.get(), POLLIN, 0
      };
      const int rc = ::poll(&pfd, 1, kPollSliceMs);
      if (rc > 0) {
        stream_open = DrainAvailable(output.read.get(), splitter);
      } else if (rc < 0 && errno != EINTR) {
        stream_open = false;
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollSliceMs));
    }

    if (auto code = TryReap(pid)) {
      if (stream_open) {
        DrainAvailable(output.read.get(), splitter);
      }
      result.exit_code = *code;
      break;
    }
    if (options.cancel && options.cancel->IsCancelled()) {
      result.cancelled = true;
    } else if (deadline && std::chrono::steady_clock::now() >= *deadline) {
      result.timed_out = true;
    }
    if (result.cancelled || result.timed_out) {
      result.exit_code = TerminateAndReap(pid, options.terminate_grace);
      if (stream_open) {
        DrainAvailable(output.read.get(), splitter);
      }
      break;
    }
  }
  splitter.Flush();
  return result;
}

pid_t SpawnDetached(const std::vector<std::string>& argv,
                    const std::filesystem::path& output_file) {
  if (argv.empty()) {
    throw Error{ErrorDomain::Transfer, errors::transfer::kSpawnFailed,
                std::string(errors::msg::kSpawnFailed) + ": empty command"};
  }
  std::error_code ec;
  if (output_file.has_parent_path()) {
    std::filesystem::create_directories(output_file.parent_path(), ec);
  }
  UniqueFd output(::open(output_file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
  if (output.get() < 0) {
    const int saved = errno;
    throw Error{ErrorDomain::IO, errors::io::kLogOpenFailed,
                std::string(errors::msg::kLogOpenFailed) + ": " + PathToUtf8String(output_file),
                saved};
  }
  Pipe report = MakePipe();
  auto raw_argv = MakeArgv(argv);

  const pid_t intermediate = ::fork();
  if (intermediate < 0) {
    ThrowSpawnFailure(argv.front(), errno);
  }
  if (intermediate == 0) {
    ::setsid();
    const pid_t grandchild = ::fork();
    if (grandchild < 0) {
      ::_exit(127);
    }
    if (grandchild > 0) {
      ssize_t ignored = ::write(report.write.get(), &grandchild, sizeof(grandchild));
      (void)ignored;
      ::_exit(0);
    }
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(output.get(), STDOUT_FILENO);
    ::dup2(output.get(), STDERR_FILENO);
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    ::signal(SIGHUP, SIG_IGN);
    ::execvp(raw_argv[0], raw_argv.data());
    const pid_t failure = -static_cast<pid_t>(errno);
    ssize_t ignored = ::write(report.write.get(), &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
  }

  report.write.Reset();
  int status = 0;
  while (::waitpid(intermediate, &status, 0) < 0 && errno == EINTR) {
  }

  // The intermediate child reports the grandchild pid; the grandchild reports
  // a negated errno only when exec fails. Either may arrive first.
  pid_t values[2] = {0, 0};
  std::size_t received = 0;
  while (received < sizeof(values)) {
    const ssize_t rc = ::read(report.read.get(), reinterpret_cast<char*>(values) + received,
                              sizeof(values) - received);
    if (rc > 0) {
      received += static_cast<std::size_t>(rc);
      continue;
    }
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  pid_t detached = 0;
  int exec_errno = 0;
  for (std::size_t i = 0; i < received / sizeof(pid_t); ++i) {
    if (values[i] > 0) {
      detached = values[i];
    } else if (values[i] < 0) {
      exec_errno = -values[i];
    }
  }
  if (exec_errno != 0) {
    ThrowSpawnFailure(argv.front(), exec_errno);
  }
  if (detached <= 0) {
    ThrowSpawnFailure(argv.front(), ECHILD);
  }
  return detached;
}

}  // namespace tsync::orchestrator
