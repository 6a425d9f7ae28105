#include "tsync/orchestrator/connectivity_probe.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <system_error>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "tsync/common.h"
#include "tsync/error.h"
#include "tsync/errors.h"
#include "tsync/orchestrator/event_bus.h"
#include "tsync/orchestrator/session_log.h"
#include "tsync/orchestrator/subprocess.h"

namespace tsync::orchestrator {
namespace {

constexpr std::size_t kMaxDiagnosticBytes = 2048;

void AppendDiagnostic(std::string* diagnostics, std::string_view line) {
  if (!diagnostics || diagnostics->size() >= kMaxDiagnosticBytes) {
    return;
  }
  if (!diagnostics->empty()) {
    diagnostics->push_back('\n');
  }
  diagnostics->append(line.substr(0, kMaxDiagnosticBytes - diagnostics->size()));
}

long long WholeSeconds(std::chrono::milliseconds timeout) {
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
  return std::max<long long>(1, seconds);
}

void PublishProbeFailure(EventBus* events, const std::string& target, std::uint32_t attempt,
                         std::uint32_t max_attempts) {
  if (!events) {
    return;
  }
  Event event;
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kWarning;
  event.event_id = "probe_attempt_failed";
  event.message = "Connectivity attempt failed";
  event.fields.emplace_back("target", target, FieldPrivacy::kHash);
  event.fields.emplace_back("attempt", std::to_string(attempt), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("max_attempts", std::to_string(max_attempts), FieldPrivacy::kPublic,
                            true);
  events->Publish(event);
}

}  // namespace

SshReachabilityCheck::SshReachabilityCheck(std::string user, std::filesystem::path key,
                                           std::optional<CancellationToken> cancel)
    : user_(std::move(user)), key_(std::move(key)), cancel_(std::move(cancel)) {}

void SshReachabilityCheck::Preflight() {
  std::error_code ec;
  if (!std::filesystem::exists(key_, ec)) {
    throw Error{ErrorDomain::Connectivity, errors::connectivity::kKeyMissing,
                std::string(errors::msg::kSshKeyMissing) + ": " + PathToUtf8String(key_)};
  }
}

bool SshReachabilityCheck::Check(const std::string& host, std::chrono::milliseconds timeout,
                                 std::string* diagnostics) {
  // ssh's own connect timeout stays below the outer deadline so its error
  // message reaches the log instead of a bare kill.
  const long long total = WholeSeconds(timeout);
  const long long connect = total > 5 ? total - 5 : total;

  SubprocessOptions options;
  options.argv = {"ssh",
                  "-i",
                  PathToUtf8String(key_),
                  "-o",
                  "BatchMode=yes",
                  "-o",
                  "ConnectTimeout=" + std::to_string(connect),
                  "-o",
                  "StrictHostKeyChecking=no",
                  "-o",
                  "UserKnownHostsFile=/dev/null",
                  "-o",
                  "LogLevel=ERROR",
                  Describe(host),
                  "echo 'Connection OK'"};
  options.timeout = timeout;
  options.cancel = cancel_;
  options.terminate_grace = std::chrono::seconds(2);
  options.on_line = [diagnostics](std::string_view line) { AppendDiagnostic(diagnostics, line); };

  try {
    const auto result = RunSubprocess(options);
    if (result.timed_out) {
      AppendDiagnostic(diagnostics, "ssh timed out after " + std::to_string(total) + "s");
    }
    return result.exit_code == 0 && !result.timed_out && !result.cancelled;
  } catch (const Error& err) {
    AppendDiagnostic(diagnostics, err.what());
    return false;
  }
}

std::string SshReachabilityCheck::Describe(const std::string& host) const {
  return user_ + "@" + host;
}

bool TcpReachabilityCheck::Check(const std::string& host, std::chrono::milliseconds timeout,
                                 std::string* diagnostics) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  const std::string service = std::to_string(port_);
  const int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (gai != 0) {
    AppendDiagnostic(diagnostics, std::string("resolve failed: ") + ::gai_strerror(gai));
    return false;
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(results, &::freeaddrinfo);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                            ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    bool connected = false;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      connected = true;
    } else if (errno == EINPROGRESS) {
      while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
          AppendDiagnostic(diagnostics, "connect timed out");
          break;
        }
        struct pollfd pfd {
          fd, POLLOUT, 0
        };
        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0 && errno == EINTR) {
          continue;
        }
        if (rc > 0) {
          int so_error = 0;
          socklen_t len = sizeof(so_error);
          ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
          connected = so_error == 0;
          if (!connected) {
            AppendDiagnostic(diagnostics, std::strerror(so_error));
          }
        }
        break;
      }
    } else {
      AppendDiagnostic(diagnostics, std::strerror(errno));
    }
    ::close(fd);
    if (connected) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
  }
  return false;
}

std::string TcpReachabilityCheck::Describe(const std::string& host) const {
  return host + ":" + std::to_string(port_);
}

ConnectivityProbe::ConnectivityProbe(ReachabilityCheck& check, SessionLog* log, EventBus* events,
                                     CancellationToken cancel, Sleeper sleeper)
    : check_(check),
      log_(log),
      events_(events),
      cancel_(std::move(cancel)),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [token = cancel_](std::chrono::milliseconds duration) {
      return token.SleepFor(duration);
    };
  }
}

std::uint32_t ConnectivityProbe::Probe(const std::string& host, const ProbeSettings& settings) {
  check_.Preflight();
  const std::string target = check_.Describe(host);
  const RetryPolicy policy{settings.max_attempts, settings.interval};
  const std::uint32_t limit = std::max<std::uint32_t>(1, settings.max_attempts);

  auto interrupted = [] {
    return Error{ErrorDomain::Interrupted, errors::interrupted::kSignalled,
                 std::string(errors::msg::kInterrupted) + " during connectivity check"};
  };

  const auto result = RetryWithFixedInterval(
      policy,
      [&](std::uint32_t attempt) {
        if (cancel_.IsCancelled()) {
          throw interrupted();
        }
        if (log_) {
          log_->Info("Testing connection to " + target + " (attempt " + std::to_string(attempt) +
                     "/" + std::to_string(limit) + ")");
        }
        std::string diagnostics;
        if (check_.Check(host, settings.per_attempt_timeout, &diagnostics)) {
          return true;
        }
        if (cancel_.IsCancelled()) {
          throw interrupted();
        }
        if (log_) {
          log_->Warn("Connection attempt " + std::to_string(attempt) + "/" +
                     std::to_string(limit) + " to " + target + " failed");
          if (!diagnostics.empty()) {
            log_->Error(diagnostics);
          }
        }
        return false;
      },
      [&](std::uint32_t attempt) { PublishProbeFailure(events_, target, attempt, limit); },
      sleeper_);

  if (result.succeeded) {
    return result.attempts;
  }
  if (result.stopped || cancel_.IsCancelled()) {
    throw interrupted();
  }
  throw Error{ErrorDomain::Connectivity, errors::connectivity::kUnreachable,
              std::string(errors::msg::kRemoteUnreachable) + " after " +
                  std::to_string(result.attempts) + " attempt(s): " + target,
              std::nullopt, Retryability::kRetryable, {target}};
}

}  // namespace tsync::orchestrator
