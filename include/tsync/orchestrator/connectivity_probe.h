#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "tsync/orchestrator/cancellation.h"
#include "tsync/orchestrator/retry.h"

namespace tsync::orchestrator {

class EventBus;
class SessionLog;

// One reachability attempt against a remote host.
class ReachabilityCheck {
 public:
  virtual ~ReachabilityCheck() = default;

  // Fails fast before any attempt, e.g. when credentials are missing. Throws
  // Error{Connectivity}.
  virtual void Preflight() {}

  // Returns true when the host answered within |timeout|. On failure
  // |diagnostics| may receive whatever the check observed.
  virtual bool Check(const std::string& host, std::chrono::milliseconds timeout,
                     std::string* diagnostics) = 0;

  [[nodiscard]] virtual std::string Describe(const std::string& host) const { return host; }
};

// Runs `ssh ... user@host "echo 'Connection OK'"` in batch mode.
class SshReachabilityCheck final : public ReachabilityCheck {
 public:
  SshReachabilityCheck(std::string user, std::filesystem::path key,
                       std::optional<CancellationToken> cancel = std::nullopt);

  void Preflight() override;
  bool Check(const std::string& host, std::chrono::milliseconds timeout,
             std::string* diagnostics) override;
  std::string Describe(const std::string& host) const override;

 private:
  std::string user_;
  std::filesystem::path key_;
  std::optional<CancellationToken> cancel_;
};

// Plain TCP connect to host:port.
class TcpReachabilityCheck final : public ReachabilityCheck {
 public:
  explicit TcpReachabilityCheck(std::uint16_t port = 22) : port_(port) {}

  bool Check(const std::string& host, std::chrono::milliseconds timeout,
             std::string* diagnostics) override;
  std::string Describe(const std::string& host) const override;

 private:
  std::uint16_t port_;
};

struct ProbeSettings {
  std::uint32_t max_attempts{3};
  std::chrono::milliseconds per_attempt_timeout{std::chrono::seconds(15)};
  std::chrono::milliseconds interval{std::chrono::seconds(10)};
};

class ConnectivityProbe {
 public:
  // |log| and |events| are optional observers. A missing sleeper means
  // interruptible sleeps on |cancel|.
  ConnectivityProbe(ReachabilityCheck& check, SessionLog* log, EventBus* events,
                    CancellationToken cancel, Sleeper sleeper = {});

  // Returns the number of attempts used. Throws Error{Connectivity,
  // kUnreachable} once every attempt failed, or Error{Interrupted} when the
  // token fires between attempts. Never exceeds max_attempts.
  std::uint32_t Probe(const std::string& host, const ProbeSettings& settings);

 private:
  ReachabilityCheck& check_;
  SessionLog* log_;
  EventBus* events_;
  CancellationToken cancel_;
  Sleeper sleeper_;
};

}  // namespace tsync::orchestrator
