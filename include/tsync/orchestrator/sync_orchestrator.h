#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tsync/config/session_config.h"
#include "tsync/orchestrator/cancellation.h"
#include "tsync/orchestrator/retry.h"
#include "tsync/orchestrator/transfer_runner.h"
#include "tsync/routes/route_table.h"

namespace tsync::orchestrator {

class EventBus;
class LockResource;
class ReachabilityCheck;
class SessionLog;

enum class SessionPhase {
  kNotStarted,
  kLockAcquired,
  kConnectivityVerified,
  kProcessing,
  kFinalized
};

enum class SessionOutcome {
  kAllSucceeded,
  kPartialFailure,
  kAbortedLock,
  kAbortedConnectivity,
  kAbortedConfig,
  kInterrupted
};

enum class RouteOutcome { kSucceeded, kFailed };

enum class RouteFailureReason { kValidation, kSourceMissing, kTransfer, kInterrupted };

std::string_view SessionPhaseName(SessionPhase phase) noexcept;
std::string_view SessionOutcomeName(SessionOutcome outcome) noexcept;
std::string_view RouteFailureReasonName(RouteFailureReason reason) noexcept;

struct RouteResult {
  routes::RouteEntry route;
  RouteOutcome outcome{RouteOutcome::kFailed};
  std::optional<RouteFailureReason> reason;
  std::optional<int> exit_code;
  std::string detail;
  std::chrono::milliseconds duration{0};
};

struct Session {
  std::chrono::system_clock::time_point started_at{};
  bool lock_held{false};
  std::size_t routes_total{0};
  std::size_t success_count{0};
  std::size_t failure_count{0};
  std::vector<RouteResult> route_results;
};

struct SessionReport {
  SessionOutcome outcome{SessionOutcome::kAbortedConfig};
  Session session;
  // Set for every aborted or interrupted outcome.
  std::string message;
};

// Process exit status for `tsync run`.
int ExitCodeFor(SessionOutcome outcome) noexcept;

// Everything a session talks to. References must outlive Run().
struct SessionCollaborators {
  LockResource& lock;
  ReachabilityCheck& reachability;
  TransferRunner& transfer;
  SessionLog& log;
  EventBus* events{nullptr};
  CancellationToken cancel{};
  // Waits between connectivity attempts; defaults to an interruptible sleep.
  Sleeper sleeper{};
};

// Drives one session: config, lock, connectivity, routes in order, summary.
// A route failure never stops later routes; lock, connectivity and config
// failures end the session before any transfer.
class SyncOrchestrator {
 public:
  SyncOrchestrator(config::SessionConfig config, SessionCollaborators collaborators);

  SessionReport Run();

  [[nodiscard]] SessionPhase phase() const noexcept { return phase_; }

  // Observer for phase transitions.
  void set_phase_observer(std::function<void(SessionPhase)> observer) {
    phase_observer_ = std::move(observer);
  }

  [[nodiscard]] TransferOptions& transfer_options() noexcept { return transfer_options_; }

 private:
  void EnterPhase(SessionPhase phase);
  RouteResult ProcessRoute(const routes::RouteEntry& route);
  void Finalize(SessionReport& report);
  void PublishRouteResult(const RouteResult& result);
  void PublishFinal(const SessionReport& report);

  config::SessionConfig config_;
  SessionCollaborators deps_;
  TransferOptions transfer_options_;
  SessionPhase phase_{SessionPhase::kNotStarted};
  std::function<void(SessionPhase)> phase_observer_;
};

}  // namespace tsync::orchestrator
