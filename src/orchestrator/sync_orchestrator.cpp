#include "tsync/orchestrator/sync_orchestrator.h"

#include <iostream>
#include <optional>
#include <system_error>

#include "tsync/common.h"
#include "tsync/error.h"
#include "tsync/errors.h"
#include "tsync/orchestrator/connectivity_probe.h"
#include "tsync/orchestrator/event_bus.h"
#include "tsync/orchestrator/session_lock.h"
#include "tsync/orchestrator/session_log.h"
#include "tsync/orchestrator/session_markers.h"
#include "tsync/routes/path_validator.h"

namespace tsync::orchestrator {
namespace {

void PublishSessionEvent(EventBus* events, EventSeverity severity, std::string event_id,
                         std::string message, std::vector<EventField> fields = {}) {
  if (!events) {
    return;
  }
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  try {
    events->Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"event_publish_failure\",\"event_id\":\"" << event.event_id
              << "\",\"what\":\"" << ex.what() << "\"}" << std::endl;
  }
}

std::string FormatSeconds(std::chrono::milliseconds duration) {
  return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(duration).count()) + "s";
}

}  // namespace

std::string_view SessionPhaseName(SessionPhase phase) noexcept {
  switch (phase) {
  case SessionPhase::kNotStarted:
    return "NotStarted";
  case SessionPhase::kLockAcquired:
    return "LockAcquired";
  case SessionPhase::kConnectivityVerified:
    return "ConnectivityVerified";
  case SessionPhase::kProcessing:
    return "Processing";
  case SessionPhase::kFinalized:
    return "Finalized";
  }
  return "NotStarted";
}

std::string_view SessionOutcomeName(SessionOutcome outcome) noexcept {
  switch (outcome) {
  case SessionOutcome::kAllSucceeded:
    return "AllSucceeded";
  case SessionOutcome::kPartialFailure:
    return "PartialFailure";
  case SessionOutcome::kAbortedLock:
    return "AbortedLock";
  case SessionOutcome::kAbortedConnectivity:
    return "AbortedConnectivity";
  case SessionOutcome::kAbortedConfig:
    return "AbortedConfig";
  case SessionOutcome::kInterrupted:
    return "Interrupted";
  }
  return "AbortedConfig";
}

std::string_view RouteFailureReasonName(RouteFailureReason reason) noexcept {
  switch (reason) {
  case RouteFailureReason::kValidation:
    return "validation";
  case RouteFailureReason::kSourceMissing:
    return "source_missing";
  case RouteFailureReason::kTransfer:
    return "transfer";
  case RouteFailureReason::kInterrupted:
    return "interrupted";
  }
  return "transfer";
}

int ExitCodeFor(SessionOutcome outcome) noexcept {
  switch (outcome) {
  case SessionOutcome::kAllSucceeded:
    return 0;
  case SessionOutcome::kPartialFailure:
    return 1;
  case SessionOutcome::kAbortedLock:
    return 75;
  case SessionOutcome::kAbortedConnectivity:
    return 69;
  case SessionOutcome::kAbortedConfig:
    return 78;
  case SessionOutcome::kInterrupted:
    return 130;
  }
  return 1;
}

SyncOrchestrator::SyncOrchestrator(config::SessionConfig config, SessionCollaborators collaborators)
    : config_(std::move(config)), deps_(std::move(collaborators)) {
  transfer_options_.tool = config_.transfer_tool;
  transfer_options_.io_timeout = config_.transfer_timeout;
  transfer_options_.ssh_key = config_.ssh_key;
}

void SyncOrchestrator::EnterPhase(SessionPhase phase) {
  phase_ = phase;
  if (phase_observer_) {
    phase_observer_(phase);
  }
}

SessionReport SyncOrchestrator::Run() {
  SessionReport report;
  report.session.started_at = std::chrono::system_clock::now();

  std::optional<routes::RouteTable> table;
  try {
    config_.RequireSessionKeys();
    table.emplace(routes::RouteTable::Load(config_.routes_file));
  } catch (const Error& err) {
    if (err.domain != ErrorDomain::Config) {
      throw;
    }
    deps_.log.Error(std::string("Configuration error: ") + err.what());
    PublishSessionEvent(deps_.events, EventSeverity::kError, "config_error", err.what(),
                        {EventField("code", std::to_string(err.code), FieldPrivacy::kPublic, true)});
    report.outcome = SessionOutcome::kAbortedConfig;
    report.message = err.what();
    return report;
  }

  ScopedSessionLock lock;
  try {
    lock = ScopedSessionLock::Acquire(
        deps_.lock, std::chrono::duration_cast<std::chrono::milliseconds>(config_.lock_timeout),
        [this] { return deps_.cancel.IsCancelled(); });
  } catch (const Error& err) {
    if (err.domain == ErrorDomain::Lock) {
      deps_.log.Error(std::string(markers::kSkippedPrefix) + err.what());
      PublishSessionEvent(deps_.events, EventSeverity::kWarning, "lock_timeout", err.what(),
                          {EventField("lock", deps_.lock.Describe(), FieldPrivacy::kHash)});
      report.outcome = SessionOutcome::kAbortedLock;
    } else if (err.domain == ErrorDomain::Interrupted) {
      deps_.log.Warn(std::string(markers::kSkippedPrefix) + err.what());
      report.outcome = SessionOutcome::kInterrupted;
    } else {
      throw;
    }
    report.message = err.what();
    return report;
  }

  Session& session = report.session;
  session.lock_held = true;
  session.routes_total = table->size();
  EnterPhase(SessionPhase::kLockAcquired);
  deps_.log.Info(markers::kSessionStarted);
  deps_.log.Info("Acquired sync lock: " + deps_.lock.Describe());
  deps_.log.Info("Loaded " + std::to_string(table->size()) + " route(s) from " +
                 PathToUtf8String(config_.routes_file));
  PublishSessionEvent(deps_.events, EventSeverity::kInfo, "session_started", "Sync session started",
                      {EventField("routes", std::to_string(table->size()), FieldPrivacy::kPublic,
                                  true)});

  ConnectivityProbe probe(deps_.reachability, &deps_.log, deps_.events, deps_.cancel,
                          deps_.sleeper);
  ProbeSettings settings;
  settings.max_attempts = config_.probe_max_attempts;
  settings.per_attempt_timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.probe_timeout);
  settings.interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.probe_interval);
  try {
    const auto attempts = probe.Probe(config_.remote_host, settings);
    EnterPhase(SessionPhase::kConnectivityVerified);
    deps_.log.Success("Connectivity verified: " + deps_.reachability.Describe(config_.remote_host));
    PublishSessionEvent(deps_.events, EventSeverity::kInfo, "connectivity_verified",
                        "Remote host reachable",
                        {EventField("attempts", std::to_string(attempts), FieldPrivacy::kPublic,
                                    true)});
  } catch (const Error& err) {
    if (err.domain == ErrorDomain::Connectivity) {
      deps_.log.Error(std::string(markers::kAbortedPrefix) + err.what());
      report.outcome = SessionOutcome::kAbortedConnectivity;
    } else if (err.domain == ErrorDomain::Interrupted) {
      deps_.log.Warn(markers::Interrupted(0, 0));
      report.outcome = SessionOutcome::kInterrupted;
    } else {
      throw;
    }
    report.message = err.what();
    EnterPhase(SessionPhase::kFinalized);
    PublishFinal(report);
    deps_.log.Info("Released sync lock");
    lock.Release();
    return report;
  }

  EnterPhase(SessionPhase::kProcessing);
  bool interrupted = false;
  for (const auto& route : *table) {
    if (deps_.cancel.IsCancelled()) {
      interrupted = true;
      break;
    }
    RouteResult result = ProcessRoute(route);
    if (result.outcome == RouteOutcome::kSucceeded) {
      ++session.success_count;
    } else {
      ++session.failure_count;
    }
    PublishRouteResult(result);
    const bool stop = result.reason == RouteFailureReason::kInterrupted;
    session.route_results.push_back(std::move(result));
    if (stop) {
      interrupted = true;
      break;
    }
  }

  EnterPhase(SessionPhase::kFinalized);
  if (interrupted) {
    deps_.log.Warn(markers::Interrupted(session.success_count, session.failure_count));
    report.outcome = SessionOutcome::kInterrupted;
    report.message = std::string(errors::msg::kInterrupted);
  } else {
    Finalize(report);
  }
  PublishFinal(report);
  // Written while the lock is still held.
  deps_.log.Info("Released sync lock");
  lock.Release();
  return report;
}

RouteResult SyncOrchestrator::ProcessRoute(const routes::RouteEntry& route) {
  const auto started = std::chrono::steady_clock::now();
  auto elapsed = [&started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 started);
  };
  RouteResult result;
  result.route = route;
  deps_.log.Info("Processing route: " + route.source + " -> " + route.destination);

  routes::RouteEntry validated;
  try {
    validated.source = routes::PathValidator::Validate(route.source, routes::PathRole::kSource);
    validated.destination =
        routes::PathValidator::Validate(route.destination, routes::PathRole::kDestination);
  } catch (const Error& err) {
    if (err.domain != ErrorDomain::Validation) {
      throw;
    }
    result.duration = elapsed();
    deps_.log.Error("Path validation failed: " + route.source + " -> " + route.destination + " (" +
                    err.what() + ", duration: " + FormatSeconds(result.duration) + ")");
    result.reason = RouteFailureReason::kValidation;
    result.detail = err.what();
    return result;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(validated.source, ec)) {
    result.duration = elapsed();
    deps_.log.Error("Source directory does not exist: " + validated.source + " -> " +
                    validated.destination + " (duration: " + FormatSeconds(result.duration) + ")");
    result.reason = RouteFailureReason::kSourceMissing;
    result.detail = "Source directory does not exist: " + validated.source;
    return result;
  }

  deps_.log.Info("Syncing " + validated.source + " -> " + config_.remote_user + "@" +
                 config_.remote_host + ":" + validated.destination);
  const auto outcome =
      deps_.transfer.Run(validated, config_.remote_user, config_.remote_host, transfer_options_);
  result.duration = outcome.duration;
  const std::string pair = validated.source + " -> " + validated.destination;
  switch (outcome.status) {
  case TransferStatus::kSucceeded:
    result.outcome = RouteOutcome::kSucceeded;
    deps_.log.Success("Sync completed: " + pair + " (" + FormatSeconds(outcome.duration) + ")");
    break;
  case TransferStatus::kFailed:
    result.reason = RouteFailureReason::kTransfer;
    result.exit_code = outcome.exit_code;
    result.detail = "exit code " + std::to_string(outcome.exit_code);
    deps_.log.Error("Sync failed: " + pair + " (exit code: " + std::to_string(outcome.exit_code) +
                    ", duration: " + FormatSeconds(outcome.duration) + ")");
    break;
  case TransferStatus::kInterrupted:
    result.reason = RouteFailureReason::kInterrupted;
    result.exit_code = outcome.exit_code;
    result.detail = "transfer terminated by signal";
    deps_.log.Warn("Transfer interrupted: " + pair + " (" + FormatSeconds(outcome.duration) + ")");
    break;
  }
  return result;
}

void SyncOrchestrator::Finalize(SessionReport& report) {
  const Session& session = report.session;
  deps_.log.Info(markers::Summary(session.success_count, session.failure_count));
  if (session.failure_count == 0) {
    deps_.log.Success(markers::kAllSucceeded);
    report.outcome = SessionOutcome::kAllSucceeded;
  } else {
    deps_.log.Warn(markers::kSomeFailed);
    report.outcome = SessionOutcome::kPartialFailure;
  }
}

void SyncOrchestrator::PublishRouteResult(const RouteResult& result) {
  std::vector<EventField> fields;
  fields.emplace_back("source", result.route.source, FieldPrivacy::kHash);
  fields.emplace_back("destination", result.route.destination, FieldPrivacy::kHash);
  fields.emplace_back("outcome",
                      result.outcome == RouteOutcome::kSucceeded ? "succeeded" : "failed");
  if (result.reason) {
    fields.emplace_back("reason", std::string(RouteFailureReasonName(*result.reason)));
  }
  if (result.exit_code) {
    fields.emplace_back("exit_code", std::to_string(*result.exit_code), FieldPrivacy::kPublic,
                        true);
  }
  fields.emplace_back("duration_ms", std::to_string(result.duration.count()),
                      FieldPrivacy::kPublic, true);
  PublishSessionEvent(deps_.events,
                      result.outcome == RouteOutcome::kSucceeded ? EventSeverity::kInfo
                                                                 : EventSeverity::kWarning,
                      "route_result", "Route processed", std::move(fields));
}

void SyncOrchestrator::PublishFinal(const SessionReport& report) {
  const Session& session = report.session;
  const bool clean = report.outcome == SessionOutcome::kAllSucceeded;
  PublishSessionEvent(
      deps_.events, clean ? EventSeverity::kInfo : EventSeverity::kWarning, "session_finalized",
      std::string(SessionOutcomeName(report.outcome)),
      {EventField("routes_total", std::to_string(session.routes_total), FieldPrivacy::kPublic, true),
       EventField("success", std::to_string(session.success_count), FieldPrivacy::kPublic, true),
       EventField("failures", std::to_string(session.failure_count), FieldPrivacy::kPublic, true)});
}

}  // namespace tsync::orchestrator
