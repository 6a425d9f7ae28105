#pragma once

#include <sys/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "tsync/config/session_config.h"
#include "tsync/monitor/log_reader.h"
#include "tsync/monitor/status_reporter.h"

namespace tsync::orchestrator {
class EventBus;
class LockResource;
}  // namespace tsync::orchestrator

namespace tsync::monitor {

enum class TriggerResult { kStarted, kAlreadyRunning };

struct TriggerResponse {
  TriggerResult result{TriggerResult::kAlreadyRunning};
  pid_t pid{0};
};

// Operator surface over a session log and its lock: status, logs, trigger,
// clear. Holds no session state of its own.
class MonitorService {
 public:
  // |run_command| is the argv that starts one session, e.g. {"/usr/bin/tsync", "run"}.
  MonitorService(config::SessionConfig config, orchestrator::LockResource& lock,
                 std::vector<std::string> run_command, orchestrator::EventBus* events = nullptr);

  [[nodiscard]] SyncStatus Status();
  [[nodiscard]] std::string StatusJson();
  [[nodiscard]] std::string Logs(std::optional<std::size_t> tail = std::nullopt) const;

  // Never queues: returns kAlreadyRunning when the lock is held, otherwise
  // starts a detached session and returns its pid without waiting for it.
  TriggerResponse Trigger();

  // Truncates the session log and records the clear.
  void ClearLogs();

 private:
  config::SessionConfig config_;
  orchestrator::LockResource& lock_;
  std::vector<std::string> run_command_;
  orchestrator::EventBus* events_;
  StatusReporter reporter_;
};

}  // namespace tsync::monitor
