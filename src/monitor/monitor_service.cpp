#include "tsync/monitor/monitor_service.h"

#include <chrono>
#include <memory>
#include <sstream>
#include <system_error>

#include <json/json.h>

#include "tsync/common.h"
#include "tsync/orchestrator/event_bus.h"
#include "tsync/orchestrator/session_lock.h"
#include "tsync/orchestrator/session_log.h"
#include "tsync/orchestrator/session_markers.h"
#include "tsync/orchestrator/subprocess.h"

namespace tsync::monitor {
namespace {

void PublishMonitorEvent(orchestrator::EventBus* events, std::string event_id,
                         std::string message, std::vector<orchestrator::EventField> fields = {}) {
  if (!events) {
    return;
  }
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.severity = orchestrator::EventSeverity::kInfo;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  events->Publish(event);
}

Json::Value OptionalCount(const std::optional<std::size_t>& value) {
  if (!value) {
    return Json::Value(Json::nullValue);
  }
  return Json::Value(static_cast<Json::UInt64>(*value));
}

}  // namespace

MonitorService::MonitorService(config::SessionConfig config, orchestrator::LockResource& lock,
                               std::vector<std::string> run_command,
                               orchestrator::EventBus* events)
    : config_(std::move(config)),
      lock_(lock),
      run_command_(std::move(run_command)),
      events_(events),
      reporter_(config_.log_file, lock_) {}

SyncStatus MonitorService::Status() { return reporter_.Current(); }

std::string MonitorService::StatusJson() {
  const SyncStatus status = Status();
  std::error_code ec;
  const bool exists = std::filesystem::is_regular_file(config_.log_file, ec);
  std::uintmax_t size = 0;
  if (exists) {
    size = std::filesystem::file_size(config_.log_file, ec);
    if (ec) {
      size = 0;
    }
  }

  Json::Value root(Json::objectValue);
  root["state"] = std::string(SyncStateName(status.state));
  root["last_run_at"] = status.last_run_at ? Json::Value(*status.last_run_at)
                                           : Json::Value(Json::nullValue);
  root["last_success_count"] = OptionalCount(status.last_success_count);
  root["last_failure_count"] = OptionalCount(status.last_failure_count);
  root["log_exists"] = exists;
  root["log_size_bytes"] = static_cast<Json::UInt64>(size);
  root["timestamp"] = FormatLocalTimestamp(std::chrono::system_clock::now());

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, root);
}

std::string MonitorService::Logs(std::optional<std::size_t> tail) const {
  LogReader reader(config_.log_file);
  return reader.Render(reader.Read(tail));
}

TriggerResponse MonitorService::Trigger() {
  TriggerResponse response;
  if (lock_.IsHeld()) {
    response.result = TriggerResult::kAlreadyRunning;
    return response;
  }
  response.pid = orchestrator::SpawnDetached(run_command_, config_.log_file);
  response.result = TriggerResult::kStarted;
  PublishMonitorEvent(events_, "monitor_trigger", "Sync session started from monitor",
                      {orchestrator::EventField("pid", std::to_string(response.pid),
                                                orchestrator::FieldPrivacy::kPublic, true)});
  return response;
}

void MonitorService::ClearLogs() {
  orchestrator::SessionLog log(config_.log_file, false);
  log.Clear(orchestrator::markers::kLogsCleared);
  PublishMonitorEvent(events_, "logs_cleared", "Session log cleared");
}

}  // namespace tsync::monitor
