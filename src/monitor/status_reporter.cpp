#include "tsync/monitor/status_reporter.h"

#include <charconv>

#include "tsync/orchestrator/session_lock.h"
#include "tsync/orchestrator/session_log.h"
#include "tsync/orchestrator/session_markers.h"

namespace tsync::monitor {
namespace markers = orchestrator::markers;

namespace {

std::optional<std::size_t> ParseCountAfter(std::string_view text, std::string_view label) {
  const auto pos = text.find(label);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  const char* begin = text.data() + pos + label.size();
  const char* end = text.data() + text.size();
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr == begin) {
    return std::nullopt;
  }
  return value;
}

void ApplyCounts(SyncStatus& status, std::string_view message) {
  status.last_success_count = ParseCountAfter(message, "Success: ");
  status.last_failure_count = ParseCountAfter(message, "Failures: ");
}

bool IsClearedMarker(std::string_view message) {
  return message == markers::kLogsCleared || message == markers::kLegacyLogsCleared;
}

// Timestamp of the newest start marker at or before |from|. When the scan
// window begins after the start marker, the oldest visible line stands in.
std::optional<std::string> FindStart(const std::vector<std::string>& lines, std::size_t from) {
  std::optional<std::string> oldest;
  for (std::size_t i = from + 1; i-- > 0;) {
    auto parsed = ParseLogLine(lines[i]);
    if (!parsed) {
      continue;
    }
    if (IsClearedMarker(parsed->message)) {
      return std::nullopt;
    }
    if (parsed->message == markers::kSessionStarted) {
      return std::string(parsed->timestamp);
    }
    oldest = std::string(parsed->timestamp);
  }
  return oldest;
}

}  // namespace

std::string_view SyncStateName(SyncState state) noexcept {
  switch (state) {
  case SyncState::kIdle:
    return "Idle";
  case SyncState::kRunning:
    return "Running";
  case SyncState::kCompletedOk:
    return "CompletedOk";
  case SyncState::kCompletedWithFailures:
    return "CompletedWithFailures";
  case SyncState::kAborted:
    return "Aborted";
  case SyncState::kInterrupted:
    return "Interrupted";
  }
  return "Idle";
}

std::optional<ParsedLogLine> ParseLogLine(std::string_view line) {
  if (line.empty() || line.front() != '[') {
    return std::nullopt;
  }
  const auto ts_end = line.find("] [");
  if (ts_end == std::string_view::npos) {
    return std::nullopt;
  }
  const auto level_begin = ts_end + 3;
  const auto level_end = line.find("] ", level_begin);
  if (level_end == std::string_view::npos) {
    return std::nullopt;
  }
  ParsedLogLine parsed;
  parsed.timestamp = line.substr(1, ts_end - 1);
  parsed.level = line.substr(level_begin, level_end - level_begin);
  parsed.message = line.substr(level_end + 2);
  return parsed;
}

StatusReporter::StatusReporter(std::filesystem::path log_file, orchestrator::LockResource& lock)
    : log_file_(std::move(log_file)), lock_(lock) {}

SyncStatus StatusReporter::Current() {
  const bool lock_held = lock_.IsHeld();
  const auto lines = orchestrator::ReadLastLines(log_file_, 0, kScanWindowBytes);
  return Derive(lines, lock_held);
}

SyncStatus StatusReporter::Derive(const std::vector<std::string>& lines, bool lock_held) {
  SyncStatus status;
  if (lock_held) {
    status.state = SyncState::kRunning;
    if (!lines.empty()) {
      status.last_run_at = FindStart(lines, lines.size() - 1);
    }
    return status;
  }

  for (std::size_t i = lines.size(); i-- > 0;) {
    auto parsed = ParseLogLine(lines[i]);
    if (!parsed) {
      continue;
    }
    const std::string_view message = parsed->message;
    if (IsClearedMarker(message)) {
      return status;
    }
    if (message.starts_with(markers::kSummaryPrefix)) {
      ApplyCounts(status, message);
      status.state = status.last_failure_count.value_or(0) == 0 ? SyncState::kCompletedOk
                                                                : SyncState::kCompletedWithFailures;
    } else if (message.starts_with(markers::kAbortedPrefix)) {
      status.state = SyncState::kAborted;
    } else if (message.starts_with(markers::kInterruptedPrefix)) {
      status.state = SyncState::kInterrupted;
      ApplyCounts(status, message);
    } else if (message == markers::kSessionStarted) {
      // Started but never finished, and nobody holds the lock: the writer died.
      status.state = SyncState::kInterrupted;
      status.last_run_at = std::string(parsed->timestamp);
      return status;
    } else {
      continue;
    }
    status.last_run_at = FindStart(lines, i);
    return status;
  }
  return status;
}

}  // namespace tsync::monitor
