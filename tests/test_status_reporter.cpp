#include "tsync/monitor/status_reporter.h"

#include "tsync/orchestrator/session_lock.h"
#include "test_support.h"

namespace {

using tsync::monitor::ParseLogLine;
using tsync::monitor::StatusReporter;
using tsync::monitor::SyncState;
using tsync_test::Expect;
using tsync_test::TempDir;
using tsync_test::WriteFile;

std::string At(std::string_view time, std::string_view level, std::string_view message) {
  return "[2024-05-01 " + std::string(time) + "] [" + std::string(level) + "] " +
         std::string(message);
}

void TestParseLogLine() {
  auto parsed = ParseLogLine("[2024-05-01 10:00:00] [SUCCESS] Sync completed: /a -> /b (3s)");
  Expect(parsed.has_value(), "well-formed line parses");
  Expect(parsed->timestamp == "2024-05-01 10:00:00", "timestamp");
  Expect(parsed->level == "SUCCESS", "level");
  Expect(parsed->message == "Sync completed: /a -> /b (3s)", "message");
  Expect(!ParseLogLine("sending incremental file list").has_value(), "tool output is not a line");
  Expect(!ParseLogLine("[broken").has_value(), "truncated prefix");
}

void TestIdleWhenEmpty() {
  auto status = StatusReporter::Derive({}, false);
  Expect(status.state == SyncState::kIdle, "empty log is idle");
  Expect(!status.last_run_at && !status.last_success_count, "no fields");

  status = StatusReporter::Derive({At("09:00:00", "INFO", "Sync skipped: lock busy")}, false);
  Expect(status.state == SyncState::kIdle, "skip lines do not count as sessions");
}

void TestCompletedSessions() {
  std::vector<std::string> lines{
      At("10:00:00", "INFO", "Starting sync process..."),
      At("10:00:01", "SUCCESS", "Sync completed: /a -> /b (1s)"),
      At("10:00:02", "INFO", "Sync process completed - Success: 1, Failures: 0"),
      At("10:00:02", "SUCCESS", "All syncs completed successfully"),
  };
  auto status = StatusReporter::Derive(lines, false);
  Expect(status.state == SyncState::kCompletedOk, "clean run");
  Expect(status.last_run_at == "2024-05-01 10:00:00", "start timestamp");
  Expect(status.last_success_count == 1u && status.last_failure_count == 0u, "counts");

  lines.push_back(At("11:00:00", "INFO", "Starting sync process..."));
  lines.push_back(At("11:00:05", "INFO", "Sync process completed - Success: 2, Failures: 3"));
  status = StatusReporter::Derive(lines, false);
  Expect(status.state == SyncState::kCompletedWithFailures, "newest session wins");
  Expect(status.last_run_at == "2024-05-01 11:00:00", "newest start");
  Expect(status.last_success_count == 2u && status.last_failure_count == 3u, "newest counts");
}

void TestAbortedAndInterrupted() {
  auto status = StatusReporter::Derive(
      {At("10:00:00", "INFO", "Starting sync process..."),
       At("10:01:00", "ERROR",
          "Sync aborted: Remote host unreachable after 3 attempt(s): backup@nas")},
      false);
  Expect(status.state == SyncState::kAborted, "aborted session");
  Expect(status.last_run_at == "2024-05-01 10:00:00", "aborted start");
  Expect(!status.last_success_count, "aborted carries no counts");

  status = StatusReporter::Derive(
      {At("10:00:00", "INFO", "Starting sync process..."),
       At("10:00:09", "WARN", "Sync interrupted - Success: 1, Failures: 0")},
      false);
  Expect(status.state == SyncState::kInterrupted, "interrupted session");
  Expect(status.last_success_count == 1u, "interrupted counts");

  status = StatusReporter::Derive(
      {At("10:00:00", "INFO", "Starting sync process..."),
       At("10:00:01", "INFO", "Testing connection to backup@nas (attempt 1/3)")},
      false);
  Expect(status.state == SyncState::kInterrupted, "dangling start without a holder");
  Expect(status.last_run_at == "2024-05-01 10:00:00", "dangling start timestamp");
}

void TestRunningWhileLockHeld() {
  std::vector<std::string> lines{
      At("10:00:00", "INFO", "Sync process completed - Success: 1, Failures: 0"),
      At("12:00:00", "INFO", "Starting sync process..."),
  };
  auto status = StatusReporter::Derive(lines, true);
  Expect(status.state == SyncState::kRunning, "lock held means running");
  Expect(status.last_run_at == "2024-05-01 12:00:00", "current session start");
  Expect(!status.last_success_count, "no counts while running");

  status = StatusReporter::Derive({}, true);
  Expect(status.state == SyncState::kRunning, "running before anything is logged");
}

void TestClearedLogResets() {
  auto status = StatusReporter::Derive(
      {At("10:00:00", "INFO", "Starting sync process..."),
       At("10:00:02", "INFO", "Sync process completed - Success: 1, Failures: 0"),
       At("10:05:00", "INFO", "Logs cleared via web interface")},
      false);
  Expect(status.state == SyncState::kIdle, "legacy cleared note resets");

  status = StatusReporter::Derive(
      {At("10:05:00", "INFO", "Logs cleared via monitoring interface"),
       At("10:06:00", "INFO", "Sync process completed - Success: 4, Failures: 0")},
      false);
  Expect(status.state == SyncState::kCompletedOk, "summary after clear counts");
  Expect(!status.last_run_at, "start was cleared away");
}

void TestStartOutsideScanWindow() {
  TempDir dir("tsync_status_");
  const auto log_file = dir.path() / "sync.log";
  {
    std::ofstream out(log_file, std::ios::binary);
    out << At("10:00:00", "INFO", "Starting sync process...") << "\n";
    out << At("10:00:01", "INFO", "Syncing /data -> backup@nas:/backup") << "\n";
    const std::string progress(200, 'x');
    const std::uintmax_t lines_needed = StatusReporter::kScanWindowBytes / progress.size() + 16;
    for (std::uintmax_t i = 0; i < lines_needed; ++i) {
      out << "[2024-05-01 10:30:00] [INFO] " << progress << "\n";
    }
    out << At("11:00:00", "SUCCESS", "Sync completed: /data -> /backup (3600s)") << "\n";
  }
  tsync::orchestrator::FileLockResource holder(dir.path() / "sync.lock");
  tsync::orchestrator::FileLockResource observer(dir.path() / "sync.lock");
  StatusReporter reporter(log_file, observer);
  {
    auto held =
        tsync::orchestrator::ScopedSessionLock::Acquire(holder, std::chrono::milliseconds(0));
    const auto running = reporter.Current();
    Expect(running.state == SyncState::kRunning, "long session still running");
    Expect(running.last_run_at == "2024-05-01 10:30:00", "oldest visible line while running");
  }

  {
    std::ofstream out(log_file, std::ios::binary | std::ios::app);
    out << At("11:00:01", "INFO", "Sync process completed - Success: 1, Failures: 0") << "\n";
  }
  const auto done = reporter.Current();
  Expect(done.state == SyncState::kCompletedOk, "completed after a long transfer");
  Expect(done.last_run_at.has_value(), "last run kept when the start scrolled out of view");
  Expect(*done.last_run_at <= "2024-05-01 11:00:01", "stand-in precedes the summary");

  auto derived = StatusReporter::Derive(
      {At("10:30:00", "INFO", "progress"),
       At("11:00:01", "WARN", "Sync interrupted - Success: 0, Failures: 1")},
      false);
  Expect(derived.state == SyncState::kInterrupted && derived.last_run_at == "2024-05-01 10:30:00",
         "interrupted marker without a visible start");
}

void TestCurrentReadsLockAndFile() {
  TempDir dir("tsync_status_");
  const auto log_file = dir.path() / "sync.log";
  tsync::orchestrator::FileLockResource observer(dir.path() / "sync.lock");
  StatusReporter reporter(log_file, observer);
  Expect(reporter.Current().state == SyncState::kIdle, "missing log is idle");

  WriteFile(log_file, At("10:00:00", "INFO", "Starting sync process...") + "\n" +
                          At("10:00:03", "INFO", "Sync process completed - Success: 0, Failures: 2") +
                          "\n");
  Expect(reporter.Current().state == SyncState::kCompletedWithFailures, "reads the file");

  tsync::orchestrator::FileLockResource holder(dir.path() / "sync.lock");
  auto held = tsync::orchestrator::ScopedSessionLock::Acquire(holder, std::chrono::milliseconds(0));
  Expect(reporter.Current().state == SyncState::kRunning, "another holder means running");
  held.Release();
  Expect(reporter.Current().state == SyncState::kCompletedWithFailures, "back to the log");
}

}  // namespace

int main() {
  TestParseLogLine();
  TestIdleWhenEmpty();
  TestCompletedSessions();
  TestAbortedAndInterrupted();
  TestRunningWhileLockHeld();
  TestClearedLogResets();
  TestStartOutsideScanWindow();
  TestCurrentReadsLockAndFile();
  std::cout << "status reporter tests ok\n";
  return 0;
}
