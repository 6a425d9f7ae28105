#include "tsync/orchestrator/transfer_runner.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

#include "tsync/error.h"
#include "tsync/orchestrator/session_log.h"
#include "tsync/orchestrator/subprocess.h"
#include "test_support.h"

namespace {

using namespace std::chrono_literals;
using namespace tsync::orchestrator;
using tsync::routes::RouteEntry;
using tsync_test::Contains;
using tsync_test::Expect;
using tsync_test::ReadFile;
using tsync_test::TempDir;

bool Has(const std::vector<std::string>& argv, std::string_view value) {
  return std::find(argv.begin(), argv.end(), value) != argv.end();
}

void TestBuildArgvRemote() {
  TransferOptions options;
  options.ssh_key = "/keys/id_ed25519";
  options.io_timeout = std::chrono::seconds(120);
  const auto argv =
      options.BuildArgv(RouteEntry{"/data/my photos", "/backup/photos/"}, "backup", "nas");

  Expect(argv.front() == "rsync", "tool first");
  Expect(argv[1] == "-avzP" && argv[2] == "--stats", "flags follow the tool");
  Expect(Has(argv, "--timeout=120"), "io timeout");
  Expect(Has(argv, "--exclude=*.Trash*"), "trash excluded");
  Expect(Has(argv, "--exclude=System Volume Information"), "exclude with spaces is one argument");
  Expect(Has(argv, "--exclude=desktop.ini"), "last exclude");
  Expect(Has(argv, "-e"), "remote shell flag");
  Expect(Has(argv,
             "ssh -i /keys/id_ed25519 -o BatchMode=yes -o ConnectTimeout=10 "
             "-o ServerAliveInterval=60 -o StrictHostKeyChecking=no "
             "-o UserKnownHostsFile=/dev/null"),
         "ssh command line");
  Expect(argv[argv.size() - 2] == "/data/my photos/", "source gets a trailing slash");
  Expect(argv.back() == "backup@nas:/backup/photos/", "slash not doubled on destination");
}

void TestBuildArgvLocal() {
  TransferOptions options;
  options.remote = false;
  options.excludes.clear();
  const auto argv = options.BuildArgv(RouteEntry{"/a", "/b"}, "ignored", "ignored");
  Expect(!Has(argv, "-e"), "no remote shell for local copies");
  Expect(argv.back() == "/b/", "plain destination");
  Expect(argv.size() == 6, "tool, two flags, timeout, source, destination");
}

void TestSubprocessExitCodes() {
  std::vector<std::string> lines;
  SubprocessOptions options;
  options.argv = {"/bin/sh", "-c", "echo first; echo second >&2; printf 'no newline'; exit 3"};
  options.on_line = [&](std::string_view line) { lines.emplace_back(line); };
  const auto result = RunSubprocess(options);
  Expect(result.exit_code == 3, "exit status reported");
  Expect(!result.timed_out && !result.cancelled, "ran to completion");
  Expect(lines.size() == 3, "stdout and stderr merged");
  Expect(lines.back() == "no newline", "unterminated last line flushed");

  lines.clear();
  options.argv = {"/bin/sh", "-c", "printf 'a\\rb\\n'"};
  (void)RunSubprocess(options);
  Expect(lines.size() == 2 && lines[0] == "a" && lines[1] == "b", "carriage returns split lines");
}

void TestSubprocessSpawnFailure() {
  SubprocessOptions options;
  options.argv = {"/nonexistent/tsync-tool"};
  try {
    (void)RunSubprocess(options);
    Expect(false, "exec failure must throw");
  } catch (const tsync::Error& err) {
    Expect(err.domain == tsync::ErrorDomain::Transfer, "transfer domain");
    Expect(err.code == tsync::errors::transfer::kSpawnFailed, "spawn failed code");
  }
}

void TestSubprocessTimeout() {
  SubprocessOptions options;
  options.argv = {"/bin/sh", "-c", "sleep 30"};
  options.timeout = 200ms;
  options.terminate_grace = 500ms;
  const auto started = std::chrono::steady_clock::now();
  const auto result = RunSubprocess(options);
  Expect(result.timed_out, "timeout flagged");
  Expect(result.exit_code == 128 + SIGTERM, "terminated by SIGTERM");
  Expect(std::chrono::steady_clock::now() - started < 10s, "child stopped promptly");
}

void TestSubprocessStreamsWhileRunning() {
  CancellationToken cancel;
  std::atomic<bool> saw_first{false};
  SubprocessOptions options;
  options.argv = {"/bin/sh", "-c", "echo started; sleep 30"};
  options.cancel = cancel;
  options.terminate_grace = 500ms;
  options.on_line = [&](std::string_view line) {
    if (line == "started") {
      saw_first = true;
      cancel.Cancel();
    }
  };
  const auto result = RunSubprocess(options);
  Expect(saw_first.load(), "line delivered before the child exited");
  Expect(result.cancelled, "cancellation flagged");
  Expect(!result.timed_out, "not a timeout");
}

void TestRsyncRunnerOutcomes() {
  TempDir dir("tsync_transfer_");
  SessionLog log(dir.path() / "sync.log", false);
  RsyncTransferRunner runner(log);
  const RouteEntry route{"/src", "/dst"};

  TransferOptions options;
  options.remote = false;
  options.tool = "true";
  auto ok = runner.Run(route, "u", "h", options);
  Expect(ok.status == TransferStatus::kSucceeded && ok.exit_code == 0, "true succeeds");

  options.tool = "false";
  auto failed = runner.Run(route, "u", "h", options);
  Expect(failed.status == TransferStatus::kFailed && failed.exit_code == 1, "false fails with 1");

  options.tool = "tsync-no-such-transfer-tool";
  auto missing = runner.Run(route, "u", "h", options);
  Expect(missing.status == TransferStatus::kFailed, "missing tool fails");
  Expect(missing.exit_code == kTransferSpawnFailedExitCode, "missing tool reports 127");
  Expect(Contains(ReadFile(log.path()), "[ERROR]"), "spawn failure logged");

  options.tool = "echo";
  (void)runner.Run(route, "u", "h", options);
  Expect(Contains(ReadFile(log.path()), "[INFO] -avzP --stats"), "tool output streamed to log");
}

void TestRsyncRunnerInterrupted() {
  TempDir dir("tsync_transfer_");
  SessionLog log(dir.path() / "sync.log", false);
  CancellationToken cancel;
  RsyncTransferRunner runner(log, cancel);
  TransferOptions options;
  options.remote = false;
  options.tool = "/bin/sh";
  options.flags = {"-c", "sleep 30"};
  options.excludes.clear();

  std::thread canceller([&] {
    std::this_thread::sleep_for(200ms);
    cancel.Cancel(SIGINT);
  });
  auto outcome = runner.Run(RouteEntry{"/src", "/dst"}, "u", "h", options);
  canceller.join();
  Expect(outcome.status == TransferStatus::kInterrupted, "cancelled run reported as interrupted");
  Expect(outcome.duration < std::chrono::seconds(20), "child stopped before it finished");
}

}  // namespace

int main() {
  TestBuildArgvRemote();
  TestBuildArgvLocal();
  TestSubprocessExitCodes();
  TestSubprocessSpawnFailure();
  TestSubprocessTimeout();
  TestSubprocessStreamsWhileRunning();
  TestRsyncRunnerOutcomes();
  TestRsyncRunnerInterrupted();
  std::cout << "transfer runner tests ok\n";
  return 0;
}
